#include "Session.hpp"

#include <fstream>
#include <sstream>

#include "json_utils.hpp"
#include "logger.hpp"

namespace zvukdl {

using utils::Error;
using utils::ErrorCode;
using utils::Result;

namespace {

constexpr const char* kTokenCookie = "access_token";
constexpr size_t kTokenLength = 32;
constexpr const char* kHttpOnlyPrefix = "#HttpOnly_";

bool domainMatches(const std::string& cookie_domain,
                   const std::string& domain) {
  std::string d = cookie_domain;
  if (!d.empty() && d.front() == '.') d.erase(0, 1);
  if (d == domain) return true;
  // cookie 域是目标域的父域
  return domain.size() > d.size() &&
         domain.compare(domain.size() - d.size(), d.size(), d) == 0 &&
         domain[domain.size() - d.size() - 1] == '.';
}

}  // namespace

std::vector<Cookie> ParseNetscapeCookies(const std::string& text) {
  std::vector<Cookie> cookies;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.compare(0, std::char_traits<char>::length(kHttpOnlyPrefix),
                     kHttpOnlyPrefix) == 0) {
      line.erase(0, std::char_traits<char>::length(kHttpOnlyPrefix));
    } else if (line.empty() || line[0] == '#') {
      continue;
    }
    std::vector<std::string> fields;
    std::istringstream ls(line);
    std::string field;
    while (std::getline(ls, field, '\t')) fields.push_back(field);
    // 值为空时行尾没有字段
    if (fields.size() == 6) fields.emplace_back();
    if (fields.size() != 7) continue;

    Cookie cookie;
    cookie.domain = fields[0];
    cookie.path = fields[2];
    cookie.secure = fields[3] == "TRUE";
    try {
      cookie.expires = std::stoll(fields[4]);
    } catch (const std::exception&) {
      cookie.expires = 0;
    }
    cookie.name = fields[5];
    cookie.value = fields[6];
    cookies.push_back(std::move(cookie));
  }
  return cookies;
}

FetchOptions Session::Options(bool use_cache) const {
  FetchOptions options;
  options.headers = headers;
  options.cookie = cookieHeader;
  options.useCache = use_cache;
  return options;
}

Result<Session> SessionFromCookies(const std::vector<Cookie>& cookies,
                                   const std::string& domain) {
  Session session;
  for (const auto& cookie : cookies) {
    if (!domainMatches(cookie.domain, domain)) continue;
    if (cookie.name == kTokenCookie && session.authToken.empty()) {
      session.authToken = cookie.value;
    }
    if (!session.cookieHeader.empty()) session.cookieHeader += "; ";
    session.cookieHeader += cookie.name + "=" + cookie.value;
  }
  if (session.cookieHeader.empty()) {
    return Error(ErrorCode::Unauthorized, "no cookies for " + domain);
  }
  if (session.authToken.size() != kTokenLength) {
    return Error(ErrorCode::Unauthorized,
                 "cannot extract auth token from cookies (" +
                     std::string(kTokenCookie) +
                     "); cookies may be outdated");
  }
  const std::string origin = "https://" + domain;
  session.headers = {
      {"x-auth-token", session.authToken},
      {"User-Agent",
       "Mozilla/5.0 (X11; Linux x86_64; rv:141.0) Gecko/20100101 "
       "Firefox/141.0"},
      {"Accept", "application/json"},
      {"Origin", origin},
      {"Referer", origin + "/"},
  };
  return session;
}

Result<Session> LoadSession(const std::string& cookie_file,
                            const std::string& domain) {
  std::ifstream in(cookie_file);
  if (!in) {
    return Error(ErrorCode::Unauthorized,
                 "cookie file not found: " + cookie_file);
  }
  std::ostringstream content;
  content << in.rdbuf();
  std::vector<Cookie> cookies = ParseNetscapeCookies(content.str());
  if (cookies.empty()) {
    return Error(ErrorCode::Unauthorized,
                 "cookie file has no cookies: " + cookie_file);
  }
  LOG(DEBUG) << "Loaded " << cookies.size() << " cookies from "
             << cookie_file;
  return SessionFromCookies(cookies, domain);
}

Result<void> CheckEntitlement(Fetcher& fetcher, const Session& session,
                              const std::string& profile_url) {
  auto response = fetcher.Fetch(profile_url, session.Options(false));
  if (!response) {
    return Error(ErrorCode::Unauthorized,
                 "profile request failed: " + response.error().message);
  }
  auto root = utils::ParseJson(response.value().body);
  if (!root) {
    return Error(ErrorCode::Unauthorized, root.error().message);
  }
  auto result = utils::JsonPath(root.value(), {"result"});
  if (!result) {
    return Error(ErrorCode::Unauthorized,
                 "unexpected profile response: " + result.error().message);
  }
  const Json::Value& is_prime = result.value()["is_prime"];
  if (!is_prime.isBool() || !is_prime.asBool()) {
    return Error(ErrorCode::NotEntitled,
                 "account has no active subscription (is_prime = false)");
  }
  LOG(INFO) << "Token valid, subscription active.";
  return utils::Ok();
}

}  // namespace zvukdl
