#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <string>

#include "Catalog.hpp"
#include "Session.hpp"
#include "fakes.hpp"

using zvukdl::CheckEntitlement;
using zvukdl::Cookie;
using zvukdl::Fetcher;
using zvukdl::LoadSession;
using zvukdl::ParseNetscapeCookies;
using zvukdl::ResponseCache;
using zvukdl::RetryPolicy;
using zvukdl::Session;
using zvukdl::SessionFromCookies;
using zvukdl::test::FakeHttpClient;
using zvukdl::test::TempDir;
using zvukdl::utils::ErrorCode;

namespace {

const std::string kToken = "0123456789abcdef0123456789abcdef";
constexpr const char* kProfileUrl = "https://zvuk.test/api/v2/tiny/profile";

std::string CookieLine(const std::string& domain, const std::string& name,
                       const std::string& value) {
  return domain + "\tTRUE\t/\tTRUE\t1999999999\t" + name + "\t" + value + "\n";
}

Session ValidSession() {
  auto cookies = ParseNetscapeCookies(CookieLine(".zvuk.com", "access_token",
                                                 kToken));
  return SessionFromCookies(cookies, "zvuk.com").value();
}

RetryPolicy NoDelay() {
  RetryPolicy policy;
  policy.delay = std::chrono::milliseconds(0);
  return policy;
}

}  // namespace

TEST(CookieParserTest, ParsesNetscapeLines) {
  const std::string text =
      "# Netscape HTTP Cookie File\n"
      "\n" +
      CookieLine(".zvuk.com", "access_token", kToken) +
      "#HttpOnly_zvuk.com\tFALSE\t/\tTRUE\t0\tsid\tabc\r\n"
      "zvuk.com\tFALSE\t/\tFALSE\t0\tempty\n"
      "broken line without tabs\n";
  auto cookies = ParseNetscapeCookies(text);
  ASSERT_EQ(cookies.size(), 3u);

  EXPECT_EQ(cookies[0].domain, ".zvuk.com");
  EXPECT_EQ(cookies[0].name, "access_token");
  EXPECT_EQ(cookies[0].value, kToken);
  EXPECT_TRUE(cookies[0].secure);
  EXPECT_EQ(cookies[0].expires, 1999999999);

  EXPECT_EQ(cookies[1].domain, "zvuk.com");
  EXPECT_EQ(cookies[1].name, "sid");
  EXPECT_EQ(cookies[1].value, "abc");

  EXPECT_EQ(cookies[2].name, "empty");
  EXPECT_EQ(cookies[2].value, "");
  EXPECT_FALSE(cookies[2].secure);
}

TEST(SessionTest, BuildsHeadersFromToken) {
  Session session = ValidSession();
  EXPECT_EQ(session.authToken, kToken);
  EXPECT_EQ(session.headers.at("x-auth-token"), kToken);
  EXPECT_EQ(session.headers.at("Origin"), "https://zvuk.com");
  EXPECT_EQ(session.cookieHeader, "access_token=" + kToken);

  auto options = session.Options(false);
  EXPECT_FALSE(options.useCache);
  EXPECT_EQ(options.cookie, session.cookieHeader);
  EXPECT_EQ(options.headers, session.headers);
}

TEST(SessionTest, OnlyUsesCookiesForTargetDomain) {
  auto cookies = ParseNetscapeCookies(
      CookieLine(".example.com", "access_token", kToken) +
      CookieLine("notzvuk.com", "access_token", kToken) +
      CookieLine("zvuk.com", "lang", "ru"));
  auto session = SessionFromCookies(cookies, "zvuk.com");
  ASSERT_FALSE(session);
  EXPECT_EQ(session.error().code, ErrorCode::Unauthorized);
}

TEST(SessionTest, RejectsMalformedToken) {
  auto cookies =
      ParseNetscapeCookies(CookieLine("zvuk.com", "access_token", "short"));
  auto session = SessionFromCookies(cookies, "zvuk.com");
  ASSERT_FALSE(session);
  EXPECT_EQ(session.error().code, ErrorCode::Unauthorized);
}

TEST(SessionTest, MissingCookieFile) {
  TempDir dir;
  auto session = LoadSession((dir.path() / "cookies.txt").string(), "zvuk.com");
  ASSERT_FALSE(session);
  EXPECT_EQ(session.error().code, ErrorCode::Unauthorized);
}

TEST(SessionTest, LoadsCookieFile) {
  TempDir dir;
  const std::string path = (dir.path() / "cookies.txt").string();
  {
    std::ofstream out(path);
    out << "# Netscape HTTP Cookie File\n"
        << CookieLine(".zvuk.com", "access_token", kToken);
  }
  auto session = LoadSession(path, "zvuk.com");
  ASSERT_TRUE(session);
  EXPECT_EQ(session.value().authToken, kToken);
}

class EntitlementTest : public ::testing::Test {
 protected:
  EntitlementTest()
      : cache_(":memory:"),
        fetcher_(http_, &cache_, NoDelay()),
        session_(ValidSession()) {}

  FakeHttpClient http_;
  ResponseCache cache_;
  Fetcher fetcher_;
  Session session_;
};

TEST_F(EntitlementTest, ActiveSubscription) {
  http_.Respond(kProfileUrl, 200, R"({"result":{"is_prime":true}})");
  EXPECT_TRUE(CheckEntitlement(fetcher_, session_, kProfileUrl));

  auto requests = http_.Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].headers.at("x-auth-token"), kToken);
  // 校验结果不能被缓存
  EXPECT_EQ(cache_.Size(), 0u);
}

TEST_F(EntitlementTest, InactiveSubscription) {
  http_.Respond(kProfileUrl, 200, R"({"result":{"is_prime":false}})");
  auto result = CheckEntitlement(fetcher_, session_, kProfileUrl);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, ErrorCode::NotEntitled);
}

TEST_F(EntitlementTest, MissingFlagIsNotEntitled) {
  http_.Respond(kProfileUrl, 200, R"({"result":{}})");
  auto result = CheckEntitlement(fetcher_, session_, kProfileUrl);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, ErrorCode::NotEntitled);
}

TEST_F(EntitlementTest, RejectedToken) {
  http_.Respond(kProfileUrl, 401, R"({"error":"unauthorized"})");
  auto result = CheckEntitlement(fetcher_, session_, kProfileUrl);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, ErrorCode::Unauthorized);
  EXPECT_EQ(http_.DownloadCalls(), 0);
}

TEST_F(EntitlementTest, ProfileIsNeverServedFromCache) {
  ASSERT_TRUE(cache_.Put(kProfileUrl, zvukdl::test::MakeResponse(
                                          200, R"({"result":{"is_prime":true}})")));
  http_.Respond(kProfileUrl, 200, R"({"result":{"is_prime":false}})");
  auto result = CheckEntitlement(fetcher_, session_, kProfileUrl);
  ASSERT_FALSE(result);
  EXPECT_EQ(http_.Calls(kProfileUrl), 1);
}

TEST(CatalogProfileTest, ProfileUrlUsesBase) {
  EXPECT_EQ(zvukdl::ProfileUrl("https://zvuk.test"), kProfileUrl);
  EXPECT_EQ(zvukdl::ProfileUrl(zvukdl::kCatalogBaseUrl),
            "https://zvuk.com/api/v2/tiny/profile");
}
