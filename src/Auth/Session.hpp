#ifndef SESSION_HPP_
#define SESSION_HPP_

#include <map>
#include <string>
#include <vector>

#include "Fetcher.hpp"
#include "result.hpp"

namespace zvukdl {

struct Cookie {
  std::string domain;
  std::string path;
  bool secure = false;
  long long expires = 0;
  std::string name;
  std::string value;
};

// 解析 Netscape 格式的 cookies.txt 内容
std::vector<Cookie> ParseNetscapeCookies(const std::string& text);

/**
 * @brief 启动时构造一次、之后只读的会话凭据
 */
struct Session {
  std::string authToken;
  std::map<std::string, std::string> headers;
  std::string cookieHeader;  // 目标域名下的 "name=value; ..."

  // 带会话头和 Cookie 的请求选项
  FetchOptions Options(bool use_cache = true) const;
};

utils::Result<Session> SessionFromCookies(const std::vector<Cookie>& cookies,
                                          const std::string& domain);

utils::Result<Session> LoadSession(const std::string& cookie_file,
                                   const std::string& domain);

// 通过用户资料接口确认订阅有效（不走缓存）
utils::Result<void> CheckEntitlement(Fetcher& fetcher, const Session& session,
                                     const std::string& profile_url);

}  // namespace zvukdl

#endif  // SESSION_HPP_
