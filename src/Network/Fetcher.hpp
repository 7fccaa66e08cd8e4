#ifndef FETCHER_HPP_
#define FETCHER_HPP_

#include <chrono>
#include <map>
#include <string>

#include "HttpClient.hpp"
#include "ResponseCache.hpp"
#include "result.hpp"

namespace zvukdl {

struct RetryPolicy {
  int attempts = 3;
  std::chrono::milliseconds delay{2000};
};

struct FetchOptions {
  std::map<std::string, std::string> headers;
  std::string cookie;
  bool post = false;
  std::string body;
  // 为 false 时既不读也不写缓存（权限校验、短期有效的流地址）
  bool useCache = true;
};

/**
 * @brief 带缓存和重试的 HTTP 获取
 *
 * 先查缓存，命中直接返回；未命中时最多尝试 attempts 次，每次失败后等待
 * delay。成功（2xx）的响应写入缓存后才返回。全部失败时返回 FetchFailed，
 * 消息中带 URL 和最后一次错误。
 */
class Fetcher {
 public:
  Fetcher(HttpClient& client, ResponseCache* cache,
          const RetryPolicy& policy = RetryPolicy());

  utils::Result<HttpResponse> Fetch(const std::string& url,
                                    const FetchOptions& options);

  // 媒体流：不经过缓存，先写 path.part，成功后重命名为 path
  utils::Result<void> FetchToFile(const std::string& url,
                                  const std::string& path,
                                  const FetchOptions& options = FetchOptions());

  static std::string CacheKey(const std::string& url,
                              const FetchOptions& options);

 private:
  void Backoff(const std::string& url, int attempt,
               const std::string& error) const;

  HttpClient& client_;
  ResponseCache* cache_;
  RetryPolicy policy_;
};

}  // namespace zvukdl

#endif  // FETCHER_HPP_
