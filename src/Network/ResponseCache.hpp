#ifndef RESPONSE_CACHE_HPP_
#define RESPONSE_CACHE_HPP_

#include <sqlite3.h>

#include <mutex>
#include <optional>
#include <string>

#include "HttpClient.hpp"
#include "result.hpp"

namespace zvukdl {

/**
 * @brief 以请求 URL 为键的持久化响应缓存（SQLite）
 *
 * 条目永不过期：命中时原样返回，不校验新鲜度。需要刷新时删除缓存文件。
 * 单连接加互斥锁，允许多个下载线程并发读写；同一键的并发写入以最后一次为准。
 * Put 返回时数据已经落盘。
 */
class ResponseCache {
 public:
  // path 为 ":memory:" 时只在进程内有效
  explicit ResponseCache(const std::string& path);
  ~ResponseCache();

  ResponseCache(const ResponseCache&) = delete;
  ResponseCache& operator=(const ResponseCache&) = delete;

  std::optional<HttpResponse> Get(const std::string& key);
  utils::Result<void> Put(const std::string& key, const HttpResponse& response);

  size_t Size();

 private:
  void Exec(const char* sql);

  sqlite3* db_ = nullptr;
  std::mutex mutex_;
};

}  // namespace zvukdl

#endif  // RESPONSE_CACHE_HPP_
