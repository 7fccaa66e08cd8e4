#ifndef APPLICATION_HPP_
#define APPLICATION_HPP_

#include <ostream>
#include <string>
#include <vector>

#include "Catalog.hpp"
#include "DownloadConfig.hpp"
#include "Fetcher.hpp"
#include "HttpClient.hpp"
#include "Tagger.hpp"
#include "task_runner.hpp"

namespace zvukdl {

struct ApplicationOptions {
  std::string cookieFile = "cookies.txt";
  std::string cacheFile = "api_cache.db";  // 空串表示不使用缓存
  bool checkAuthOnly = false;
  std::string baseUrl = kCatalogBaseUrl;
  RetryPolicy retry;
  DownloadConfig download;
  utils::TaskRunnerConfig runner;
};

/**
 * @brief 一次完整运行，返回进程退出码
 *
 * 顺序固定：读取凭据 -> 校验订阅 ->（--check_auth 到此结束）-> 打开缓存 ->
 * 下载。凭据或订阅失败时不会发出任何下载请求。检查结果的 [OK] / [ERROR]
 * 提示写到 out。
 */
int RunApplication(HttpClient& http, TagWriter& tagger,
                   const ApplicationOptions& options,
                   const std::vector<std::string>& links, std::ostream& out);

}  // namespace zvukdl

#endif  // APPLICATION_HPP_
