#include "Application.hpp"

#include <memory>

#include "Downloader.hpp"
#include "ResponseCache.hpp"
#include "Session.hpp"
#include "logger.hpp"

namespace zvukdl {

namespace {

// --check_auth 时只打印结果并返回 0
int reportAuthFailure(const utils::Error& error, bool check_auth_only,
                      std::ostream& out) {
  if (check_auth_only) {
    out << "[ERROR] " << error.message << std::endl;
    return 0;
  }
  LOG(FATAL) << "Credential check failed: " << error.message;
  return 1;
}

}  // namespace

int RunApplication(HttpClient& http, TagWriter& tagger,
                   const ApplicationOptions& options,
                   const std::vector<std::string>& links, std::ostream& out) {
  // 凭据错误是唯一的致命错误，必须在任何下载之前检查
  auto session = LoadSession(options.cookieFile, kCatalogDomain);
  if (!session) {
    return reportAuthFailure(session.error(), options.checkAuthOnly, out);
  }
  Fetcher auth_fetcher(http, nullptr, options.retry);
  auto auth = CheckEntitlement(auth_fetcher, session.value(),
                               ProfileUrl(options.baseUrl));
  if (!auth) {
    return reportAuthFailure(auth.error(), options.checkAuthOnly, out);
  }
  if (options.checkAuthOnly) {
    out << "[OK] Authentication succeeded. Subscription active." << std::endl;
    return 0;
  }

  std::unique_ptr<ResponseCache> cache;
  if (!options.cacheFile.empty()) {
    cache = std::make_unique<ResponseCache>(options.cacheFile);
  }
  Fetcher fetcher(http, cache.get(), options.retry);
  Catalog catalog(fetcher, session.value(), options.baseUrl);
  utils::TaskRunner runner(options.runner);
  Downloader downloader(options.download, catalog, fetcher, tagger, runner);
  DownloadSummary summary = downloader.DownloadAll(links);
  return summary.ok() ? 0 : 1;
}

}  // namespace zvukdl
