#include "Fetcher.hpp"

#include <filesystem>
#include <system_error>
#include <thread>

#include "logger.hpp"

namespace zvukdl {

using utils::Error;
using utils::ErrorCode;
using utils::Result;

namespace {

HttpRequest makeRequest(const std::string& url, const FetchOptions& options) {
  HttpRequest request;
  request.url = url;
  request.headers = options.headers;
  request.cookie = options.cookie;
  request.post = options.post;
  request.body = options.body;
  return request;
}

std::string statusError(long status) {
  return "HTTP status " + std::to_string(status);
}

}  // namespace

Fetcher::Fetcher(HttpClient& client, ResponseCache* cache,
                 const RetryPolicy& policy)
    : client_(client), cache_(cache), policy_(policy) {
  if (policy_.attempts < 1) policy_.attempts = 1;
}

std::string Fetcher::CacheKey(const std::string& url,
                              const FetchOptions& options) {
  // GraphQL 等 POST 请求共用一个 URL，键里带上请求体
  return options.post ? url + "\n" + options.body : url;
}

void Fetcher::Backoff(const std::string& url, int attempt,
                      const std::string& error) const {
  LOG(WARN) << "Request failed (" << attempt << "/" << policy_.attempts
            << ") " << url << ": " << error;
  if (attempt < policy_.attempts && policy_.delay.count() > 0) {
    std::this_thread::sleep_for(policy_.delay);
  }
}

Result<HttpResponse> Fetcher::Fetch(const std::string& url,
                                    const FetchOptions& options) {
  const bool cached = options.useCache && cache_ != nullptr;
  const std::string key = CacheKey(url, options);
  if (cached) {
    if (auto hit = cache_->Get(key)) {
      LOG(DEBUG) << "Cache hit: " << url;
      return std::move(*hit);
    }
  }

  const HttpRequest request = makeRequest(url, options);
  std::string last_error;
  for (int attempt = 1; attempt <= policy_.attempts; ++attempt) {
    Result<HttpResponse> response = client_.Perform(request);
    if (!response) {
      last_error = response.error().message;
    } else if (!response.value().ok()) {
      last_error = statusError(response.value().status);
    } else {
      if (cached) {
        auto stored = cache_->Put(key, response.value());
        if (!stored) {
          LOG(WARN) << "Failed to cache " << url << ": "
                    << stored.error().message;
        }
      }
      return response;
    }
    Backoff(url, attempt, last_error);
  }
  return Error(ErrorCode::FetchFailed,
               "failed to fetch " + url + ": " + last_error);
}

Result<void> Fetcher::FetchToFile(const std::string& url,
                                  const std::string& path,
                                  const FetchOptions& options) {
  const std::string part_path = path + ".part";
  const HttpRequest request = makeRequest(url, options);
  std::string last_error;
  for (int attempt = 1; attempt <= policy_.attempts; ++attempt) {
    Result<long> status = client_.Download(request, part_path);
    if (status && status.value() >= 200 && status.value() < 300) {
      std::error_code ec;
      std::filesystem::rename(part_path, path, ec);
      if (ec) {
        std::filesystem::remove(part_path, ec);
        return Error(ErrorCode::WriteError,
                     "cannot move " + part_path + " to " + path);
      }
      return utils::Ok();
    }
    std::error_code ec;
    std::filesystem::remove(part_path, ec);
    if (!status && status.error() == ErrorCode::WriteError) {
      // 本地写失败，重试没有意义
      return status.error();
    }
    last_error = status ? statusError(status.value()) : status.error().message;
    Backoff(url, attempt, last_error);
  }
  return Error(ErrorCode::FetchFailed,
               "failed to download " + url + ": " + last_error);
}

}  // namespace zvukdl
