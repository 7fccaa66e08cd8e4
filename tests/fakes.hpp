#ifndef TESTS_FAKES_HPP_
#define TESTS_FAKES_HPP_

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "HttpClient.hpp"
#include "Tagger.hpp"
#include "json_utils.hpp"
#include "result.hpp"

namespace zvukdl::test {

inline HttpResponse MakeResponse(long status, std::string body) {
  HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.headers["content-type"] = "application/json";
  return response;
}

/**
 * 进程内 HTTP 假实现：GET 按完整 URL 匹配，GraphQL POST 按
 * "graphql:<operationName>:<id>" 匹配。未配置的地址返回 404。
 */
class FakeHttpClient : public HttpClient {
 public:
  // 固定响应，每次请求都返回
  void Respond(const std::string& key, long status, std::string body) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[key].clear();
    responses_[key].push_back(MakeResponse(status, std::move(body)));
  }

  // 依次返回，最后一个保持
  void RespondSequence(const std::string& key,
                       std::vector<utils::Result<HttpResponse>> sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& queue = responses_[key];
    queue.clear();
    for (auto& item : sequence) queue.push_back(std::move(item));
  }

  void Stream(const std::string& url, std::string bytes, long status = 200) {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_[url] = std::make_pair(status, std::move(bytes));
  }

  void SetDownloadDelay(std::chrono::milliseconds delay) {
    download_delay_ = delay;
  }

  int Calls(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(key);
    return it == calls_.end() ? 0 : it->second;
  }

  int TotalPerformCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int total = 0;
    for (const auto& kv : calls_) total += kv.second;
    return total;
  }

  int DownloadCalls() const { return downloads_.load(); }
  int MaxConcurrentDownloads() const { return max_active_.load(); }

  std::vector<HttpRequest> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::vector<HttpRequest> DownloadRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return download_requests_;
  }

  static std::string GraphQLKey(const std::string& operation,
                                const std::string& id) {
    return "graphql:" + operation + ":" + id;
  }

  utils::Result<HttpResponse> Perform(const HttpRequest& request) override {
    const std::string key = KeyFor(request);
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[key];
    requests_.push_back(request);
    auto it = responses_.find(key);
    if (it == responses_.end() || it->second.empty()) {
      return MakeResponse(404, "{}");
    }
    auto& queue = it->second;
    if (queue.size() > 1) {
      utils::Result<HttpResponse> front = std::move(queue.front());
      queue.pop_front();
      return front;
    }
    return queue.front();
  }

  utils::Result<long> Download(const HttpRequest& request,
                               const std::string& path) override {
    std::pair<long, std::string> stream(404, "");
    {
      std::lock_guard<std::mutex> lock(mutex_);
      download_requests_.push_back(request);
      auto it = streams_.find(request.url);
      if (it != streams_.end()) stream = it->second;
    }
    ++downloads_;
    const int active = ++active_;
    int seen = max_active_.load();
    while (active > seen && !max_active_.compare_exchange_weak(seen, active)) {
    }
    std::this_thread::sleep_for(download_delay_);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (stream.first >= 200 && stream.first < 300) {
      out << stream.second;
    }
    out.close();
    --active_;
    return stream.first;
  }

 private:
  std::string KeyFor(const HttpRequest& request) const {
    if (!request.post) return request.url;
    auto payload = utils::ParseJson(request.body);
    if (!payload) return request.url;
    const Json::Value& root = payload.value();
    return GraphQLKey(root["operationName"].asString(),
                      utils::JsonId(root["variables"]["id"]));
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::deque<utils::Result<HttpResponse>>> responses_;
  std::map<std::string, std::pair<long, std::string>> streams_;
  std::map<std::string, int> calls_;
  std::vector<HttpRequest> requests_;
  std::vector<HttpRequest> download_requests_;
  std::atomic<int> downloads_{0};
  std::atomic<int> active_{0};
  std::atomic<int> max_active_{0};
  std::chrono::milliseconds download_delay_{5};
};

class RecordingTagWriter : public TagWriter {
 public:
  utils::Result<void> Apply(const std::string& path,
                            const TrackTags& tags) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!std::filesystem::exists(path)) {
      return utils::Error(utils::ErrorCode::TaggingError, "missing " + path);
    }
    applied_[path] = tags;
    return utils::Ok();
  }

  std::map<std::string, TrackTags> Applied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return applied_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, TrackTags> applied_;
};

// 测试结束时删除的临时目录
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("zvukdl_test_" + std::to_string(rd()) + "_" +
             std::to_string(std::chrono::steady_clock::now()
                                .time_since_epoch()
                                .count()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

}  // namespace zvukdl::test

#endif  // TESTS_FAKES_HPP_
