#include "task_runner.hpp"

#include <tbb/info.h>

#include <algorithm>
#include <sstream>

namespace zvukdl::utils {

namespace {
bool isKnown(const std::vector<std::string>& known, const std::string& name) {
  return std::find(known.begin(), known.end(), name) != known.end();
}
}  // namespace

Result<std::map<std::string, int>> ParseParallelControl(
    const std::string& cfg, const std::vector<std::string>& known) {
  std::map<std::string, int> defines;
  // 格式如 "links:4,items:8"
  std::istringstream ss(cfg);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty()) continue;
    auto pos = item.find(':');
    if (pos == std::string::npos || pos == 0) {
      return Error(ErrorCode::InvalidArgument,
                   "bad parallel control entry '" + item + "'");
    }
    std::string name = item.substr(0, pos);
    if (!known.empty() && !isKnown(known, name)) {
      return Error(ErrorCode::InvalidArgument,
                   "unknown parallel level '" + name + "'");
    }
    int val = 0;
    try {
      val = std::stoi(item.substr(pos + 1));
    } catch (const std::exception&) {
      return Error(ErrorCode::InvalidArgument,
                   "bad concurrency in entry '" + item + "'");
    }
    if (val < 1) {
      return Error(ErrorCode::InvalidArgument,
                   "concurrency must be >= 1 in entry '" + item + "'");
    }
    defines[name] = val;
  }
  return defines;
}

TaskRunner::TaskRunner(const TaskRunnerConfig& config) : config_(config) {
  if (config_.defaultConcurrency < 1) {
    config_.defaultConcurrency = 1;
  }
  if (!config_.levels.empty()) {
    for (const auto& kv : config_.overrides) {
      if (!isKnown(config_.levels, kv.first)) {
        LOG(WARN) << "[TaskRunner] override for unknown level '" << kv.first
                  << "' has no effect";
      }
    }
  }
  // 下载任务以阻塞 I/O 为主，线程数不能受限于 CPU 核数
  const int wanted = std::max(ThreadBudget(), tbb::info::default_concurrency());
  parallelism_ = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      static_cast<size_t>(wanted));
  LOG(DEBUG) << "[TaskRunner] default concurrency "
             << config_.defaultConcurrency << ", thread budget " << wanted;
}

int TaskRunner::ConcurrencyFor(const std::string& arena_name) const {
  auto it = config_.overrides.find(arena_name);
  if (it != config_.overrides.end() && it->second > 0) {
    return it->second;
  }
  return config_.defaultConcurrency;
}

// 外层每个 worker 都可能同时跑一次满载的内层 Run：
// links + links*releases + links*releases*items
int TaskRunner::ThreadBudget() const {
  if (config_.levels.empty()) {
    return config_.defaultConcurrency;
  }
  long long width = 1;
  long long total = 0;
  for (const auto& level : config_.levels) {
    width *= ConcurrencyFor(level);
    total += width;
  }
  constexpr long long kMaxThreads = 4096;
  return static_cast<int>(std::min(total, kMaxThreads));
}

uint64_t TaskRunner::GenerateUniqueTaskId() {
  return next_task_id_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace zvukdl::utils
