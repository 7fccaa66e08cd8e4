#ifndef TASK_RUNNER_HPP_
#define TASK_RUNNER_HPP_

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "result.hpp"

namespace zvukdl::utils {

struct TaskFailure {
  size_t index;
  std::string label;
  std::string message;
};

/**
 * @brief 一次 Run 的汇总：成功数与逐项失败原因
 */
struct RunReport {
  std::string name;
  size_t total = 0;
  size_t succeeded = 0;
  std::vector<TaskFailure> failures;

  bool ok() const { return failures.empty() && succeeded == total; }
};

struct TaskRunnerConfig {
  int defaultConcurrency = 5;
  // arena 名称 -> 并发上限，覆盖 defaultConcurrency
  std::map<std::string, int> overrides;
  // 嵌套层级名称，由外到内；用于计算线程总预算
  std::vector<std::string> levels;
};

// 解析 "links:4,items:8" 格式的并发控制字符串。known 非空时，
// 不在其中的名称返回 InvalidArgument
Result<std::map<std::string, int>> ParseParallelControl(
    const std::string& cfg, const std::vector<std::string>& known = {});

/**
 * @brief 有界并发任务执行器
 *
 * arena 名称决定并发上限。每次 Run 使用自己的 tbb::task_arena，按输入顺序
 * 派发任务，同时最多执行 min(上限, 任务数) 个 handler，全部完成后才返回。
 * handler 可以在内部再次调用 Run，内层每次调用各自拥有完整的上限。
 */
class TaskRunner {
 public:
  explicit TaskRunner(const TaskRunnerConfig& config);

  TaskRunner(const TaskRunner&) = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;

  int ConcurrencyFor(const std::string& arena_name) const;

  // handler: (const Item&) -> Result<void>
  // label:   (const Item&) -> std::string，用于失败日志
  template <typename Item, typename Func, typename Label>
  RunReport Run(const std::string& arena_name, const std::vector<Item>& items,
                const Func& handler, const Label& label);

  template <typename Item, typename Func>
  RunReport Run(const std::string& arena_name, const std::vector<Item>& items,
                const Func& handler) {
    return Run(arena_name, items, handler,
               [](const Item&) { return std::string(); });
  }

  // 所有层级同时满载时需要的线程数
  int ThreadBudget() const;

 private:
  uint64_t GenerateUniqueTaskId();

  TaskRunnerConfig config_;
  std::unique_ptr<tbb::global_control> parallelism_;
  std::atomic<uint64_t> next_task_id_{0};
};

// 模板实现
template <typename Item, typename Func, typename Label>
RunReport TaskRunner::Run(const std::string& arena_name,
                          const std::vector<Item>& items, const Func& handler,
                          const Label& label) {
  RunReport report;
  report.total = items.size();
  const std::string unique_task_name =
      arena_name + "_" + std::to_string(GenerateUniqueTaskId());
  report.name = unique_task_name;
  if (items.empty()) {
    return report;
  }

  const int concurrency = ConcurrencyFor(arena_name);
  const int workers =
      static_cast<int>(std::min<size_t>(concurrency, items.size()));
  // 每次调用独立的 arena，并发的同名 Run 互不占用对方的槽位
  tbb::task_arena arena(workers);

  LOG(DEBUG) << "[TaskRunner] Run start: " << unique_task_name << " items="
             << items.size() << " workers=" << workers;

  std::atomic<size_t> next_index{0};
  std::atomic<size_t> succeeded{0};
  std::mutex failures_mutex;

  auto record_failure = [&](size_t index, const std::string& message) {
    std::string item_label = label(items[index]);
    LOG(ERROR) << "[TaskRunner] " << unique_task_name << " item #" << index
               << (item_label.empty() ? "" : " (" + item_label + ")")
               << " failed: " << message;
    std::lock_guard<std::mutex> lock(failures_mutex);
    report.failures.push_back(TaskFailure{index, item_label, message});
  };

  // 每个 worker 从共享游标按输入顺序取下一个任务
  auto drain = [&](int) {
    for (;;) {
      const size_t index = next_index.fetch_add(1);
      if (index >= items.size()) {
        break;
      }
      try {
        Result<void> result = handler(items[index]);
        if (result) {
          succeeded.fetch_add(1);
        } else {
          record_failure(index, result.error().message);
        }
      } catch (const std::exception& e) {
        record_failure(index, std::string("exception: ") + e.what());
      }
    }
  };

  arena.execute([&]() {
    tbb::parallel_for(
        tbb::blocked_range<int>(0, workers, 1),
        [&](const tbb::blocked_range<int>& range) {
          for (int w = range.begin(); w < range.end(); ++w) {
            drain(w);
          }
        },
        tbb::simple_partitioner());
  });

  report.succeeded = succeeded.load();
  std::sort(report.failures.begin(), report.failures.end(),
            [](const TaskFailure& a, const TaskFailure& b) {
              return a.index < b.index;
            });
  LOG(DEBUG) << "[TaskRunner] Run end: " << unique_task_name << " ok="
             << report.succeeded << " failed=" << report.failures.size();
  return report;
}

}  // namespace zvukdl::utils

#endif  // TASK_RUNNER_HPP_
