#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "task_runner.hpp"

using zvukdl::utils::Error;
using zvukdl::utils::ErrorCode;
using zvukdl::utils::ParseParallelControl;
using zvukdl::utils::Result;
using zvukdl::utils::RunReport;
using zvukdl::utils::TaskRunner;
using zvukdl::utils::TaskRunnerConfig;

namespace {

// 记录同时运行的 handler 数量的峰值
class ConcurrencyGauge {
 public:
  void Enter() {
    const int now = ++active_;
    int seen = peak_.load();
    while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
    }
  }
  void Leave() { --active_; }
  int Peak() const { return peak_.load(); }

 private:
  std::atomic<int> active_{0};
  std::atomic<int> peak_{0};
};

TaskRunnerConfig ConfigWith(int concurrency) {
  TaskRunnerConfig config;
  config.defaultConcurrency = concurrency;
  return config;
}

}  // namespace

TEST(TaskRunnerTest, RespectsConcurrencyCeiling) {
  for (int c : {1, 2, 3, 5}) {
    for (int n : {0, 1, 7, 20}) {
      TaskRunner runner(ConfigWith(c));
      ConcurrencyGauge gauge;
      std::atomic<int> calls{0};
      std::vector<int> items(n);
      RunReport report = runner.Run("work", items, [&](const int&) {
        gauge.Enter();
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        gauge.Leave();
        return zvukdl::utils::Ok();
      });
      EXPECT_EQ(calls.load(), n) << "c=" << c << " n=" << n;
      EXPECT_EQ(report.total, static_cast<size_t>(n));
      EXPECT_EQ(report.succeeded, static_cast<size_t>(n));
      EXPECT_TRUE(report.ok());
      EXPECT_LE(gauge.Peak(), c) << "c=" << c << " n=" << n;
    }
  }
}

TEST(TaskRunnerTest, UsesAvailableParallelism) {
  TaskRunner runner(ConfigWith(4));
  ConcurrencyGauge gauge;
  std::vector<int> items(8);
  runner.Run("work", items, [&](const int&) {
    gauge.Enter();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    gauge.Leave();
    return zvukdl::utils::Ok();
  });
  EXPECT_GE(gauge.Peak(), 2);
  EXPECT_LE(gauge.Peak(), 4);
}

TEST(TaskRunnerTest, FailuresDoNotStopSiblings) {
  TaskRunner runner(ConfigWith(3));
  std::vector<int> items = {0, 1, 2, 3, 4, 5, 6};
  std::atomic<int> calls{0};
  RunReport report = runner.Run(
      "work", items,
      [&](const int& item) -> Result<void> {
        ++calls;
        if (item == 2) {
          return Error(ErrorCode::FetchFailed, "boom");
        }
        if (item == 5) {
          throw std::runtime_error("thrown");
        }
        return zvukdl::utils::Ok();
      },
      [](const int& item) { return "item " + std::to_string(item); });

  EXPECT_EQ(calls.load(), 7);
  EXPECT_EQ(report.total, 7u);
  EXPECT_EQ(report.succeeded, 5u);
  EXPECT_FALSE(report.ok());
  ASSERT_EQ(report.failures.size(), 2u);
  EXPECT_EQ(report.failures[0].index, 2u);
  EXPECT_EQ(report.failures[0].label, "item 2");
  EXPECT_EQ(report.failures[0].message, "boom");
  EXPECT_EQ(report.failures[1].index, 5u);
  EXPECT_NE(report.failures[1].message.find("thrown"), std::string::npos);
}

TEST(TaskRunnerTest, SingleWorkerRunsInInputOrder) {
  TaskRunner runner(ConfigWith(1));
  std::vector<int> items = {4, 8, 15, 16, 23, 42};
  std::vector<int> seen;
  std::mutex mutex;
  runner.Run("ordered", items, [&](const int& item) {
    std::lock_guard<std::mutex> lock(mutex);
    seen.push_back(item);
    return zvukdl::utils::Ok();
  });
  EXPECT_EQ(seen, items);
}

TEST(TaskRunnerTest, NestedRunsHaveIndependentCeilings) {
  TaskRunnerConfig config;
  config.defaultConcurrency = 2;
  config.overrides["inner"] = 3;
  config.levels = {"outer", "inner"};
  TaskRunner runner(config);
  EXPECT_EQ(runner.ConcurrencyFor("outer"), 2);
  EXPECT_EQ(runner.ConcurrencyFor("inner"), 3);

  ConcurrencyGauge outer_gauge;
  std::mutex peaks_mutex;
  std::vector<int> inner_peaks;
  std::atomic<int> leaves{0};

  std::vector<int> outer(4);
  RunReport report = runner.Run("outer", outer, [&](const int&) {
    outer_gauge.Enter();
    ConcurrencyGauge inner_gauge;
    std::vector<int> inner(6);
    RunReport inner_report = runner.Run("inner", inner, [&](const int&) {
      inner_gauge.Enter();
      ++leaves;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      inner_gauge.Leave();
      return zvukdl::utils::Ok();
    });
    {
      std::lock_guard<std::mutex> lock(peaks_mutex);
      inner_peaks.push_back(inner_gauge.Peak());
    }
    outer_gauge.Leave();
    if (!inner_report.ok()) {
      return Result<void>(Error(ErrorCode::PartialFailure, "inner failed"));
    }
    return zvukdl::utils::Ok();
  });

  EXPECT_TRUE(report.ok());
  EXPECT_EQ(leaves.load(), 24);
  EXPECT_LE(outer_gauge.Peak(), 2);
  ASSERT_EQ(inner_peaks.size(), 4u);
  for (int peak : inner_peaks) {
    EXPECT_LE(peak, 3);
  }
}

// 同名的内层 Run 并发执行时各自拥有完整上限，而不是共享一组槽位
TEST(TaskRunnerTest, ConcurrentInnerRunsDoNotShareCeiling) {
  TaskRunnerConfig config;
  config.defaultConcurrency = 3;
  config.levels = {"outer", "inner"};
  TaskRunner runner(config);

  ConcurrencyGauge all_leaves;
  std::atomic<int> leaves{0};
  std::vector<int> outer(3);
  RunReport report = runner.Run("outer", outer, [&](const int&) {
    ConcurrencyGauge inner_gauge;
    std::vector<int> inner(6);
    runner.Run("inner", inner, [&](const int&) {
      all_leaves.Enter();
      inner_gauge.Enter();
      ++leaves;
      std::this_thread::sleep_for(std::chrono::milliseconds(40));
      inner_gauge.Leave();
      all_leaves.Leave();
      return zvukdl::utils::Ok();
    });
    EXPECT_LE(inner_gauge.Peak(), 3);
    return zvukdl::utils::Ok();
  });

  EXPECT_TRUE(report.ok());
  EXPECT_EQ(leaves.load(), 18);
  EXPECT_GT(all_leaves.Peak(), 3);
  EXPECT_LE(all_leaves.Peak(), 9);
}

TEST(TaskRunnerTest, ThreadBudgetCoversNestedLevels) {
  TaskRunnerConfig config;
  config.defaultConcurrency = 5;
  config.overrides["items"] = 4;
  config.levels = {"links", "releases", "items"};
  TaskRunner runner(config);
  // 5 + 5*5 + 5*5*4
  EXPECT_EQ(runner.ThreadBudget(), 130);

  TaskRunner flat(ConfigWith(7));
  EXPECT_EQ(flat.ThreadBudget(), 7);
}

TEST(TaskRunnerTest, ReportNamesAreUnique) {
  TaskRunner runner(ConfigWith(2));
  std::vector<int> items(1);
  auto noop = [](const int&) { return zvukdl::utils::Ok(); };
  RunReport a = runner.Run("links", items, noop);
  RunReport b = runner.Run("links", items, noop);
  EXPECT_NE(a.name, b.name);
  EXPECT_EQ(a.name.rfind("links_", 0), 0u);
}

TEST(ParallelControlTest, ParsesEntries) {
  auto parsed = ParseParallelControl("links:4,items:8");
  ASSERT_TRUE(parsed);
  EXPECT_EQ(parsed.value().size(), 2u);
  EXPECT_EQ(parsed.value().at("links"), 4);
  EXPECT_EQ(parsed.value().at("items"), 8);

  auto empty = ParseParallelControl("");
  ASSERT_TRUE(empty);
  EXPECT_TRUE(empty.value().empty());
}

TEST(ParallelControlTest, RejectsUnknownLevels) {
  const std::vector<std::string> levels = {"links", "releases", "items"};
  auto ok = ParseParallelControl("releases:2,items:8", levels);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok.value().at("releases"), 2);

  auto bad = ParseParallelControl("links:4,tracks:8", levels);
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
  EXPECT_NE(bad.error().message.find("tracks"), std::string::npos);
}

TEST(ParallelControlTest, RejectsMalformedEntries) {
  for (const std::string bad : {"links", ":3", "links:x", "links:0",
                                "links:-2", "links:4,items"}) {
    auto parsed = ParseParallelControl(bad);
    ASSERT_FALSE(parsed) << bad;
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument) << bad;
  }
}
