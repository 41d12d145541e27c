#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "cfgcat/driver/compute_cache.hpp"
#include "cfgcat/driver/stats.hpp"

using cfgcat::ComputeCache;
using cfgcat::Diagnostic;
using cfgcat::DiagnosticKind;
using cfgcat::Result;

TEST(ComputeCache, ConcurrentRequestersShareOneComputation)
{
  ComputeCache<std::string, int> cache;
  std::atomic<int> runs{0};

  const auto compute = [&runs]() {
    ++runs;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return Result<int>::ok(7);
  };

  constexpr int k_threads = 8;
  std::vector<int> seen(k_threads, 0);
  std::vector<std::thread> threads;
  threads.reserve(k_threads);
  for (int i = 0; i < k_threads; ++i) {
    threads.emplace_back([&, i]() {
      auto outcome = cache.get("site.pp", compute);
      seen[i] = outcome ? outcome.value() : -1;
    });
  }
  for (auto & t : threads) {
    t.join();
  }

  EXPECT_EQ(runs.load(), 1);
  for (const int v : seen) {
    EXPECT_EQ(v, 7);
  }
  EXPECT_EQ(cache.size(), 1U);
  EXPECT_TRUE(cache.contains("site.pp"));
}

TEST(ComputeCache, FailuresAreCachedAndShared)
{
  ComputeCache<std::string, int> cache;
  int runs = 0;
  const auto compute = [&runs]() {
    ++runs;
    return Result<int>::fail(Diagnostic::error(DiagnosticKind::ParseError, "expected '}'"));
  };

  auto first = cache.get("a.pp", compute);
  auto second = cache.get("a.pp", compute);
  ASSERT_FALSE(first);
  ASSERT_FALSE(second);
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(first.error().message, second.error().message);
}

TEST(ComputeCache, ConcurrentRequestersShareOneFailure)
{
  ComputeCache<std::string, int> cache;
  std::atomic<int> runs{0};

  const auto compute = [&runs]() {
    ++runs;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return Result<int>::fail(Diagnostic::error(DiagnosticKind::ParseError, "unexpected '}'"));
  };

  constexpr int k_threads = 8;
  std::vector<std::string> messages(k_threads);
  std::vector<std::thread> threads;
  threads.reserve(k_threads);
  for (int i = 0; i < k_threads; ++i) {
    threads.emplace_back([&, i]() {
      auto outcome = cache.get("broken.pp", compute);
      messages[i] = outcome ? "<ok>" : outcome.error().message;
    });
  }
  for (auto & t : threads) {
    t.join();
  }

  EXPECT_EQ(runs.load(), 1);
  for (const auto & m : messages) {
    EXPECT_EQ(m, "unexpected '}'");
  }
}

TEST(ComputeCache, ExceptionsBecomeComputationErrors)
{
  ComputeCache<std::string, int> cache;
  auto outcome = cache.get("x", []() -> Result<int> { throw std::runtime_error("disk gone"); });
  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().kind, DiagnosticKind::CacheComputationError);
  EXPECT_EQ(outcome.error().message, "cached computation failed: disk gone");
  EXPECT_TRUE(cache.contains("x"));
}

TEST(ComputeCache, DistinctKeysComputeSeparately)
{
  ComputeCache<int, int> cache;
  EXPECT_EQ(cache.get(1, []() { return Result<int>::ok(10); }).value(), 10);
  EXPECT_EQ(cache.get(2, []() { return Result<int>::ok(20); }).value(), 20);
  EXPECT_EQ(cache.get(1, []() { return Result<int>::ok(99); }).value(), 10);
}

// ============================================================================
// Measurements
// ============================================================================

TEST(Measure, RecordsSampleWhateverTheOutcome)
{
  cfgcat::MeasurementStore store;

  const int value = cfgcat::measure(store, "web1", []() { return 3; });
  EXPECT_EQ(value, 3);

  EXPECT_THROW(
    cfgcat::measure(store, "web2", []() -> int { throw std::runtime_error("boom"); }),
    std::runtime_error);

  EXPECT_EQ(store.size(), 2U);
  EXPECT_EQ(store.samples("web1").size(), 1U);
  EXPECT_EQ(store.samples("web2").size(), 1U);
  EXPECT_GE(store.samples("web1")[0].seconds(), 0.0);
}

TEST(Measure, SummaryAggregatesPerKey)
{
  cfgcat::MeasurementStore store;
  const auto t0 = std::chrono::steady_clock::time_point{};
  store.record({"site.pp", t0, t0 + std::chrono::seconds(1)});
  store.record({"site.pp", t0, t0 + std::chrono::seconds(3)});
  store.record({"init.pp", t0, t0 + std::chrono::seconds(2)});

  const auto summary = store.summary();
  ASSERT_EQ(summary.size(), 2U);
  const auto & site = summary.at("site.pp");
  EXPECT_EQ(site.count, 2U);
  EXPECT_DOUBLE_EQ(site.total, 4.0);
  EXPECT_DOUBLE_EQ(site.min, 1.0);
  EXPECT_DOUBLE_EQ(site.max, 3.0);

  const auto keys = store.keys();
  ASSERT_EQ(keys.size(), 2U);
}
