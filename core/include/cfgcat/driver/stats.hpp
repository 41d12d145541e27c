// cfgcat/driver/stats.hpp - Timing samples per unit of work
#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cfgcat
{

struct Measurement
{
  std::string key;
  std::chrono::steady_clock::time_point start;
  std::chrono::steady_clock::time_point end;

  [[nodiscard]] double seconds() const
  {
    return std::chrono::duration<double>(end - start).count();
  }
};

struct MeasurementSummary
{
  std::size_t count = 0;
  double total = 0.0;  ///< seconds
  double min = 0.0;
  double max = 0.0;
};

/**
 * Append-only sample store for one category (parsing, catalog, templates).
 * Safe for concurrent appends.
 */
class MeasurementStore
{
public:
  void record(Measurement sample);

  [[nodiscard]] std::vector<Measurement> samples(std::string_view key) const;
  [[nodiscard]] std::map<std::string, MeasurementSummary> summary() const;
  [[nodiscard]] std::vector<std::string> keys() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<Measurement> samples_;
};

namespace detail
{

class SampleGuard
{
public:
  SampleGuard(MeasurementStore & store, std::string key)
  : store_(store), key_(std::move(key)), start_(std::chrono::steady_clock::now())
  {
  }

  ~SampleGuard()
  {
    try {
      store_.record(Measurement{key_, start_, std::chrono::steady_clock::now()});
    } catch (const std::exception &) {
      // Allocation or locking failed; the sample is lost
    }
  }

  SampleGuard(const SampleGuard &) = delete;
  SampleGuard & operator=(const SampleGuard &) = delete;

private:
  MeasurementStore & store_;
  std::string key_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace detail

/**
 * Run action and record its elapsed time under key, whatever the outcome.
 * Exceptions from action propagate after the sample is recorded.
 */
template <typename Action>
decltype(auto) measure(MeasurementStore & store, std::string key, Action && action)
{
  detail::SampleGuard guard(store, std::move(key));
  return std::forward<Action>(action)();
}

}  // namespace cfgcat
