// cfgcat/driver/stats.cpp - Timing samples per unit of work
#include "cfgcat/driver/stats.hpp"

#include <algorithm>
#include <set>

namespace cfgcat
{

void MeasurementStore::record(Measurement sample)
{
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.push_back(std::move(sample));
}

std::vector<Measurement> MeasurementStore::samples(std::string_view key) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Measurement> out;
  for (const auto & s : samples_) {
    if (s.key == key) {
      out.push_back(s);
    }
  }
  return out;
}

std::map<std::string, MeasurementSummary> MeasurementStore::summary() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, MeasurementSummary> out;
  for (const auto & s : samples_) {
    const double elapsed = s.seconds();
    MeasurementSummary & sum = out[s.key];
    if (sum.count == 0) {
      sum.min = elapsed;
      sum.max = elapsed;
    } else {
      sum.min = std::min(sum.min, elapsed);
      sum.max = std::max(sum.max, elapsed);
    }
    ++sum.count;
    sum.total += elapsed;
  }
  return out;
}

std::vector<std::string> MeasurementStore::keys() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> unique;
  for (const auto & s : samples_) {
    unique.insert(s.key);
  }
  return {unique.begin(), unique.end()};
}

std::size_t MeasurementStore::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return samples_.size();
}

}  // namespace cfgcat
