// cfgcat/driver/compute_cache.hpp - Single-flight memoizing cache
//
// Each key is computed at most once for the lifetime of the cache. The
// first requester claims the key and runs the computation outside the
// lock; concurrent requesters for the same key wait on the same shared
// future and observe the identical outcome, failures included.
//
#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "cfgcat/basic/diagnostic.hpp"
#include "cfgcat/basic/result.hpp"

namespace cfgcat
{

template <typename K, typename V, typename Hash = std::hash<K>>
class ComputeCache
{
public:
  using Outcome = Result<V>;
  using Compute = std::function<Outcome()>;

  ComputeCache() = default;

  ComputeCache(const ComputeCache &) = delete;
  ComputeCache & operator=(const ComputeCache &) = delete;

  /**
   * Cached outcome for key, running compute when nobody has claimed it yet.
   *
   * An exception escaping compute is published as a CacheComputationError
   * outcome. No eviction: failures stay cached like successes.
   */
  [[nodiscard]] Outcome get(const K & key, const Compute & compute)
  {
    std::promise<Outcome> promise;
    std::shared_future<Outcome> future;
    bool owner = false;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = entries_.find(key);
      if (it != entries_.end()) {
        future = it->second;
      } else {
        future = promise.get_future().share();
        entries_.emplace(key, future);
        owner = true;
      }
    }

    if (owner) {
      promise.set_value(run(compute));
    }
    return future.get();
  }

  [[nodiscard]] bool contains(const K & key) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) != 0;
  }

  [[nodiscard]] std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

private:
  static Outcome run(const Compute & compute)
  {
    try {
      return compute();
    } catch (const std::exception & e) {
      return Outcome::fail(Diagnostic::error(
        DiagnosticKind::CacheComputationError, std::string("cached computation failed: ") + e.what()));
    } catch (...) {
      return Outcome::fail(Diagnostic::error(
        DiagnosticKind::CacheComputationError, "cached computation failed with an unknown exception"));
    }
  }

  mutable std::mutex mutex_;
  std::unordered_map<K, std::shared_future<Outcome>, Hash> entries_;
};

}  // namespace cfgcat
