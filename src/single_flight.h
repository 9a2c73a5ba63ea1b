#pragma once

#include "util.h"

#include <exception>
#include <future>
#include <map>
#include <mutex>

namespace quarry {

// Memoizes fn(key) per key. Concurrent first callers for one key share a single call to
// fn and all receive its value or its exception. Failures are not memoized, so a later
// caller retries.
template <typename K, typename V>
class single_flight : unmovable {
 public:
  template <typename fn_t>
  V get(K const &key, fn_t &&fn) {
    std::promise<V> promise;
    std::shared_future<V> future;
    bool owner{ false };

    {
      std::lock_guard const lock{ mutex_ };
      if (auto const it{ entries_.find(key) }; it != entries_.end()) {
        future = it->second;
      } else {
        future = promise.get_future().share();
        entries_.emplace(key, future);
        owner = true;
      }
    }

    if (owner) {
      try {
        promise.set_value(fn());
      } catch (...) {
        promise.set_exception(std::current_exception());
        std::lock_guard const lock{ mutex_ };
        entries_.erase(key);
      }
    }

    return future.get();
  }

  bool contains(K const &key) const {
    std::lock_guard const lock{ mutex_ };
    return entries_.contains(key);
  }

 private:
  mutable std::mutex mutex_;
  std::map<K, std::shared_future<V>> entries_;
};

}  // namespace quarry
