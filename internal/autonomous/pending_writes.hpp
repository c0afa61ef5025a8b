#pragma once

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace muse::autonomous {

/*
  Batched writes resolve long after the caller moved on. PendingWrites
  keeps their futures and logs the ones that end in an error.
*/
class PendingWrites {
 public:
  void Track(std::future<void> future, std::string what) {
    std::lock_guard lock(mutex_);
    ReapLocked(false);
    pending_.push_back(Entry{std::move(future), std::move(what)});
  }

  // Blocks until every tracked write settled.
  void Drain() {
    std::lock_guard lock(mutex_);
    ReapLocked(true);
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
  }

 private:
  struct Entry {
    std::future<void> future;
    std::string       what;
  };

  void ReapLocked(bool wait) {
    std::vector<Entry> still_pending;
    for (auto& entry : pending_) {
      if (!wait && entry.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        still_pending.push_back(std::move(entry));
        continue;
      }
      try {
        entry.future.get();
      } catch (const std::exception& e) {
        MUSE_LOG_ERROR("batched write failed", {observability::StringField("write", entry.what), observability::StringField("error", e.what())});
      }
    }
    pending_ = std::move(still_pending);
  }

  mutable std::mutex mutex_;
  std::vector<Entry> pending_;
};

} // namespace muse::autonomous
