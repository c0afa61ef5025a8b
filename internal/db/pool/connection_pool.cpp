#include "connection_pool.hpp"

#include <algorithm>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace muse::db {

using observability::IntField;

ConnectionPool::ConnectionPool(ConnectionFactory factory, PoolOptions options)
    : factory_(std::move(factory)),
      options_(options) {
  if (options_.max_connections == 0) options_.max_connections = 1;
  options_.min_connections = std::min(options_.min_connections, options_.max_connections);

  for (std::size_t i = 0; i < options_.min_connections; ++i) {
    idle_.push_back({factory_(), SteadyClock::now()});
    ++live_connections_;
  }

  if (options_.idle_timeout.count() > 0) {
    sweeper_ = std::thread(&ConnectionPool::SweepLoop, this);
  }
}

// Leases outlive the pool only through their weak_ptr deleter, which
// closes the handle itself; nothing to wait for here.
ConnectionPool::~ConnectionPool() {
  Shutdown(false);
}

std::shared_ptr<Connection> ConnectionPool::Acquire() {
  return Acquire(options_.acquire_timeout);
}

std::shared_ptr<Connection> ConnectionPool::Acquire(std::chrono::milliseconds timeout) {
  const auto deadline = SteadyClock::now() + timeout;

  std::unique_lock lock(mutex_);
  for (;;) {
    if (closed_) {
      throw util::InvalidState("connection pool is closed");
    }

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back().conn);
      idle_.pop_back();
      ++leased_;
      lock.unlock();
      return Wrap(conn.release());
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      ++leased_;
      lock.unlock();

      try {
        auto conn = factory_();
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        --leased_;
        cv_.notify_all();
        throw;
      }
    }

    ++waiting_;
    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return closed_ || !idle_.empty() || live_connections_ < options_.max_connections;
    });
    --waiting_;

    if (!ready) {
      throw util::PoolExhausted("no connection available within " + std::to_string(timeout.count()) + "ms (max " +
                                std::to_string(options_.max_connections) + ")");
    }
  }
}

std::shared_ptr<Connection> ConnectionPool::Wrap(Connection* conn) {
  std::weak_ptr<ConnectionPool> weak_self = weak_from_this();
  return std::shared_ptr<Connection>(conn, [weak_self](Connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void ConnectionPool::Release(Connection* conn) {
  std::unique_ptr<Connection> owned(conn);
  std::unique_ptr<Connection> discard;

  {
    std::lock_guard lock(mutex_);
    --leased_;
    if (closed_ || !owned->IsHealthy() || owned->InTransaction()) {
      --live_connections_;
      discard = std::move(owned);
    } else {
      idle_.push_back({std::move(owned), SteadyClock::now()});
    }
  }
  cv_.notify_all();

  if (discard) {
    discard->Close();
  }
}

void ConnectionPool::SweepLoop() {
  const auto period = std::max(options_.idle_timeout / 2, std::chrono::milliseconds(1));

  std::unique_lock lock(mutex_);
  while (!stop_sweep_) {
    sweep_cv_.wait_for(lock, period, [this] { return stop_sweep_; });
    if (stop_sweep_) break;

    std::vector<std::unique_ptr<Connection>> evicted;
    const auto                               now = SteadyClock::now();

    // Oldest idle entries sit at the front.
    while (!idle_.empty() && live_connections_ > options_.min_connections && now - idle_.front().since >= options_.idle_timeout) {
      evicted.push_back(std::move(idle_.front().conn));
      idle_.pop_front();
      --live_connections_;
    }

    if (evicted.empty()) continue;

    lock.unlock();
    for (auto& conn : evicted) conn->Close();
    MUSE_LOG_DEBUG("evicted idle connections", {IntField("count", static_cast<int64_t>(evicted.size()))});
    cv_.notify_all();
    lock.lock();
  }
}

void ConnectionPool::StopSweeper() {
  {
    std::lock_guard lock(mutex_);
    stop_sweep_ = true;
  }
  sweep_cv_.notify_all();
  if (sweeper_.joinable() && sweeper_.get_id() != std::this_thread::get_id()) {
    sweeper_.join();
  }
}

void ConnectionPool::Close() {
  Shutdown(true);
}

void ConnectionPool::Shutdown(bool wait_for_leases) {
  StopSweeper();

  std::deque<IdleEntry> to_close;
  {
    std::unique_lock lock(mutex_);
    if (!closed_) {
      closed_ = true;
      cv_.notify_all();
    }

    if (wait_for_leases) {
      if (leased_ > 0) {
        MUSE_LOG_INFO("connection pool draining", {IntField("leased", static_cast<int64_t>(leased_))});
      }
      cv_.wait(lock, [this] { return leased_ == 0; });
    }

    to_close.swap(idle_);
    live_connections_ -= to_close.size();
  }

  for (auto& entry : to_close) {
    entry.conn->Close();
  }
}

PoolStats ConnectionPool::Stats() const {
  std::lock_guard lock(mutex_);
  PoolStats       stats;
  stats.total   = live_connections_;
  stats.leased  = leased_;
  stats.idle    = idle_.size();
  stats.waiting = waiting_;
  return stats;
}

} // namespace muse::db
