#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/connection.hpp"

namespace muse::db {

struct PoolOptions {
  std::size_t               min_connections = 1;
  std::size_t               max_connections = 8;
  std::chrono::milliseconds idle_timeout{30000};
  std::chrono::milliseconds acquire_timeout{5000};
};

struct PoolStats {
  std::size_t total   = 0;
  std::size_t leased  = 0;
  std::size_t idle    = 0;
  std::size_t waiting = 0;
};

/*
  ConnectionPool

  Owns every datastore handle in the process.

  - Acquire() reuses an idle handle, opens a new one while below max,
    otherwise waits up to the acquire timeout and throws PoolExhausted.
  - A lease is a shared_ptr whose deleter returns the handle. Handles
    that report unhealthy on return are closed instead of kept.
  - A sweep thread closes handles idle longer than idle_timeout while
    more than min_connections are open.
  - Close() rejects new acquisitions, waits for outstanding leases to
    come back, then closes every handle. No handle is closed while leased.

  Lifetime:
    Owners hold shared_ptr<ConnectionPool>; leases hold a weak_ptr and
    close their handle directly if the pool is already gone.
*/
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
 public:
  ConnectionPool(ConnectionFactory factory, PoolOptions options);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&)            = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  std::shared_ptr<Connection> Acquire();
  std::shared_ptr<Connection> Acquire(std::chrono::milliseconds timeout);

  void Close();

  PoolStats Stats() const;

  const PoolOptions& Options() const {
    return options_;
  }

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct IdleEntry {
    std::unique_ptr<Connection> conn;
    SteadyClock::time_point     since;
  };

  std::shared_ptr<Connection> Wrap(Connection* conn);
  void                        Release(Connection* conn);
  void                        SweepLoop();
  void                        StopSweeper();
  void                        Shutdown(bool wait_for_leases);

  ConnectionFactory factory_;
  PoolOptions       options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<IdleEntry>   idle_;
  std::size_t             live_connections_ = 0;
  std::size_t             leased_           = 0;
  std::size_t             waiting_          = 0;
  bool                    closed_           = false;

  std::condition_variable sweep_cv_;
  bool                    stop_sweep_ = false;
  std::thread             sweeper_;
};

} // namespace muse::db
