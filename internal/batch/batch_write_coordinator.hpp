#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "internal/batch/batch_persister.hpp"
#include "internal/db/pool/connection_pool.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"

namespace muse::batch {

struct BatchOptions {
  std::size_t               batch_size = 100;
  std::chrono::milliseconds flush_interval{5000};
  uint32_t                  max_retries = 3;
  std::size_t               concurrency = 1;

  // Applied to each chunk transaction; should_retry is forced to
  // transient datastore errors.
  util::RetryOptions chunk_retry;
};

struct BatchStats {
  std::size_t queued   = 0;
  bool        flushing = false;
  uint64_t    flushes  = 0;
  uint64_t    chunks   = 0;
  uint64_t    written  = 0;
  uint64_t    rejected = 0;
};

/*
  BatchWriteCoordinator

  Groups individual writes into chunked transactions.

  - Add() enqueues and returns a future fulfilled once the item is
    committed, or failed with the terminal error.
  - A flush runs when the queue reaches batch_size or every
    flush_interval. It snapshots the whole queue, splits it into chunks
    of batch_size and runs at most `concurrency` chunks at a time.
  - Flushes are exclusive. A trigger that arrives mid-flush waits and is
    re-evaluated against the queue once the running flush finishes.
  - Each chunk is one transaction: Persist per item, publish its event
    on the same connection, commit. Any failure rolls the chunk back.
  - Items of a failed chunk are put back at the head of the queue with
    retry_count+1, and rejected once retry_count exceeds max_retries.
    When one item raised ValidationError, only that item is rejected and
    the rest go back with their retry_count unchanged.
  - Close() stops the timer and flushes until the queue is empty.
*/
template <typename T>
class BatchWriteCoordinator {
 public:
  BatchWriteCoordinator(std::shared_ptr<db::ConnectionPool> pool,
                        std::shared_ptr<BatchPersister<T>>  persister,
                        BatchOptions                        options,
                        std::shared_ptr<events::EventBus>   bus     = nullptr,
                        observability::Metrics*             metrics = nullptr)
      : pool_(std::move(pool)),
        persister_(std::move(persister)),
        bus_(std::move(bus)),
        metrics_(metrics),
        options_(std::move(options)),
        name_(persister_->Name()) {
    if (options_.batch_size == 0) options_.batch_size = 1;
    if (options_.concurrency == 0) options_.concurrency = 1;

    options_.chunk_retry.should_retry = [](const std::exception& e, uint32_t) { return util::IsTransientStoreError(e); };
    options_.chunk_retry.on_retry     = [name = name_](const std::exception& e, uint32_t attempt, std::chrono::milliseconds delay) {
      MUSE_LOG_WARN("batch chunk retry",
                    {observability::StringField("writer", name), observability::IntField("attempt", attempt),
                     observability::IntField("delay_ms", delay.count()), observability::StringField("error", e.what())});
    };

    worker_ = std::thread(&BatchWriteCoordinator::Run, this);
  }

  ~BatchWriteCoordinator() {
    Close();
  }

  BatchWriteCoordinator(const BatchWriteCoordinator&)            = delete;
  BatchWriteCoordinator& operator=(const BatchWriteCoordinator&) = delete;

  std::future<void> Add(T payload) {
    Item item{std::move(payload), std::promise<void>{}, 0};
    auto future = item.promise.get_future();

    {
      std::lock_guard lock(mutex_);
      if (closed_) throw util::InvalidState("batch writer '" + name_ + "' is closed");
      queue_.push_back(std::move(item));
      PublishDepthLocked();
    }
    MaybeWakeWorker();
    return future;
  }

  // All items enter the queue under one lock, so a single flush snapshot
  // never splits them unless they exceed batch_size.
  std::vector<std::future<void>> AddMany(std::vector<T> payloads) {
    std::vector<std::future<void>> futures;
    futures.reserve(payloads.size());

    {
      std::lock_guard lock(mutex_);
      if (closed_) throw util::InvalidState("batch writer '" + name_ + "' is closed");
      for (auto& payload : payloads) {
        Item item{std::move(payload), std::promise<void>{}, 0};
        futures.push_back(item.promise.get_future());
        queue_.push_back(std::move(item));
      }
      PublishDepthLocked();
    }
    MaybeWakeWorker();
    return futures;
  }

  // Blocks until one flush covering the current queue contents has run.
  void Flush() {
    std::unique_lock lock(mutex_);
    flush_cv_.wait(lock, [this] { return !flushing_; });
    if (queue_.empty()) return;

    flushing_ = true;
    std::vector<Item> snapshot(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
    lock.unlock();

    const auto        started = std::chrono::steady_clock::now();
    std::vector<Item> requeue;
    try {
      requeue = RunFlush(std::move(snapshot));
    } catch (...) {
      // Unfinished items of the snapshot see a broken promise.
      std::lock_guard relock(mutex_);
      flushing_ = false;
      flush_cv_.notify_all();
      throw;
    }
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    if (metrics_) metrics_->ObserveBatchFlushDurationMs(name_, elapsed);

    lock.lock();
    queue_.insert(queue_.begin(), std::make_move_iterator(requeue.begin()), std::make_move_iterator(requeue.end()));
    flushing_ = false;
    ++flushes_;
    PublishDepthLocked();
    flush_cv_.notify_all();

    // deferred triggers: let the worker look at the queue again
    if (queue_.size() >= options_.batch_size) worker_cv_.notify_one();
  }

  // Idempotent. Rejects new items, stops the timer, drains the queue.
  void Close() {
    {
      std::lock_guard lock(mutex_);
      if (closed_ && !worker_.joinable()) return;
      closed_ = true;
      stop_   = true;
    }
    worker_cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    for (;;) {
      {
        std::lock_guard lock(mutex_);
        if (queue_.empty() && !flushing_) break;
      }
      Flush();
    }
  }

  BatchStats Stats() const {
    std::lock_guard lock(mutex_);
    BatchStats      stats;
    stats.queued   = queue_.size();
    stats.flushing = flushing_;
    stats.flushes  = flushes_;
    stats.chunks   = chunks_.load();
    stats.written  = written_.load();
    stats.rejected = rejected_.load();
    return stats;
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  struct Item {
    T                  payload;
    std::promise<void> promise;
    uint32_t           retry_count = 0;
  };

  void MaybeWakeWorker() {
    bool wake = false;
    {
      std::lock_guard lock(mutex_);
      wake = queue_.size() >= options_.batch_size;
    }
    if (wake) worker_cv_.notify_one();
  }

  void PublishDepthLocked() {
    if (metrics_) metrics_->SetQueueDepth(name_, queue_.size());
  }

  void Run() {
    std::unique_lock lock(mutex_);
    while (!stop_) {
      worker_cv_.wait_for(lock, options_.flush_interval, [this] { return stop_ || (!flushing_ && queue_.size() >= options_.batch_size); });
      if (stop_) break;
      if (queue_.empty()) continue;

      lock.unlock();
      try {
        Flush();
      } catch (const std::exception& e) {
        MUSE_LOG_ERROR("batch flush failed", {observability::StringField("writer", name_), observability::StringField("error", e.what())});
      }
      lock.lock();
    }
  }

  // Returns the items to put back at the head of the queue, in order.
  std::vector<Item> RunFlush(std::vector<Item> snapshot) {
    std::vector<std::vector<Item>> chunks;
    for (std::size_t offset = 0; offset < snapshot.size(); offset += options_.batch_size) {
      const auto end = std::min(offset + options_.batch_size, snapshot.size());
      chunks.emplace_back(std::make_move_iterator(snapshot.begin() + offset), std::make_move_iterator(snapshot.begin() + end));
    }

    std::vector<std::vector<Item>> requeued(chunks.size());
    for (std::size_t wave = 0; wave < chunks.size(); wave += options_.concurrency) {
      const auto wave_end = std::min(wave + options_.concurrency, chunks.size());

      if (wave_end - wave == 1) {
        requeued[wave] = ProcessChunk(std::move(chunks[wave]));
        continue;
      }

      // A chunk leaves chunks[i] only once its task is running, so a
      // failed launch still has it to process inline.
      std::vector<std::pair<std::size_t, std::future<std::vector<Item>>>> running;
      for (std::size_t i = wave; i < wave_end; ++i) {
        try {
          running.emplace_back(i, std::async(std::launch::async, [this, &chunks, i] { return ProcessChunk(std::move(chunks[i])); }));
        } catch (const std::system_error& e) {
          MUSE_LOG_WARN("batch chunk runs inline", {observability::StringField("writer", name_), observability::StringField("error", e.what())});
          requeued[i] = ProcessChunk(std::move(chunks[i]));
        }
      }
      for (auto& [index, future] : running) {
        requeued[index] = future.get();
      }
    }

    std::vector<Item> out;
    for (auto& chunk : requeued) {
      std::move(chunk.begin(), chunk.end(), std::back_inserter(out));
    }
    return out;
  }

  // Commits the chunk or sorts its items into rejected and requeued.
  std::vector<Item> ProcessChunk(std::vector<Item> chunk) {
    observability::SpanScope span("batch.chunk");
    span.SetAttribute("writer", name_);
    span.SetAttribute("size", static_cast<std::int64_t>(chunk.size()));

    std::optional<std::size_t> culprit;
    try {
      util::Retry(
          [&] {
            culprit.reset();
            auto conn = pool_->Acquire();
            auto tx   = conn->Begin();
            for (std::size_t i = 0; i < chunk.size(); ++i) {
              std::optional<db::model::DomainEvent> event;
              try {
                event = persister_->Persist(*conn, chunk[i].payload);
              } catch (const util::ValidationError&) {
                culprit = i;
                throw;
              }
              if (event && bus_) bus_->Publish(*event, events::PublishContext{conn.get()});
            }
            tx->Commit();
          },
          options_.chunk_retry);
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      return HandleChunkFailure(std::move(chunk), culprit, std::current_exception(), e.what());
    }

    ++chunks_;
    written_ += chunk.size();
    for (auto& item : chunk) item.promise.set_value();
    return {};
  }

  std::vector<Item> HandleChunkFailure(std::vector<Item> chunk, std::optional<std::size_t> culprit, std::exception_ptr error, const std::string& what) {
    MUSE_LOG_WARN("batch chunk failed",
                  {observability::StringField("writer", name_), observability::IntField("size", static_cast<int64_t>(chunk.size())),
                   observability::StringField("error", what)});

    std::vector<Item> requeue;
    for (std::size_t i = 0; i < chunk.size(); ++i) {
      auto& item = chunk[i];
      if (culprit && *culprit == i) {
        ++rejected_;
        item.promise.set_exception(error);
        continue;
      }
      // Chunk-mates of a rejected item keep their retry_count.
      if (!culprit && ++item.retry_count > options_.max_retries) {
        ++rejected_;
        item.promise.set_exception(error);
        continue;
      }
      requeue.push_back(std::move(item));
    }
    return requeue;
  }

  std::shared_ptr<db::ConnectionPool> pool_;
  std::shared_ptr<BatchPersister<T>>  persister_;
  std::shared_ptr<events::EventBus>   bus_;
  observability::Metrics*             metrics_;
  BatchOptions                        options_;
  std::string                         name_;

  mutable std::mutex      mutex_;
  std::condition_variable worker_cv_;
  std::condition_variable flush_cv_;
  std::deque<Item>        queue_;
  bool                    flushing_ = false;
  bool                    closed_   = false;
  bool                    stop_     = false;
  uint64_t                flushes_  = 0;

  std::atomic<uint64_t> chunks_{0};
  std::atomic<uint64_t> written_{0};
  std::atomic<uint64_t> rejected_{0};

  std::thread worker_;
};

} // namespace muse::batch
