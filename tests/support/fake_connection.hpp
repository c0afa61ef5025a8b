#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/util/errors.hpp"

namespace muse::testing {

// Counters shared by every FakeConnection a factory hands out.
struct FakeBackend {
  std::atomic<int> opened{0};
  std::atomic<int> closed{0};
  std::atomic<int> commits{0};
  std::atomic<int> rollbacks{0};

  // The next N Begin() calls fail as if the datastore were locked.
  std::atomic<int> failing_begins{0};

  std::mutex               mutex;
  std::vector<std::size_t> committed_sizes;
};

class FakeConnection;

class FakeTransaction final : public db::Transaction {
 public:
  explicit FakeTransaction(FakeConnection& conn) : conn_(conn) {
  }
  ~FakeTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

 private:
  FakeConnection& conn_;
  bool            finished_ = false;
};

/*
  In-process stand-in for a datastore handle. Statements succeed without
  effect; writes staged through Stage() are counted per transaction.
*/
class FakeConnection final : public db::Connection {
 public:
  explicit FakeConnection(std::shared_ptr<FakeBackend> backend) : backend_(std::move(backend)) {
    ++backend_->opened;
  }

  db::Dialect GetDialect() const override {
    return db::Dialect::kSqlite;
  }

  db::Result Run(const std::string&, const db::sql::Params& = {}) override {
    return db::Result::Ok();
  }

  db::Result Query(const std::string&, const db::sql::Params&, const db::RowCallback&) override {
    return db::Result::Ok();
  }

  int64_t Changes() const override {
    return 0;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    if (in_tx_) throw util::InvalidState("transaction already open");
    if (backend_->failing_begins.load() > 0) {
      --backend_->failing_begins;
      throw util::TransientStoreError("database is locked");
    }
    in_tx_  = true;
    staged_ = 0;
    return std::make_unique<FakeTransaction>(*this);
  }

  bool InTransaction() const override {
    return in_tx_;
  }

  bool IsHealthy() const override {
    return healthy_;
  }

  void Close() override {
    if (!closed_) {
      closed_ = true;
      ++backend_->closed;
    }
  }

  void Stage() {
    ++staged_;
  }

  void MarkUnhealthy() {
    healthy_ = false;
  }

  // Simulates a lessee that lost track of its transaction.
  void LeaveTransactionOpen() {
    in_tx_ = true;
  }

 private:
  friend class FakeTransaction;

  void Finish(bool committed) {
    in_tx_ = false;
    if (committed) {
      ++backend_->commits;
      std::lock_guard lock(backend_->mutex);
      backend_->committed_sizes.push_back(staged_);
    } else {
      ++backend_->rollbacks;
    }
    staged_ = 0;
  }

  std::shared_ptr<FakeBackend> backend_;
  bool                         in_tx_   = false;
  bool                         healthy_ = true;
  bool                         closed_  = false;
  std::size_t                  staged_  = 0;
};

inline FakeTransaction::~FakeTransaction() {
  if (!finished_) conn_.Finish(false);
}

inline void FakeTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");
  finished_ = true;
  conn_.Finish(true);
}

inline void FakeTransaction::Rollback() {
  if (finished_) throw util::InvalidState("transaction already finished");
  finished_ = true;
  conn_.Finish(false);
}

inline db::ConnectionFactory FakeFactory(const std::shared_ptr<FakeBackend>& backend) {
  return [backend] { return std::make_unique<FakeConnection>(backend); };
}

} // namespace muse::testing
