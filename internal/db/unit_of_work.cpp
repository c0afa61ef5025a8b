#include "unit_of_work.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "internal/db/pool/connection_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace muse::db {

UnitOfWork::UnitOfWork(std::shared_ptr<ConnectionPool> pool, util::RetryOptions retry) : pool_(std::move(pool)), retry_(std::move(retry)) {
  retry_.should_retry = [](const std::exception& e, uint32_t) { return util::IsTransientStoreError(e); };
  retry_.on_retry     = [](const std::exception& e, uint32_t attempt, std::chrono::milliseconds delay) {
    MUSE_LOG_WARN("unit of work retry", {observability::IntField("attempt", attempt), observability::IntField("delay_ms", delay.count()),
                                         observability::StringField("error", e.what())});
  };
}

UnitOfWork::~UnitOfWork() {
  if (!tx_) return;
  try {
    tx_->Rollback();
  } catch (const std::exception& e) {
    MUSE_LOG_WARN("unit of work rollback on destroy failed", {observability::StringField("error", e.what())});
  }
  Release();
}

void UnitOfWork::Begin() {
  if (tx_) throw util::InvalidState("unit of work already has an open transaction");
  util::Retry([this] { Open(); }, retry_);
}

// A failed Begin() hands the lease straight back to the pool.
void UnitOfWork::Open() {
  auto conn = pool_->Acquire();
  tx_       = conn->Begin();
  conn_     = std::move(conn);
  repos_    = std::make_unique<Repositories>(*conn_);
}

void UnitOfWork::Commit() {
  RequireActive("commit");
  try {
    tx_->Commit();
  } catch (const std::exception&) {
    Release();
    throw;
  }
  Release();
}

void UnitOfWork::Rollback() {
  RequireActive("rollback");
  try {
    tx_->Rollback();
  } catch (const std::exception&) {
    Release();
    throw;
  }
  Release();
}

repository::OperationRepository& UnitOfWork::Operations() {
  RequireActive("access operations");
  return repos_->operations;
}

repository::ActivityLogRepository& UnitOfWork::Logs() {
  RequireActive("access logs");
  return repos_->logs;
}

repository::ContentRepository& UnitOfWork::Content() {
  RequireActive("access content");
  return repos_->content;
}

repository::ConfigRepository& UnitOfWork::Configs() {
  RequireActive("access configs");
  return repos_->configs;
}

repository::EventStore& UnitOfWork::Events() {
  RequireActive("access events");
  return repos_->events;
}

Connection& UnitOfWork::Conn() {
  RequireActive("access connection");
  return *conn_;
}

void UnitOfWork::Transaction(const std::function<void(UnitOfWork&)>& fn) {
  if (tx_) throw util::InvalidState("unit of work already has an open transaction");

  util::Retry(
      [&] {
        Open();
        try {
          fn(*this);
        } catch (const std::exception&) {
          if (tx_) {
            try {
              Rollback();
            } catch (const std::exception& rollback_error) {
              MUSE_LOG_WARN("unit of work rollback failed", {observability::StringField("error", rollback_error.what())});
            }
          }
          throw;
        }
        Commit();
      },
      retry_);
}

void UnitOfWork::RequireActive(const char* what) const {
  if (!tx_) throw util::InvalidState(std::string("cannot ") + what + ": no open transaction");
}

// The repositories and transaction reference the connection, so they go
// first. The lease goes back to the pool last.
void UnitOfWork::Release() {
  repos_.reset();
  tx_.reset();
  conn_.reset();
}

} // namespace muse::db
