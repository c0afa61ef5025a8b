#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_connection.hpp"

namespace muse::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteConnection& conn) : conn_(conn) {
  ThrowIfError(conn_.Exec("BEGIN IMMEDIATE;"), "sqlite begin");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    auto result = conn_.Exec("ROLLBACK;");
    if (!result) {
      MUSE_LOG_WARN("sqlite rollback on destroy failed", {observability::StringField("error", result.message)});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");
  auto result = conn_.Exec("COMMIT;");
  if (!result) {
    // A failed COMMIT may leave the transaction open; roll it back so the
    // connection goes back to the pool clean.
    if (conn_.InTransaction()) {
      auto rollback = conn_.Exec("ROLLBACK;");
      if (!rollback) {
        MUSE_LOG_WARN("sqlite rollback after failed commit failed", {observability::StringField("error", rollback.message)});
      }
    }
    finished_ = true;
    ThrowIfError(result, "sqlite commit");
  }
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) throw util::InvalidState("transaction already finished");
  finished_ = true;
  ThrowIfError(conn_.Exec("ROLLBACK;"), "sqlite rollback");
}

} // namespace muse::db::sqlite
