#include "pg_tx.hpp"

#include "internal/util/errors.hpp"
#include "pg_connection.hpp"

namespace muse::db::postgres {

PgTransaction::PgTransaction(PgConnection& conn) : conn_(conn) {
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    conn_.AbortWork();
  }
}

void PgTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");
  finished_ = true;
  conn_.CommitWork();
}

void PgTransaction::Rollback() {
  if (finished_) throw util::InvalidState("transaction already finished");
  finished_ = true;
  conn_.AbortWork();
}

}
