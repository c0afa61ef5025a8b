#include "pg_connection.hpp"

#include <type_traits>
#include <variant>

#include "internal/util/errors.hpp"
#include "pg_tx.hpp"

namespace muse::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(pqxx::row row) : row_(std::move(row)) {
  }

  std::string GetText(int col) const override {
    return row_[col].is_null() ? std::string() : std::string(row_[col].c_str());
  }

  int GetInt(int col) const override {
    return row_[col].as<int>(0);
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>(0);
  }

  double GetDouble(int col) const override {
    return row_[col].as<double>(0.0);
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  pqxx::row row_;
};

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            out.append(static_cast<int64_t>(value));
          } else {
            out.append(value);
          }
        },
        param);
  }
  return out;
}

} // namespace

PgConnection::PgConnection(const std::string& conninfo) {
  try {
    conn_ = std::make_unique<pqxx::connection>(conninfo);
  } catch (const pqxx::broken_connection& e) {
    throw util::TransientStoreError(std::string("postgres connect: ") + e.what());
  }
}

PgConnection::~PgConnection() {
  Close();
}

void PgConnection::Close() {
  if (work_) AbortWork();
  if (conn_) {
    conn_->close();
    conn_.reset();
  }
}

bool PgConnection::IsHealthy() const {
  return conn_ && conn_->is_open() && !broken_;
}

std::string PgConnection::RewritePlaceholders(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 8);
  bool in_quote = false;
  int  index    = 0;
  for (char c : sql) {
    if (c == '\'') in_quote = !in_quote;
    if (c == '?' && !in_quote) {
      out += '$';
      out += std::to_string(++index);
      continue;
    }
    out += c;
  }
  return out;
}

Result PgConnection::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    broken_ = true;
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

template <typename Fn>
Result PgConnection::Execute(const std::string& sql, const sql::Params& params, Fn&& on_result) {
  if (!conn_) return Result::Err(ErrorCode::IOError, "connection closed");

  const auto statement = RewritePlaceholders(sql);
  try {
    if (work_) {
      on_result(work_->exec_params(statement, ToPqxx(params)));
    } else {
      pqxx::nontransaction ntx(*conn_);
      on_result(ntx.exec_params(statement, ToPqxx(params)));
    }
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

Result PgConnection::Run(const std::string& sql, const sql::Params& params) {
  return Execute(sql, params, [this](const pqxx::result& res) { changes_ = static_cast<int64_t>(res.affected_rows()); });
}

Result PgConnection::Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) {
  return Execute(sql, params, [&](const pqxx::result& res) {
    for (const auto& row : res) {
      PgRow wrapped(row);
      on_row(wrapped);
    }
  });
}

std::unique_ptr<Transaction> PgConnection::Begin() {
  if (work_) throw util::InvalidState("postgres connection already has an open transaction");
  try {
    work_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    broken_ = true;
    throw util::TransientStoreError(std::string("postgres begin: ") + e.what());
  }
  return std::make_unique<PgTransaction>(*this);
}

void PgConnection::CommitWork() {
  if (!work_) throw util::InvalidState("no open postgres transaction");
  auto work = std::move(work_);
  try {
    work->commit();
  } catch (const pqxx::failure& e) {
    ThrowIfError(Translate(e), "postgres commit");
  }
}

void PgConnection::AbortWork() {
  if (!work_) return;
  auto work = std::move(work_);
  work->abort();
}

} // namespace muse::db::postgres
