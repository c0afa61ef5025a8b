#include "config_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/json.hpp"

namespace muse::db::repository {

std::optional<model::ConfigRecord> ConfigRepository::Latest() {
  std::optional<model::ConfigRecord> out;
  ThrowIfError(conn_.Query(sql::SELECT_LATEST_CONFIG, {},
                           [&](const sql::Row& row) {
                             model::ConfigRecord r;
                             r.version = row.GetInt64(0);
                             util::FromJson(row.GetText(1), &r.config);
                             r.created_at_ms = row.GetInt64(2);
                             out             = std::move(r);
                           }),
               "load latest config");
  return out;
}

void ConfigRepository::Insert(const muse::autonomous::v1::AutonomousConfig& config, int64_t created_at_ms) {
  ThrowIfError(conn_.Run(sql::INSERT_CONFIG, {util::ToJson(config), created_at_ms}), "insert config");
}

} // namespace muse::db::repository
