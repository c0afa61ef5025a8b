#pragma once

#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace muse::db::sql {

/*
  Idempotent DDL for every table the runtime touches.

  autonomous_config      versioned config rows, latest id wins
  autonomous_operations  one row per operation id
  autonomous_logs        append-only activity log
  autonomous_content     artifacts the quality gate decided to keep
  domain_events          append-only event log
*/
const std::vector<std::string>& SchemaStatements(Dialect dialect);

void BootstrapSchema(Connection& conn);

} // namespace muse::db::sql
