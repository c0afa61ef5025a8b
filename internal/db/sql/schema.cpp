#include "schema.hpp"

namespace muse::db::sql {

namespace {

const std::vector<std::string> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS autonomous_config (id INTEGER PRIMARY KEY AUTOINCREMENT, config_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS autonomous_operations (id TEXT PRIMARY KEY, type TEXT NOT NULL, status TEXT NOT NULL, project_id TEXT, start_time_ms INTEGER NOT NULL, end_time_ms INTEGER, metrics_json TEXT, result_json TEXT, error TEXT, updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_operations_start ON autonomous_operations(start_time_ms);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_operations_status ON autonomous_operations(status);",
    "CREATE TABLE IF NOT EXISTS autonomous_logs (id TEXT PRIMARY KEY, timestamp_ms INTEGER NOT NULL, level TEXT NOT NULL, category TEXT NOT NULL, message TEXT NOT NULL, operation_id TEXT, metadata_json TEXT);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_timestamp ON autonomous_logs(timestamp_ms);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_level ON autonomous_logs(level);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_category ON autonomous_logs(category);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_operation ON autonomous_logs(operation_id);",
    "CREATE TABLE IF NOT EXISTS autonomous_content (id TEXT PRIMARY KEY, type TEXT NOT NULL, operation_id TEXT NOT NULL, project_id TEXT, quality_score INTEGER NOT NULL, body_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_content_type ON autonomous_content(type, created_at_ms);",
    "CREATE TABLE IF NOT EXISTS domain_events (id INTEGER PRIMARY KEY AUTOINCREMENT, event_id TEXT NOT NULL UNIQUE, event_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, aggregate_type TEXT NOT NULL, payload_json TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, correlation_id TEXT, causation_id TEXT);",
    "CREATE INDEX IF NOT EXISTS idx_domain_events_aggregate ON domain_events(aggregate_id, id);",
    "CREATE INDEX IF NOT EXISTS idx_domain_events_type ON domain_events(event_type, id);",
};

const std::vector<std::string> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS autonomous_config (id BIGSERIAL PRIMARY KEY, config_json TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS autonomous_operations (id TEXT PRIMARY KEY, type TEXT NOT NULL, status TEXT NOT NULL, project_id TEXT, start_time_ms BIGINT NOT NULL, end_time_ms BIGINT, metrics_json TEXT, result_json TEXT, error TEXT, updated_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_operations_start ON autonomous_operations(start_time_ms);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_operations_status ON autonomous_operations(status);",
    "CREATE TABLE IF NOT EXISTS autonomous_logs (id TEXT PRIMARY KEY, timestamp_ms BIGINT NOT NULL, level TEXT NOT NULL, category TEXT NOT NULL, message TEXT NOT NULL, operation_id TEXT, metadata_json TEXT);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_timestamp ON autonomous_logs(timestamp_ms);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_level ON autonomous_logs(level);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_category ON autonomous_logs(category);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_logs_operation ON autonomous_logs(operation_id);",
    "CREATE TABLE IF NOT EXISTS autonomous_content (id TEXT PRIMARY KEY, type TEXT NOT NULL, operation_id TEXT NOT NULL, project_id TEXT, quality_score INTEGER NOT NULL, body_json TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS idx_autonomous_content_type ON autonomous_content(type, created_at_ms);",
    "CREATE TABLE IF NOT EXISTS domain_events (id BIGSERIAL PRIMARY KEY, event_id TEXT NOT NULL UNIQUE, event_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, aggregate_type TEXT NOT NULL, payload_json TEXT NOT NULL, timestamp_ms BIGINT NOT NULL, correlation_id TEXT, causation_id TEXT);",
    "CREATE INDEX IF NOT EXISTS idx_domain_events_aggregate ON domain_events(aggregate_id, id);",
    "CREATE INDEX IF NOT EXISTS idx_domain_events_type ON domain_events(event_type, id);",
};

} // namespace

const std::vector<std::string>& SchemaStatements(Dialect dialect) {
  return dialect == Dialect::kPostgres ? kPostgresSchema : kSqliteSchema;
}

void BootstrapSchema(Connection& conn) {
  auto tx = conn.Begin();
  for (const auto& statement : SchemaStatements(conn.GetDialect())) {
    ThrowIfError(conn.Run(statement), "schema bootstrap");
  }
  tx->Commit();

  // smoke reads so a column mismatch fails at startup
  const sql::Params none;
  auto              ignore = [](const sql::Row&) {};
  ThrowIfError(conn.Query("SELECT id,config_json,created_at_ms FROM autonomous_config LIMIT 1;", none, ignore), "schema check");
  ThrowIfError(conn.Query("SELECT id,type,status,project_id,start_time_ms,end_time_ms,metrics_json,result_json,error FROM autonomous_operations LIMIT 1;", none, ignore),
               "schema check");
  ThrowIfError(conn.Query("SELECT id,timestamp_ms,level,category,message,operation_id,metadata_json FROM autonomous_logs LIMIT 1;", none, ignore), "schema check");
  ThrowIfError(conn.Query("SELECT id,type,operation_id,project_id,quality_score,body_json,created_at_ms FROM autonomous_content LIMIT 1;", none, ignore),
               "schema check");
  ThrowIfError(conn.Query("SELECT id,event_id,event_type,aggregate_id,aggregate_type,payload_json,timestamp_ms FROM domain_events LIMIT 1;", none, ignore),
               "schema check");
}

} // namespace muse::db::sql
