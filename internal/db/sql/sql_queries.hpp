#pragma once

namespace muse::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in the SQLite/Postgres common subset with '?'
  placeholders so they work in both engines.
*/

// operations

static constexpr const char* INSERT_OPERATION =
    "INSERT INTO autonomous_operations(id,type,status,project_id,start_time_ms,end_time_ms,metrics_json,result_json,error,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_OPERATION =
    "UPDATE autonomous_operations SET status=?,end_time_ms=?,metrics_json=?,result_json=?,error=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* SELECT_OPERATION =
    "SELECT id,type,status,project_id,start_time_ms,end_time_ms,metrics_json,result_json,error"
    " FROM autonomous_operations WHERE id=?;";

static constexpr const char* SELECT_OPERATION_STATUS =
    "SELECT status FROM autonomous_operations WHERE id=?;";

static constexpr const char* SELECT_RECENT_OPERATIONS =
    "SELECT id,type,status,project_id,start_time_ms,end_time_ms,metrics_json,result_json,error"
    " FROM autonomous_operations WHERE start_time_ms>=? ORDER BY start_time_ms DESC LIMIT ?;";

static constexpr const char* COUNT_OPERATIONS_SINCE =
    "SELECT COUNT(*) FROM autonomous_operations WHERE start_time_ms>=?;";

// activity log

static constexpr const char* INSERT_LOG =
    "INSERT INTO autonomous_logs(id,timestamp_ms,level,category,message,operation_id,metadata_json)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LOG_EXISTS =
    "SELECT 1 FROM autonomous_logs WHERE id=?;";

static constexpr const char* DELETE_LOGS_BEFORE =
    "DELETE FROM autonomous_logs WHERE timestamp_ms<?;";

static constexpr const char* SUMMARIZE_LOGS_BY_LEVEL =
    "SELECT level,COUNT(*) FROM autonomous_logs WHERE timestamp_ms>=? GROUP BY level;";

static constexpr const char* SUMMARIZE_LOGS_BY_CATEGORY =
    "SELECT category,COUNT(*) FROM autonomous_logs WHERE timestamp_ms>=? GROUP BY category;";

// content

static constexpr const char* INSERT_CONTENT =
    "INSERT INTO autonomous_content(id,type,operation_id,project_id,quality_score,body_json,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_CONTENT =
    "UPDATE autonomous_content SET quality_score=?,body_json=? WHERE id=?;";

static constexpr const char* SELECT_CONTENT =
    "SELECT id,type,operation_id,project_id,quality_score,body_json,created_at_ms"
    " FROM autonomous_content WHERE id=?;";

static constexpr const char* SELECT_CONTENT_BY_TYPE =
    "SELECT id,type,operation_id,project_id,quality_score,body_json,created_at_ms"
    " FROM autonomous_content WHERE type=? ORDER BY created_at_ms DESC LIMIT ?;";

// config

static constexpr const char* INSERT_CONFIG =
    "INSERT INTO autonomous_config(config_json,created_at_ms) VALUES(?,?);";

static constexpr const char* SELECT_LATEST_CONFIG =
    "SELECT id,config_json,created_at_ms FROM autonomous_config ORDER BY id DESC LIMIT 1;";

// domain events

static constexpr const char* INSERT_EVENT =
    "INSERT INTO domain_events(event_id,event_type,aggregate_id,aggregate_type,payload_json,timestamp_ms,correlation_id,causation_id)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EVENTS_BY_AGGREGATE =
    "SELECT id,event_id,event_type,aggregate_id,aggregate_type,payload_json,timestamp_ms,correlation_id,causation_id"
    " FROM domain_events WHERE aggregate_id=? ORDER BY id ASC;";

static constexpr const char* SELECT_EVENTS_BY_TYPE =
    "SELECT id,event_id,event_type,aggregate_id,aggregate_type,payload_json,timestamp_ms,correlation_id,causation_id"
    " FROM domain_events WHERE event_type=? AND id>? ORDER BY id ASC LIMIT ?;";

static constexpr const char* SELECT_LAST_EVENT_ID =
    "SELECT MAX(id) FROM domain_events;";

}
