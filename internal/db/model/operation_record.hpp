#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "muse/autonomous/v1.hpp"

namespace muse::db::model {

/*
  Persistent operation row.

  Written once when the operation is admitted and again when it reaches
  a terminal status. A terminal row is never moved back.
*/
struct OperationRecord {
  std::string id;

  muse::autonomous::v1::ContentType     type   = muse::autonomous::v1::CONTENT_TYPE_UNSPECIFIED;
  muse::autonomous::v1::OperationStatus status = muse::autonomous::v1::OPERATION_STATUS_PENDING;

  std::optional<std::string> project_id;

  int64_t                start_time_ms = 0;
  std::optional<int64_t> end_time_ms;

  muse::autonomous::v1::OperationMetrics               metrics;
  std::optional<muse::autonomous::v1::OperationResult> result;
  std::optional<std::string>                           error;
};

}
