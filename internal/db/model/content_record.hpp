#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "muse/autonomous/v1.hpp"

namespace muse::db::model {

// A generated artifact the quality gate decided to keep.
struct ContentRecord {
  std::string                       id;
  muse::autonomous::v1::ContentType type = muse::autonomous::v1::CONTENT_TYPE_UNSPECIFIED;
  std::string                       operation_id;
  std::optional<std::string>        project_id;
  int32_t                           quality_score = 0;
  muse::autonomous::v1::GeneratedContent body;
  int64_t                           created_at_ms = 0;
};

}
