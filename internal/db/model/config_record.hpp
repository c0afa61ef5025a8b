#pragma once

#include <cstdint>

#include "muse/autonomous/v1.hpp"

namespace muse::db::model {

// One stored configuration version. Higher version wins.
struct ConfigRecord {
  int64_t                               version = 0;
  muse::autonomous::v1::AutonomousConfig config;
  int64_t                               created_at_ms = 0;
};

}
