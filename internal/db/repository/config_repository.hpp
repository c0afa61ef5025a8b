#pragma once

#include <optional>

#include "internal/db/api/connection.hpp"
#include "internal/db/model/config_record.hpp"

namespace muse::db::repository {

// Versioned configuration: every update inserts a row, the highest id is current.
class ConfigRepository {
 public:
  explicit ConfigRepository(Connection& conn) : conn_(conn) {
  }

  std::optional<model::ConfigRecord> Latest();
  void                               Insert(const muse::autonomous::v1::AutonomousConfig& config, int64_t created_at_ms);

 private:
  Connection& conn_;
};

} // namespace muse::db::repository
