#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/db/model/operation_record.hpp"

namespace muse::db::repository {

/*
  autonomous_operations access bound to one connection.

  Writes fail with TransientStoreError on lock contention and
  ValidationError on constraint violations.
*/
class OperationRepository {
 public:
  explicit OperationRepository(Connection& conn) : conn_(conn) {
  }

  void Insert(const model::OperationRecord& record);
  void Update(const model::OperationRecord& record);

  std::optional<model::OperationRecord>                 Get(const std::string& id);
  std::optional<muse::autonomous::v1::OperationStatus> GetStatus(const std::string& id);
  std::vector<model::OperationRecord>                   ListRecent(int64_t since_ms, std::size_t limit);
  int64_t                                               CountSince(int64_t since_ms);

 private:
  Connection& conn_;
};

} // namespace muse::db::repository
