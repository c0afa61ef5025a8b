#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/db/model/content_record.hpp"

namespace muse::db::repository {

class ContentRepository {
 public:
  explicit ContentRepository(Connection& conn) : conn_(conn) {
  }

  void Insert(const model::ContentRecord& record);
  // Refreshes score and body; identity columns never change.
  void Update(const model::ContentRecord& record);

  std::optional<model::ContentRecord> Get(const std::string& id);
  std::vector<model::ContentRecord>   ListByType(muse::autonomous::v1::ContentType type, std::size_t limit);

 private:
  Connection& conn_;
};

} // namespace muse::db::repository
