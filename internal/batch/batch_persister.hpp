#pragma once

#include <optional>
#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/db/model/event_record.hpp"

namespace muse::batch {

/*
  Per-record write logic plugged into a BatchWriteCoordinator.

  Persist runs inside the chunk transaction on the chunk's connection:
  check existence, insert or update, and return the domain event that
  describes the write (nullopt for none). Throwing ValidationError
  rejects this item alone; any other exception fails the whole chunk.
*/
template <typename T>
class BatchPersister {
 public:
  virtual ~BatchPersister() = default;

  virtual std::string Name() const = 0;

  virtual std::optional<db::model::DomainEvent> Persist(db::Connection& conn, const T& item) = 0;
};

} // namespace muse::batch
