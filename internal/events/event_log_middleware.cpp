#include "event_log_middleware.hpp"

#include <utility>

#include "internal/db/pool/connection_pool.hpp"
#include "internal/db/repository/event_store.hpp"

namespace muse::events {

Middleware MakeEventLogMiddleware(std::shared_ptr<db::ConnectionPool> pool) {
  return [pool = std::move(pool)](const DomainEvent& event, const PublishContext& context) {
    if (context.connection) {
      db::repository::EventStore(*context.connection).Append(event);
      return;
    }
    auto conn = pool->Acquire();
    db::repository::EventStore(*conn).Append(event);
  };
}

} // namespace muse::events
