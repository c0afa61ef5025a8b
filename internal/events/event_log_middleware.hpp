#pragma once

#include <memory>

#include "internal/events/event_bus.hpp"

namespace muse::db {
class ConnectionPool;
}

namespace muse::events {

// Appends every published event to domain_events. Inside a transaction the
// row is written on the caller's connection and shares its fate.
Middleware MakeEventLogMiddleware(std::shared_ptr<db::ConnectionPool> pool);

} // namespace muse::events
