#include "domain_event.hpp"

#include <utility>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace muse::events {

DomainEvent MakeEvent(std::string                event_type,
                      std::string                aggregate_id,
                      std::string                aggregate_type,
                      google::protobuf::Struct   payload,
                      std::optional<std::string> correlation_id) {
  DomainEvent event;
  event.event_id                = util::NewId();
  event.event_type              = std::move(event_type);
  event.aggregate_id            = std::move(aggregate_id);
  event.aggregate_type          = std::move(aggregate_type);
  event.payload                 = std::move(payload);
  event.metadata.timestamp_ms   = util::ToUnixMillis(util::Now());
  event.metadata.correlation_id = std::move(correlation_id);
  return event;
}

} // namespace muse::events
