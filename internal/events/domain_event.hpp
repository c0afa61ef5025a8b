#pragma once

#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/event_record.hpp"

namespace muse::events {

using DomainEvent = db::model::DomainEvent;

namespace event_types {
inline constexpr const char* kOperationCompleted = "operation.completed";
inline constexpr const char* kOperationFailed    = "operation.failed";
inline constexpr const char* kOperationCancelled = "operation.cancelled";
inline constexpr const char* kOperationUpdated   = "operation.updated";
inline constexpr const char* kContentSaved       = "content.saved";
inline constexpr const char* kConfigUpdated      = "config.updated";
inline constexpr const char* kActivityLogged     = "activity.logged";
} // namespace event_types

namespace aggregate_types {
inline constexpr const char* kOperation = "operation";
inline constexpr const char* kContent   = "content";
inline constexpr const char* kConfig    = "config";
inline constexpr const char* kActivity  = "activity";
} // namespace aggregate_types

// Fresh event id, timestamp now.
DomainEvent MakeEvent(std::string                event_type,
                      std::string                aggregate_id,
                      std::string                aggregate_type,
                      google::protobuf::Struct   payload,
                      std::optional<std::string> correlation_id = std::nullopt);

} // namespace muse::events
