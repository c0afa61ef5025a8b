#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace muse::db::model {

struct EventMetadata {
  int64_t                    timestamp_ms = 0;
  std::optional<std::string> correlation_id;
  std::optional<std::string> causation_id;
};

/*
  Immutable record of something that happened.

  sequence is assigned by the event log on append (0 before that).
*/
struct DomainEvent {
  int64_t                  sequence = 0;
  std::string              event_id;
  std::string              event_type;
  std::string              aggregate_id;
  std::string              aggregate_type;
  google::protobuf::Struct payload;
  EventMetadata            metadata;
};

} // namespace muse::db::model
