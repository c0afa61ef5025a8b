#pragma once

#include <optional>
#include <string_view>

#include <google/protobuf/repeated_ptr_field.h>

#include "muse/autonomous/v1.hpp"

namespace muse::autonomous {

// "HH:MM" to minutes since midnight; nullopt when malformed.
std::optional<int> ParseClockMinutes(std::string_view text);

// Throws ValidationError naming the first malformed slot.
void ValidateTimeSlots(const google::protobuf::RepeatedPtrField<muse::autonomous::v1::TimeSlot>& slots);

// Inclusive bounds. start > end wraps across midnight.
bool SlotAdmits(const muse::autonomous::v1::TimeSlot& slot, int minute_of_day);

// True when any enabled slot admits the minute.
bool WithinTimeSlots(const google::protobuf::RepeatedPtrField<muse::autonomous::v1::TimeSlot>& slots, int minute_of_day);

} // namespace muse::autonomous
