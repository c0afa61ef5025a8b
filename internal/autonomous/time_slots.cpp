#include "time_slots.hpp"

#include <cctype>
#include <string>

#include "internal/util/errors.hpp"

namespace muse::autonomous {

std::optional<int> ParseClockMinutes(std::string_view text) {
  if (text.size() != 5 || text[2] != ':') return std::nullopt;
  for (std::size_t i : {0u, 1u, 3u, 4u}) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
  }

  const int hours   = (text[0] - '0') * 10 + (text[1] - '0');
  const int minutes = (text[3] - '0') * 10 + (text[4] - '0');
  if (hours > 23 || minutes > 59) return std::nullopt;
  return hours * 60 + minutes;
}

void ValidateTimeSlots(const google::protobuf::RepeatedPtrField<muse::autonomous::v1::TimeSlot>& slots) {
  for (int i = 0; i < slots.size(); ++i) {
    const auto& slot = slots[i];
    if (!ParseClockMinutes(slot.start()) || !ParseClockMinutes(slot.end())) {
      throw util::ValidationError("time slot " + std::to_string(i) + " has malformed bounds '" + slot.start() + "'-'" + slot.end() +
                                  "', expected HH:MM");
    }
  }
}

bool SlotAdmits(const muse::autonomous::v1::TimeSlot& slot, int minute_of_day) {
  const auto start = ParseClockMinutes(slot.start());
  const auto end   = ParseClockMinutes(slot.end());
  if (!start || !end) return false;

  if (*start > *end) {
    return minute_of_day >= *start || minute_of_day <= *end;
  }
  return minute_of_day >= *start && minute_of_day <= *end;
}

bool WithinTimeSlots(const google::protobuf::RepeatedPtrField<muse::autonomous::v1::TimeSlot>& slots, int minute_of_day) {
  for (const auto& slot : slots) {
    if (slot.enabled() && SlotAdmits(slot, minute_of_day)) return true;
  }
  return false;
}

} // namespace muse::autonomous
