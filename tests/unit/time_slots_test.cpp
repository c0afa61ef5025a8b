#include "internal/autonomous/time_slots.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace v1 = muse::autonomous::v1;
using muse::autonomous::ParseClockMinutes;
using muse::autonomous::SlotAdmits;
using muse::autonomous::WithinTimeSlots;

v1::TimeSlot Slot(const std::string& start, const std::string& end, bool enabled = true) {
  v1::TimeSlot slot;
  slot.set_start(start);
  slot.set_end(end);
  slot.set_enabled(enabled);
  return slot;
}

int At(int hours, int minutes) {
  return hours * 60 + minutes;
}

void TestParseClockMinutes() {
  assert(ParseClockMinutes("00:00") == 0);
  assert(ParseClockMinutes("09:30") == 570);
  assert(ParseClockMinutes("23:59") == 1439);
  assert(!ParseClockMinutes("24:00"));
  assert(!ParseClockMinutes("12:60"));
  assert(!ParseClockMinutes("9:30"));
  assert(!ParseClockMinutes("09-30"));
  assert(!ParseClockMinutes(""));
}

void TestDaySlotBoundsAreInclusive() {
  const auto day = Slot("09:00", "18:00");
  assert(SlotAdmits(day, At(9, 0)));
  assert(SlotAdmits(day, At(12, 0)));
  assert(SlotAdmits(day, At(18, 0)));
  assert(!SlotAdmits(day, At(8, 59)));
  assert(!SlotAdmits(day, At(18, 1)));
}

void TestOvernightSlotWrapsMidnight() {
  const auto night = Slot("22:00", "06:00");
  assert(SlotAdmits(night, At(23, 30)));
  assert(SlotAdmits(night, At(2, 0)));
  assert(SlotAdmits(night, At(0, 0)));
  assert(SlotAdmits(night, At(6, 0)));
  assert(!SlotAdmits(night, At(12, 0)));
  assert(!SlotAdmits(night, At(21, 59)));
}

void TestOnlyEnabledSlotsCount() {
  google::protobuf::RepeatedPtrField<v1::TimeSlot> slots;
  *slots.Add() = Slot("09:00", "18:00", true);
  *slots.Add() = Slot("22:00", "06:00", false);

  assert(WithinTimeSlots(slots, At(10, 0)));
  assert(!WithinTimeSlots(slots, At(23, 0)));

  slots.Mutable(1)->set_enabled(true);
  assert(WithinTimeSlots(slots, At(23, 0)));
}

void TestNoSlotsAdmitsNothing() {
  google::protobuf::RepeatedPtrField<v1::TimeSlot> slots;
  assert(!WithinTimeSlots(slots, At(12, 0)));
}

void TestMalformedSlotIsRejected() {
  google::protobuf::RepeatedPtrField<v1::TimeSlot> slots;
  *slots.Add() = Slot("09:00", "18:00");
  *slots.Add() = Slot("25:00", "06:00");

  bool threw = false;
  try {
    muse::autonomous::ValidateTimeSlots(slots);
  } catch (const muse::util::ValidationError& e) {
    threw = std::string(e.what()).find("time slot 1") != std::string::npos;
  }
  assert(threw);
  assert(!SlotAdmits(slots.Get(1), At(1, 0)));
}

} // namespace

int main() {
  TestParseClockMinutes();
  TestDaySlotBoundsAreInclusive();
  TestOvernightSlotWrapsMidnight();
  TestOnlyEnabledSlotsCount();
  TestNoSlotsAdmitsNothing();
  TestMalformedSlotIsRejected();

  std::cout << "muse_unit_time_slots: pass\n";
  return 0;
}
