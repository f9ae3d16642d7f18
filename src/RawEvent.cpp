#include <utility>

#include <linux/input-event-codes.h>

#include <RawEvent.hpp>

using rme::EventCategory;
using rme::RawEvent;

EventCategory rme::classify(EventType type, std::uint16_t code, std::int32_t value) {
  (void) code;

  switch (type) {
    case EV_KEY:
      switch (value) {
        case 0: return EventCategory::KeyUp;
        case 1: return EventCategory::KeyDown;
        case 2: return EventCategory::KeyRepeat;
        default: return EventCategory::SyncOther;
      }
    case EV_REL:
    case EV_ABS:
      return EventCategory::AxisMove;
    default:
      return EventCategory::SyncOther;
  }
}

std::string_view rme::category_name(EventCategory category) {
  switch (category) {
    case EventCategory::KeyDown: return "key-down";
    case EventCategory::KeyUp: return "key-up";
    case EventCategory::KeyRepeat: return "key-repeat";
    case EventCategory::AxisMove: return "axis-move";
    case EventCategory::SyncOther: return "sync/other";
  }
  return "sync/other";
}

RawEvent RawEvent::create(std::string device_id, EventType type, std::uint16_t code,
                          std::int32_t value, TimePoint timestamp, Sequence sequence) {
  return RawEvent {
    std::move(device_id), type, code, value, timestamp, sequence,
    classify(type, code, value) };
}

std::string RawEvent::describe() const {
  return event_code_name(type, code) + " " + std::to_string(value);
}

rme::Sequence rme::sequence_of(const CaptureItem &item) {
  if (const auto *event = std::get_if<RawEvent>(&item))
    return event->sequence;
  return std::get<CaptureGap>(item).first_missing;
}
