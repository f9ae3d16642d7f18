#ifndef REMAPEDIT_RAWEVENT_HPP
#define REMAPEDIT_RAWEVENT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <KeyCodes.hpp>

namespace rme {

  using TimePoint = std::chrono::steady_clock::time_point;
  using Sequence = std::uint64_t;

  enum class EventCategory {
    KeyDown,
    KeyUp,
    KeyRepeat,
    AxisMove,
    SyncOther,
  };

  EventCategory classify(EventType type, std::uint16_t code, std::int32_t value);
  std::string_view category_name(EventCategory category);

  struct RawEvent {
    std::string device_id;
    EventType type;
    std::uint16_t code;
    std::int32_t value;
    TimePoint timestamp;
    Sequence sequence;
    EventCategory category;

    static RawEvent create(std::string device_id, EventType type, std::uint16_t code,
                           std::int32_t value, TimePoint timestamp, Sequence sequence);

    // "KEY_CAPSLOCK 1"
    std::string describe() const;
  };

  // Events lost between two delivered items. A count of 0 means the kernel
  // overran its buffer and the number is unknown.
  struct CaptureGap {
    Sequence first_missing;
    std::uint64_t missing_count;
  };

  using CaptureItem = std::variant<RawEvent, CaptureGap>;

  Sequence sequence_of(const CaptureItem &item);

}

#endif //REMAPEDIT_RAWEVENT_HPP
