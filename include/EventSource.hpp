#ifndef REMAPEDIT_EVENTSOURCE_HPP
#define REMAPEDIT_EVENTSOURCE_HPP

#include <chrono>
#include <cstdint>
#include <memory>

#include <Device.hpp>
#include <RawEvent.hpp>

namespace rme {

  struct InputRecord {
    EventType type;
    std::uint16_t code;
    std::int32_t value;
    TimePoint timestamp;
  };

  // One open subscription to a device's raw event stream. Owned and read by a
  // single capture thread.
  class EventStream {
  public:
    enum class ReadStatus {
      Event,
      Dropped,  // kernel buffer overrun, events were lost
      Timeout,
      Closed,   // device vanished
    };

    virtual ~EventStream() = default;

    // Waits at most `timeout`; fills `record` only on ReadStatus::Event.
    virtual ReadStatus read(InputRecord &record, std::chrono::milliseconds timeout) = 0;
  };

  class EventSource {
  public:
    virtual ~EventSource() = default;

    // Throws DeviceOpenError.
    virtual std::unique_ptr<EventStream> open(const Device &device) = 0;
  };

}

#endif //REMAPEDIT_EVENTSOURCE_HPP
