#ifndef REMAPEDIT_EVDEVEVENTSOURCE_HPP
#define REMAPEDIT_EVDEVEVENTSOURCE_HPP

#include <memory>

#include <evdevw.hpp>

#include <EventSource.hpp>
#include <FileDescriptor.hpp>

namespace rme {

  class EvdevEventStream : public EventStream {
  public:
    EvdevEventStream(FileDescriptor fd, std::shared_ptr<evdevw::Evdev> evdev);
    ~EvdevEventStream() override;

    ReadStatus read(InputRecord &record, std::chrono::milliseconds timeout) override;

  private:
    FileDescriptor _fd;
    std::shared_ptr<evdevw::Evdev> _evdev;
    bool _needs_sync;
  };

  // Opens devices for observation only; the device is never grabbed, so the
  // daemon and the rest of the desktop keep receiving its events.
  class EvdevEventSource : public EventSource {
  public:
    std::unique_ptr<EventStream> open(const Device &device) override;
  };

}

#endif //REMAPEDIT_EVDEVEVENTSOURCE_HPP
