#ifndef REMAPEDIT_EVENTCAPTURE_HPP
#define REMAPEDIT_EVENTCAPTURE_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <Device.hpp>
#include <EventQueue.hpp>
#include <EventSource.hpp>

namespace rme {

  // A live subscription to one device. A reader thread turns stream records
  // into sequenced, classified RawEvents and hands them to the sink.
  class CaptureHandle {
  public:
    // Upper bound on how long stop() waits for the reader to notice.
    static constexpr std::chrono::milliseconds POLL_INTERVAL{ 50 };

    // Throws DeviceOpenError; nothing is started on failure.
    CaptureHandle(EventSource &source, const Device &device, CaptureSink &sink);
    ~CaptureHandle();

    CaptureHandle(const CaptureHandle &) = delete;
    CaptureHandle &operator=(const CaptureHandle &) = delete;

    // Joins the reader and closes the device. Nothing reaches the sink once
    // this returns. Safe to call repeatedly or after the device vanished.
    void stop();

    // False once stopped or once the device went away.
    bool is_active() const { return _active.load(); }
    const std::string &get_device_id() const { return _device_id; }

  private:
    std::string _device_id;
    std::unique_ptr<EventStream> _stream;
    CaptureSink &_sink;

    std::atomic<bool> _stop_requested;
    std::atomic<bool> _active;
    std::mutex _stop_mutex;

    // Reader thread state.
    Sequence _next_sequence;
    TimePoint _last_timestamp;

    std::thread _thread;

    void run();
    void deliver_event(const InputRecord &record);
    void deliver_gap();
  };

  std::unique_ptr<CaptureHandle> start_capture(EventSource &source, const Device &device,
                                               CaptureSink &sink);

}

#endif //REMAPEDIT_EVENTCAPTURE_HPP
