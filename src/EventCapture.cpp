#include <algorithm>

#include <EventCapture.hpp>
#include <Log.hpp>

using rme::CaptureHandle;

CaptureHandle::CaptureHandle(EventSource &source, const Device &device, CaptureSink &sink)
  : _device_id(device.id),
    _stream(source.open(device)),
    _sink(sink),
    _stop_requested(false),
    _active(true),
    _next_sequence(1),
    _last_timestamp(TimePoint::min())
{
  REMAPEDIT_LOG_INFO("Capturing events from " << device.label);
  _thread = std::thread(&CaptureHandle::run, this);
}

CaptureHandle::~CaptureHandle() {
  stop();
}

void CaptureHandle::stop() {
  std::lock_guard<std::mutex> lock(_stop_mutex);

  _stop_requested = true;
  if (_thread.joinable())
    _thread.join();

  if (_stream) {
    _stream.reset();
    REMAPEDIT_LOG_INFO("Stopped capturing events from " << _device_id);
  }
  _active = false;
}

void CaptureHandle::run() {
  while (!_stop_requested) {
    InputRecord record {};

    EventStream::ReadStatus status;
    try {
      status = _stream->read(record, POLL_INTERVAL);
    } catch (const std::exception &e) {
      REMAPEDIT_LOG_ERROR("Reading " << _device_id << " failed: " << e.what());
      break;
    }

    if (_stop_requested)
      break;

    switch (status) {
      case EventStream::ReadStatus::Event:
        deliver_event(record);
        break;
      case EventStream::ReadStatus::Dropped:
        REMAPEDIT_LOG_WARN("Kernel dropped events from " << _device_id);
        deliver_gap();
        break;
      case EventStream::ReadStatus::Timeout:
        break;
      case EventStream::ReadStatus::Closed:
        REMAPEDIT_LOG_WARN("Device " << _device_id << " is disconnected");
        _active = false;
        return;
    }
  }
  _active = false;
}

void CaptureHandle::deliver_event(const InputRecord &record) {
  // Timestamps never go backwards within one capture.
  _last_timestamp = std::max(_last_timestamp, record.timestamp);

  auto event = RawEvent::create(_device_id, record.type, record.code, record.value,
                                _last_timestamp, _next_sequence++);
  REMAPEDIT_LOG_TRACE("#" << event.sequence << " " << event.describe());
  _sink.deliver(std::move(event));
}

void CaptureHandle::deliver_gap() {
  _sink.deliver(CaptureGap { _next_sequence++, 0 });
}

std::unique_ptr<CaptureHandle> rme::start_capture(EventSource &source, const Device &device,
                                                  CaptureSink &sink) {
  return std::make_unique<CaptureHandle>(source, device, sink);
}
