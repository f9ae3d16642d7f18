#include <cerrno>
#include <cstring>
#include <unordered_set>

#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>

#include <Errors.hpp>
#include <EvdevEventSource.hpp>
#include <Log.hpp>

using rme::EvdevEventSource;
using rme::EvdevEventStream;
using rme::EventStream;

namespace {

  using ReadFlags = std::unordered_set<evdevw::ReadFlag>;

  const ReadFlags READ_FLAGS_NORMAL = { evdevw::ReadFlag::Normal };
  const ReadFlags READ_FLAGS_SYNC = { evdevw::ReadFlag::Sync };

  // Non-zero when someone else holds an exclusive grab.
  int test_grab(int fd) {
    const auto rc = ioctl(fd, EVIOCGRAB, 1);
    if (rc == 0)
      ioctl(fd, EVIOCGRAB, 0);
    return rc;
  }

}

EvdevEventStream::EvdevEventStream(FileDescriptor fd, std::shared_ptr<evdevw::Evdev> evdev)
  : _fd(std::move(fd)),
    _evdev(std::move(evdev)),
    _needs_sync(false)
{
}

EvdevEventStream::~EvdevEventStream() = default;

EventStream::ReadStatus EvdevEventStream::read(InputRecord &record, std::chrono::milliseconds timeout) {
  // Resync events are already queued inside libevdev.
  if (!_needs_sync) {
    pollfd pfd { _fd.get(), POLLIN, 0 };
    const auto rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
      if (errno == EINTR)
        return ReadStatus::Timeout;
      throw DeviceOpenError(std::string("poll failed: ") + std::strerror(errno));
    }
    if (rc == 0)
      return ReadStatus::Timeout;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
      return ReadStatus::Closed;
  }

  try {
    auto ret = _evdev->next_event(_needs_sync ? READ_FLAGS_SYNC : READ_FLAGS_NORMAL);
    if (!ret) {
      _needs_sync = false;
      return ReadStatus::Timeout;
    }

    const auto &[status, event] = *ret;
    const bool dropped = !_needs_sync && status == evdevw::ReadStatus::Sync;
    _needs_sync = (status == evdevw::ReadStatus::Sync);
    if (dropped)
      return ReadStatus::Dropped;

    std::visit([&](const auto &e) {
      record.type = e.get_raw_type();
      record.code = e.get_raw_code();
      record.value = e.get_raw_value();
    }, event);
    // Kernel event times are wall-clock; captures are stamped on read with the
    // steady clock.
    record.timestamp = std::chrono::steady_clock::now();
    return ReadStatus::Event;
  } catch (const evdevw::Exception &e) {
    if (e.get_error() == ENODEV)
      return ReadStatus::Closed;
    throw;
  }
}

std::unique_ptr<EventStream> EvdevEventSource::open(const Device &device) {
  FileDescriptor fd(::open(device.id.c_str(), O_RDONLY | O_NONBLOCK));
  if (!fd) {
    if (errno == EACCES || errno == EPERM)
      throw DeviceOpenError(device.id + ": permission denied");
    throw DeviceOpenError(device.id + ": " + std::strerror(errno));
  }

  if (test_grab(fd.get()) != 0) {
    if (errno == EBUSY)
      throw DeviceOpenError(device.id + " is grabbed by another process");
    throw DeviceOpenError(device.id + ": " + std::strerror(errno));
  }

  try {
    auto evdev = evdevw::Evdev::create_from_fd(fd.get());
    REMAPEDIT_LOG_INFO("Opened " << device.label << " for capture");
    return std::make_unique<EvdevEventStream>(std::move(fd), std::move(evdev));
  } catch (const evdevw::Exception &e) {
    throw DeviceOpenError(device.id + ": " + std::strerror(e.get_error()));
  }
}
