#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>

#include <evdevw.hpp>
#include <udevw.hpp>

#include <Errors.hpp>
#include <EvdevDeviceProvider.hpp>
#include <FileDescriptor.hpp>
#include <Log.hpp>

using rme::CapabilitySet;
using rme::DeviceIdentity;
using rme::EvdevDeviceProvider;

namespace {

  constexpr const char *EVENT_NODE_PREFIX = "/dev/input/event";
  constexpr std::size_t BITS_PER_LONG = sizeof(unsigned long) * 8;

  struct TypeRange {
    rme::EventType type;
    unsigned int max;
  };

  constexpr TypeRange QUERIED_TYPES[] = {
    { EV_KEY, KEY_MAX },
    { EV_REL, REL_MAX },
    { EV_ABS, ABS_MAX },
    { EV_MSC, MSC_MAX },
    { EV_SW, SW_MAX },
  };

  bool test_bit(const std::vector<unsigned long> &bits, unsigned int bit) {
    return (bits[bit / BITS_PER_LONG] >> (bit % BITS_PER_LONG)) & 1UL;
  }

  // Returns false with errno set when the ioctl fails.
  bool read_bits(int fd, rme::EventType type, unsigned int max, std::vector<unsigned long> &bits) {
    bits.assign(max / BITS_PER_LONG + 1, 0);
    return ioctl(fd, EVIOCGBIT(type, bits.size() * sizeof(unsigned long)), bits.data()) >= 0;
  }

}

std::vector<DeviceIdentity> EvdevDeviceProvider::enumerate() {
  std::vector<std::string> devnodes;
  try {
    auto udev = udevw::Udev::create();
    auto enumerate = udevw::Enumerate::create(udev);
    enumerate.add_match_subsystem("input");

    for (const auto &entry : enumerate.scan_devices()) {
      auto device = udevw::Device::create_from_syspath(udev, entry.name);
      auto devnode = device.get_devnode();

      if (devnode && devnode->rfind(EVENT_NODE_PREFIX, 0) == 0)
        devnodes.push_back(*devnode);
    }
  } catch (const std::exception &e) {
    throw DeviceEnumerationError(std::string("udev enumeration failed: ") + e.what());
  }

  std::vector<DeviceIdentity> identities;
  std::size_t refused = 0;
  for (const auto &devnode : devnodes) {
    FileDescriptor fd(open(devnode.c_str(), O_RDONLY | O_NONBLOCK));
    if (!fd) {
      if (errno == EACCES || errno == EPERM)
        ++refused;
      REMAPEDIT_LOG_WARN("Skipping " << devnode << ": " << std::strerror(errno));
      continue;
    }

    try {
      auto evdev = evdevw::Evdev::create_from_fd(fd.get());
      identities.push_back(DeviceIdentity {
          .path = devnode,
          .name = evdev->get_name(),
          .phys = evdev->get_phys() });
    } catch (const evdevw::Exception &e) {
      REMAPEDIT_LOG_WARN("Invalid device " << devnode << ": " << std::strerror(e.get_error()));
    }
  }

  if (!devnodes.empty() && refused == devnodes.size())
    throw DeviceEnumerationError(
        "Permission denied on every input device; add yourself to the input group");

  REMAPEDIT_LOG_DEBUG("Found " << identities.size() << " of " << devnodes.size() << " event devices");
  return identities;
}

CapabilitySet EvdevDeviceProvider::capabilities(const DeviceIdentity &identity) {
  FileDescriptor fd(open(identity.path.c_str(), O_RDONLY | O_NONBLOCK));
  if (!fd)
    throw DeviceQueryError(identity.path + ": " + std::strerror(errno));

  std::vector<unsigned long> types, codes;
  if (!read_bits(fd.get(), 0, EV_MAX, types))
    throw DeviceQueryError(identity.path + ": " + std::strerror(errno));

  CapabilitySet capabilities;
  for (const auto &range : QUERIED_TYPES) {
    if (!test_bit(types, range.type))
      continue;
    if (!read_bits(fd.get(), range.type, range.max, codes))
      throw DeviceQueryError(identity.path + ": " + std::strerror(errno));

    for (unsigned int code = 0; code <= range.max; ++code) {
      if (test_bit(codes, code))
        capabilities.add(range.type, static_cast<std::uint16_t>(code));
    }
  }
  return capabilities;
}
