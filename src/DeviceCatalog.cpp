#include <algorithm>
#include <cctype>

#include <DeviceCatalog.hpp>
#include <Errors.hpp>
#include <Log.hpp>

using rme::Device;
using rme::DeviceCatalog;

namespace {

  unsigned event_number_from_path(const std::string &path) {
    const auto idx = path.rfind("event");
    if (idx == std::string::npos)
      return 0;

    unsigned number = 0;
    for (auto i = idx + 5; i < path.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(path[i])))
        return 0;
      number = number * 10 + static_cast<unsigned>(path[i] - '0');
    }
    return number;
  }

}

DeviceCatalog::DeviceCatalog(DeviceProvider &provider)
  : _provider(provider)
{
}

const std::vector<Device> &DeviceCatalog::enumerate() {
  const auto identities = _provider.enumerate();

  std::vector<Device> devices;
  devices.reserve(identities.size());
  for (const auto &identity : identities) {
    try {
      devices.push_back(Device::from_identity(identity, _provider.capabilities(identity)));
    } catch (const DeviceQueryError &e) {
      REMAPEDIT_LOG_WARN("Device " << identity.path << " became unavailable: " << e.what());
      auto device = Device::from_identity(identity, {});
      device.available = false;
      devices.push_back(std::move(device));
    }
  }

  // Order by name; devices sharing a name are ordered by event node number.
  std::sort(devices.begin(), devices.end(), [](const Device &a, const Device &b) {
    if (a.name != b.name)
      return a.name < b.name;
    return event_number_from_path(a.id) < event_number_from_path(b.id);
  });

  REMAPEDIT_LOG_DEBUG("Enumerated " << devices.size() << " input devices");
  _devices = std::move(devices);
  return _devices;
}

rme::CapabilitySet DeviceCatalog::capabilities(const Device &device) {
  return _provider.capabilities(DeviceIdentity { device.id, device.name, device.phys });
}

std::optional<Device> DeviceCatalog::find(const std::string &id) const {
  const auto it = std::find_if(_devices.begin(), _devices.end(),
      [&](const Device &device) { return device.id == id; });
  if (it == _devices.end())
    return std::nullopt;
  return *it;
}

std::optional<Device> DeviceCatalog::resolve(const DeviceSelector &selector) const {
  if (selector.empty())
    return std::nullopt;

  std::vector<const Device *> matching;
  for (const auto &device : _devices) {
    if (selector.matches(device))
      matching.push_back(&device);
  }

  if (matching.empty())
    return std::nullopt;

  if (matching.size() > 1 && !selector.phys) {
    REMAPEDIT_LOG_WARN("The following devices match name `" << selector.name << "`:");
    for (const auto *device : matching)
      REMAPEDIT_LOG_WARN("  " << device->label << " phys=" << device->phys.value_or(""));
    REMAPEDIT_LOG_WARN("The first entry will be used. Set phys to pick another one, for example `phys = \""
                       << matching[1]->phys.value_or("") << "\"` for the second entry.");
  }

  return *matching.front();
}
