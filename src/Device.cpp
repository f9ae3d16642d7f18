#include <utility>

#include <linux/input-event-codes.h>

#include <Device.hpp>

using rme::CapabilitySet;
using rme::Device;

void CapabilitySet::add(EventType type, std::uint16_t code) {
  _codes[type].insert(code);
}

bool CapabilitySet::supports(EventType type, std::uint16_t code) const {
  const auto it = _codes.find(type);
  return it != _codes.end() && it->second.count(code) != 0;
}

bool CapabilitySet::supports_key(KeyCode code) const {
  return supports(EV_KEY, code);
}

const std::set<std::uint16_t> &CapabilitySet::codes(EventType type) const {
  static const std::set<std::uint16_t> NONE;

  const auto it = _codes.find(type);
  return it == _codes.end() ? NONE : it->second;
}

std::vector<rme::EventType> CapabilitySet::types() const {
  std::vector<EventType> result;
  for (const auto &[type, _] : _codes)
    result.push_back(type);
  return result;
}

Device Device::from_identity(const DeviceIdentity &identity, CapabilitySet capabilities) {
  Device device;
  device.id = identity.path;
  device.name = identity.name;
  device.phys = identity.phys;
  device.label = (identity.name.empty() ? std::string("(unnamed)") : identity.name)
      + " (" + identity.path + ")";
  device.capabilities = std::move(capabilities);
  return device;
}
