#ifndef REMAPEDIT_DEVICECATALOG_HPP
#define REMAPEDIT_DEVICECATALOG_HPP

#include <optional>
#include <vector>

#include <Device.hpp>
#include <RuleSet.hpp>

namespace rme {

  // Snapshot of the input devices; refreshed only by calling enumerate()
  // again.
  class DeviceCatalog {
  public:
    explicit DeviceCatalog(DeviceProvider &provider);

    // Throws DeviceEnumerationError. A device that vanishes before its
    // capabilities are read is kept, marked unavailable.
    const std::vector<Device> &enumerate();

    // Throws DeviceQueryError.
    CapabilitySet capabilities(const Device &device);

    const std::vector<Device> &get_devices() const { return _devices; }
    std::optional<Device> find(const std::string &id) const;

    // The device the daemon would pick for `selector`.
    std::optional<Device> resolve(const DeviceSelector &selector) const;

  private:
    DeviceProvider &_provider;
    std::vector<Device> _devices;
  };

}

#endif //REMAPEDIT_DEVICECATALOG_HPP
