#ifndef REMAPEDIT_DEVICE_HPP
#define REMAPEDIT_DEVICE_HPP

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <KeyCodes.hpp>

namespace rme {

  class CapabilitySet {
  public:
    void add(EventType type, std::uint16_t code);

    bool supports(EventType type, std::uint16_t code) const;
    bool supports_key(KeyCode code) const;

    // Empty set for types the device does not report.
    const std::set<std::uint16_t> &codes(EventType type) const;
    std::vector<EventType> types() const;

    bool empty() const { return _codes.empty(); }

    bool operator==(const CapabilitySet &other) const { return _codes == other._codes; }

  private:
    std::map<EventType, std::set<std::uint16_t>> _codes;
  };

  // What the OS reports before capabilities are queried.
  struct DeviceIdentity {
    std::string path;
    std::string name;
    std::optional<std::string> phys;
  };

  struct Device {
    std::string id;
    std::string name;
    std::optional<std::string> phys;
    std::string label;
    CapabilitySet capabilities;
    bool available = true;

    static Device from_identity(const DeviceIdentity &identity, CapabilitySet capabilities);
  };

  class DeviceProvider {
  public:
    virtual ~DeviceProvider() = default;

    // Throws DeviceEnumerationError.
    virtual std::vector<DeviceIdentity> enumerate() = 0;
    // Throws DeviceQueryError when the device is gone.
    virtual CapabilitySet capabilities(const DeviceIdentity &identity) = 0;
  };

}

#endif //REMAPEDIT_DEVICE_HPP
