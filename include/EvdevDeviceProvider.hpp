#ifndef REMAPEDIT_EVDEVDEVICEPROVIDER_HPP
#define REMAPEDIT_EVDEVDEVICEPROVIDER_HPP

#include <Device.hpp>

namespace rme {

  // /dev/input/event* nodes found through udev, described through libevdev.
  class EvdevDeviceProvider : public DeviceProvider {
  public:
    std::vector<DeviceIdentity> enumerate() override;
    CapabilitySet capabilities(const DeviceIdentity &identity) override;
  };

}

#endif //REMAPEDIT_EVDEVDEVICEPROVIDER_HPP
