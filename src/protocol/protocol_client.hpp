#pragma once

#include <optional>
#include <string>
#include <vector>

#include "devices/device_common.hpp"

namespace pwrctrl {

// Outlet as reported by a live device.
struct DiscoveredPlug {
  int index = 0;
  std::string name;
  PlugState state = PlugState::Unknown;
};

// Device as reported by a discovery reply.
struct DiscoveredDevice {
  std::string address;
  std::string name;
  std::vector<DiscoveredPlug> plugs;
};

// Wire-level access to the power controllers.
//
// All calls block until the device answered or the client-owned timeout
// expired. Unreachable devices, timeouts and rejected credentials are
// reported by throwing NetworkFailure.
class ProtocolClient {
public:
  virtual ~ProtocolClient() = default;

  // Returns every device that answered within the discovery window. An
  // empty result is not an error.
  virtual std::vector<DiscoveredDevice>
  discover(const Credentials &credentials, const Ports &ports) = 0;

  // Sets the outlet to *desired and returns the state the device reports
  // afterwards. With desired == nullopt the outlet is only queried.
  virtual PlugState switch_plug(const std::string &address, int index,
                                std::optional<PlugState> desired,
                                const Credentials &credentials,
                                const Ports &ports) = 0;

  // Power-cycles the whole device.
  virtual void reset(const std::string &address,
                     const Credentials &credentials, const Ports &ports) = 0;
};

} // namespace pwrctrl
