#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "../protocol/protocol_client.hpp"
#include "device.hpp"
#include "device_common.hpp"

namespace pwrctrl {

// (slot index, label) pair used to create a device's outlets
struct PlugDef {
  int index = 0;
  std::string name;
};

// All devices known to one session (the "plug master").
//
// Device addresses are unique. Devices are never removed; references and
// pointers handed out by the search functions stay valid for the lifetime
// of the registry.
class Registry {
public:
  Registry(ProtocolClient &client, Credentials credentials, Ports ports);

  Registry(const Registry &) = delete;
  Registry &operator=(const Registry &) = delete;

  const Credentials &credentials() const { return credentials_; }
  const Ports &ports() const { return ports_; }
  ProtocolClient &client() const { return client_; }

  // Devices in creation/discovery order
  const std::vector<std::unique_ptr<Device>> &devices() const {
    return devices_;
  }

  // Registers a device with all outlets in Unknown state.
  // Throws DuplicateAddress or DuplicatePlugIndex; the registry is left
  // unchanged in both cases.
  Device &create_device(const std::string &address, const std::string &name,
                        const std::vector<PlugDef> &plugs);

  // Queries the network and merges the answers by address. Known devices
  // get their name and outlets refreshed, unknown ones are appended.
  // Returns the number of devices that answered.
  std::size_t discover();

  // Devices whose name or address matches. Never throws.
  std::vector<Device *> search_device(const std::string &pattern) const;

  // Matching outlets of every device, in registry order. Never throws.
  std::vector<Plug *> search_plug(const std::string &pattern) const;

  // Returns nullptr for an unknown address.
  Device *find_device(const std::string &address) const;

  std::size_t plug_count() const;

private:
  void merge(const DiscoveredDevice &found);

  ProtocolClient &client_;
  Credentials credentials_;
  Ports ports_;
  std::vector<std::unique_ptr<Device>> devices_;
};

} // namespace pwrctrl
