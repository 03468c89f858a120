#include "registry.hpp"

#include <iostream>
#include <set>
#include <utility>

#include "../errors.hpp"
#include "name_match.hpp"

namespace pwrctrl {

Registry::Registry(ProtocolClient &client, Credentials credentials,
                   Ports ports)
    : client_(client), credentials_(std::move(credentials)), ports_(ports) {}

Device &Registry::create_device(const std::string &address,
                                const std::string &name,
                                const std::vector<PlugDef> &plugs) {
  if (find_device(address) != nullptr) {
    throw DuplicateAddress(address);
  }

  // Validate before anything is appended
  std::set<int> indices;
  for (const auto &def : plugs) {
    if (!indices.insert(def.index).second) {
      throw DuplicatePlugIndex(address, def.index);
    }
  }

  auto device = std::make_unique<Device>(*this, address, name);
  for (const auto &def : plugs) {
    device->add_plug(def.index, def.name);
  }

  devices_.push_back(std::move(device));
  return *devices_.back();
}

void Registry::merge(const DiscoveredDevice &found) {
  Device *device = find_device(found.address);
  if (device == nullptr) {
    devices_.push_back(std::make_unique<Device>(*this, found.address,
                                                found.name));
    device = devices_.back().get();
  } else {
    device->set_name(found.name);
  }

  for (const auto &reported : found.plugs) {
    Plug *plug = device->find_plug(reported.index);
    if (plug == nullptr) {
      plug = &device->add_plug(reported.index, reported.name);
    } else {
      plug->set_name(reported.name);
    }
    plug->set_state(reported.state);
  }
}

std::size_t Registry::discover() {
  const auto found = client_.discover(credentials_, ports_);

  // The same device may answer more than once within one window
  std::set<std::string> seen;
  for (const auto &d : found) {
    if (!seen.insert(d.address).second) {
      continue;
    }
    merge(d);
  }

  std::cerr << "[Registry] Discovered " << seen.size() << " device(s)"
            << std::endl;
  return seen.size();
}

std::vector<Device *>
Registry::search_device(const std::string &pattern) const {
  std::vector<Device *> result;
  for (const auto &device : devices_) {
    if (matches(pattern, device->name()) ||
        matches(pattern, device->address())) {
      result.push_back(device.get());
    }
  }
  return result;
}

std::vector<Plug *> Registry::search_plug(const std::string &pattern) const {
  std::vector<Plug *> result;
  for (const auto &device : devices_) {
    const auto found = device->search_plug(pattern);
    result.insert(result.end(), found.begin(), found.end());
  }
  return result;
}

Device *Registry::find_device(const std::string &address) const {
  for (const auto &device : devices_) {
    if (device->address() == address) {
      return device.get();
    }
  }
  return nullptr;
}

std::size_t Registry::plug_count() const {
  std::size_t count = 0;
  for (const auto &device : devices_) {
    count += device->plugs().size();
  }
  return count;
}

} // namespace pwrctrl
