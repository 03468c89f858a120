#pragma once

#include <memory>
#include <string>
#include <vector>

#include "plug.hpp"

namespace pwrctrl {

class Registry;

// A network-addressable power strip. Owned by the Registry.
class Device {
public:
  Device(Registry &registry, std::string address, std::string name);

  Device(const Device &) = delete;
  Device &operator=(const Device &) = delete;

  const std::string &address() const { return address_; }
  const std::string &name() const { return name_; }
  void set_name(const std::string &name) { name_ = name; }

  Registry &registry() const { return registry_; }

  // Plugs in insertion order
  const std::vector<std::unique_ptr<Plug>> &plugs() const { return plugs_; }

  // Appends an outlet in Unknown state.
  // Throws DuplicatePlugIndex if the slot is already taken.
  Plug &add_plug(int index, const std::string &name);

  // Returns nullptr if no outlet sits in that slot.
  Plug *find_plug(int index) const;

  // Every outlet of this device whose name matches. Never throws.
  std::vector<Plug *> search_plug(const std::string &pattern) const;

  // Power-cycles the device. Plug states are left as they were; callers
  // that need fresh states re-query. NetworkFailure propagates.
  void reset();

private:
  Registry &registry_;
  std::string address_;
  std::string name_;
  std::vector<std::unique_ptr<Plug>> plugs_;
};

} // namespace pwrctrl
