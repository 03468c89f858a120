#pragma once

#include <string>

#include "device_common.hpp"

namespace pwrctrl {

class Device;

// One switchable outlet. Owned by its Device.
class Plug {
public:
  Plug(Device &device, int index, std::string name);

  Plug(const Plug &) = delete;
  Plug &operator=(const Plug &) = delete;

  int index() const { return index_; }
  const std::string &name() const { return name_; }
  PlugState state() const { return state_; }
  Device &device() const { return device_; }

  // Commands the outlet to On or Off. The stored state only changes once
  // the device confirmed the command; NetworkFailure leaves it untouched.
  // Throws std::invalid_argument for PlugState::Unknown.
  void switch_to(PlugState desired);

  // Asks the device for the current outlet state and stores it.
  PlugState refresh();

  // Discovery merge
  void set_name(const std::string &name) { name_ = name; }
  void set_state(PlugState state) { state_ = state; }

private:
  Device &device_;
  int index_;
  std::string name_;
  PlugState state_ = PlugState::Unknown;
};

} // namespace pwrctrl
