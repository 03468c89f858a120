#include "plug.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "device.hpp"
#include "registry.hpp"

namespace pwrctrl {

Plug::Plug(Device &device, int index, std::string name)
    : device_(device), index_(index), name_(std::move(name)) {}

void Plug::switch_to(PlugState desired) {
  if (desired == PlugState::Unknown) {
    throw std::invalid_argument("plug can only be switched on or off");
  }

  Registry &registry = device_.registry();
  const PlugState reported = registry.client().switch_plug(
      device_.address(), index_, desired, registry.credentials(),
      registry.ports());
  if (is_known(reported) && reported != desired) {
    std::cerr << "[Plug] Warning: " << device_.address() << " plug "
              << index_ << " reported '" << to_string(reported)
              << "' after switching " << to_string(desired) << std::endl;
  }
  state_ = desired;
}

PlugState Plug::refresh() {
  Registry &registry = device_.registry();
  state_ = registry.client().switch_plug(device_.address(), index_,
                                         std::nullopt, registry.credentials(),
                                         registry.ports());
  return state_;
}

} // namespace pwrctrl
