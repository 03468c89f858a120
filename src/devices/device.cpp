#include "device.hpp"

#include <utility>

#include "../errors.hpp"
#include "name_match.hpp"
#include "registry.hpp"

namespace pwrctrl {

Device::Device(Registry &registry, std::string address, std::string name)
    : registry_(registry), address_(std::move(address)),
      name_(std::move(name)) {}

Plug &Device::add_plug(int index, const std::string &name) {
  if (find_plug(index) != nullptr) {
    throw DuplicatePlugIndex(address_, index);
  }
  plugs_.push_back(std::make_unique<Plug>(*this, index, name));
  return *plugs_.back();
}

Plug *Device::find_plug(int index) const {
  for (const auto &plug : plugs_) {
    if (plug->index() == index) {
      return plug.get();
    }
  }
  return nullptr;
}

std::vector<Plug *> Device::search_plug(const std::string &pattern) const {
  std::vector<Plug *> result;
  for (const auto &plug : plugs_) {
    if (matches(pattern, plug->name())) {
      result.push_back(plug.get());
    }
  }
  return result;
}

void Device::reset() {
  registry_.client().reset(address_, registry_.credentials(),
                           registry_.ports());
}

} // namespace pwrctrl
