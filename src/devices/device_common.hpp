#pragma once

#include <cstdint>
#include <string>

namespace pwrctrl {

// -----------------------------
// Plug state
// -----------------------------

// Unknown means the device never reported a state for the outlet.
enum class PlugState { Unknown, Off, On };

static inline const char *to_string(PlugState state) {
  switch (state) {
  case PlugState::On:
    return "on";
  case PlugState::Off:
    return "off";
  case PlugState::Unknown:
    break;
  }
  return "unknown";
}

static inline bool is_known(PlugState state) {
  return state != PlugState::Unknown;
}

// -----------------------------
// Session parameters (opaque to the registry, used by the protocol client)
// -----------------------------

struct Credentials {
  std::string user;
  std::string password;
};

struct Ports {
  uint16_t in = 0;  // local port the devices answer to
  uint16_t out = 0; // device port commands are sent to
};

} // namespace pwrctrl
