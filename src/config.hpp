#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "devices/registry.hpp"

namespace pwrctrl {

// Reserved section holding credentials and ports
constexpr const char *kGeneralSection = "GENERAL";

// Outlet entries of a device section are named "plug_<index>"
constexpr const char *kPlugPrefix = "plug_";

// Values of the GENERAL section. The member initializers are the built-in
// fallbacks used when neither the file nor the command line provides one.
struct GeneralSettings {
  std::string user = "admin";
  std::string password = "anel";
  uint16_t pin = 75;
  uint16_t pout = 77;
};

// One device section, ready for Registry::create_device
struct DeviceSpec {
  std::string address;
  std::string name;
  std::vector<PlugDef> plugs; // ascending by index
};

// Complete configuration file contents
struct PwrctrlConfig {
  std::string config_file_path;
  bool file_found = false;
  GeneralSettings general;
  std::vector<DeviceSpec> devices;
};

// Per-user default location ($HOME/.pwrctrl.yaml)
std::string default_config_path();

// Returns the slot index if key is "plug_" followed by decimal digits.
std::optional<int> parse_plug_key(const std::string &key);

// Builds the configuration from an already parsed document. General values
// missing from the document fall back to defaults field by field. Device
// sections without a usable 'name' are skipped with a warning.
// Throws ConfigError on structural problems (root or GENERAL not a map,
// non-numeric or out-of-range port).
PwrctrlConfig parse_config(const YAML::Node &root,
                           const GeneralSettings &defaults = GeneralSettings{});

// Loads the configuration file. A missing file is not an error: the result
// carries the defaults and no devices.
// Throws ConfigError if the file exists but cannot be read or parsed.
PwrctrlConfig load_config(const std::string &path,
                          const GeneralSettings &defaults = GeneralSettings{});

// Same as load_config for in-memory text
PwrctrlConfig
load_config_from_string(const std::string &text,
                        const GeneralSettings &defaults = GeneralSettings{});

// Creates one device per spec. Specs rejected by the registry (duplicate
// address or plug index) are logged and skipped.
// Returns the number of devices created.
int bootstrap_registry(Registry &registry, const PwrctrlConfig &config);

// Serializes credentials, ports and every device of the registry.
std::string emit_config(const Registry &registry);

// Overwrites path with emit_config(registry).
// Throws ConfigError if the file cannot be written.
void save_config(const Registry &registry, const std::string &path);

} // namespace pwrctrl
