#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>

#include "errors.hpp"

namespace pwrctrl {

namespace fs = std::filesystem;

std::string default_config_path() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return ".pwrctrl.yaml";
  }
  return (fs::path(home) / ".pwrctrl.yaml").string();
}

std::optional<int> parse_plug_key(const std::string &key) {
  static const std::regex pattern(R"(^plug_([0-9]+)$)");

  std::smatch m;
  if (!std::regex_match(key, m, pattern)) {
    return std::nullopt;
  }

  // Anything that does not fit an int is not a slot index
  const std::string digits = m[1].str();
  try {
    std::size_t used = 0;
    const long long value = std::stoll(digits, &used);
    if (used != digits.size() || value > 0x7fffffffLL) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

// Parse a scalar string field; returns nullopt if absent or not a scalar
static std::optional<std::string> scalar_string(const YAML::Node &node) {
  if (!node || !node.IsScalar()) {
    return std::nullopt;
  }
  return node.as<std::string>();
}

static uint16_t parse_port(const YAML::Node &node, const std::string &key) {
  int value = 0;
  try {
    value = node.as<int>();
  } catch (const YAML::Exception &) {
    throw ConfigError("[CONFIG] " + std::string(kGeneralSection) + "." + key +
                      " must be an integer");
  }
  if (value < 1 || value > 65535) {
    throw ConfigError("[CONFIG] " + std::string(kGeneralSection) + "." + key +
                      " must be in range [1, 65535]");
  }
  return static_cast<uint16_t>(value);
}

static GeneralSettings parse_general(const YAML::Node &section,
                                     const GeneralSettings &defaults) {
  GeneralSettings general = defaults;
  if (!section) {
    return general;
  }
  if (!section.IsMap()) {
    throw ConfigError("[CONFIG] '" + std::string(kGeneralSection) +
                      "' section must be a map");
  }

  if (auto user = scalar_string(section["user"])) {
    general.user = *user;
  }
  if (auto password = scalar_string(section["password"])) {
    general.password = *password;
  }
  if (section["pin"]) {
    general.pin = parse_port(section["pin"], "pin");
  }
  if (section["pout"]) {
    general.pout = parse_port(section["pout"], "pout");
  }
  return general;
}

// Returns nullopt (after logging) if the section cannot describe a device
static std::optional<DeviceSpec> parse_device(const std::string &address,
                                              const YAML::Node &section) {
  if (!section.IsMap()) {
    std::cerr << "[CONFIG] Warning: section '" << address
              << "' is not a map, skipping" << std::endl;
    return std::nullopt;
  }

  auto name = scalar_string(section["name"]);
  if (!name) {
    std::cerr << "[CONFIG] Warning: device '" << address
              << "' without name in configuration, skipping" << std::endl;
    return std::nullopt;
  }

  DeviceSpec spec;
  spec.address = address;
  spec.name = *name;

  for (const auto &kv : section) {
    const std::string key = kv.first.as<std::string>();
    const auto index = parse_plug_key(key);
    if (!index) {
      // Unknown metadata, kept for forward compatibility
      continue;
    }

    auto plug_name = scalar_string(kv.second);
    if (!plug_name) {
      std::cerr << "[CONFIG] Warning: device '" << address << "' entry '"
                << key << "' has no plug name, skipping" << std::endl;
      continue;
    }

    const bool taken = std::any_of(
        spec.plugs.begin(), spec.plugs.end(),
        [&](const PlugDef &def) { return def.index == *index; });
    if (taken) {
      std::cerr << "[CONFIG] Warning: device '" << address << "' entry '"
                << key << "' repeats plug index " << *index << ", skipping"
                << std::endl;
      continue;
    }

    spec.plugs.push_back(PlugDef{*index, *plug_name});
  }

  std::stable_sort(
      spec.plugs.begin(), spec.plugs.end(),
      [](const PlugDef &a, const PlugDef &b) { return a.index < b.index; });

  return spec;
}

PwrctrlConfig parse_config(const YAML::Node &root,
                           const GeneralSettings &defaults) {
  PwrctrlConfig config;
  config.general = defaults;

  // Empty document
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("[CONFIG] top level must be a map of sections");
  }

  try {
    config.general = parse_general(root[kGeneralSection], defaults);

    for (const auto &kv : root) {
      const std::string section = kv.first.as<std::string>();
      if (section == kGeneralSection) {
        continue;
      }

      if (auto spec = parse_device(section, kv.second)) {
        config.devices.push_back(*spec);
      }
    }
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("[CONFIG] ") + e.what());
  }

  return config;
}

PwrctrlConfig load_config(const std::string &path,
                          const GeneralSettings &defaults) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    PwrctrlConfig config;
    config.config_file_path = path;
    config.general = defaults;
    return config;
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Failed to load config file '" + path +
                      "': " + e.what());
  }

  PwrctrlConfig config = parse_config(yaml, defaults);
  config.config_file_path = fs::absolute(path, ec).string();
  if (ec) {
    config.config_file_path = path;
  }
  config.file_found = true;
  return config;
}

PwrctrlConfig load_config_from_string(const std::string &text,
                                      const GeneralSettings &defaults) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Failed to parse config: ") + e.what());
  }
  return parse_config(yaml, defaults);
}

int bootstrap_registry(Registry &registry, const PwrctrlConfig &config) {
  int created = 0;
  for (const auto &spec : config.devices) {
    try {
      registry.create_device(spec.address, spec.name, spec.plugs);
      created++;
    } catch (const DuplicateAddress &e) {
      std::cerr << "[CONFIG] Warning: " << e.what() << ", skipping"
                << std::endl;
    } catch (const DuplicatePlugIndex &e) {
      std::cerr << "[CONFIG] Warning: " << e.what() << ", skipping"
                << std::endl;
    }
  }
  return created;
}

std::string emit_config(const Registry &registry) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << kGeneralSection << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "user" << YAML::Value << registry.credentials().user;
  out << YAML::Key << "password" << YAML::Value
      << registry.credentials().password;
  out << YAML::Key << "pin" << YAML::Value
      << static_cast<int>(registry.ports().in);
  out << YAML::Key << "pout" << YAML::Value
      << static_cast<int>(registry.ports().out);
  out << YAML::EndMap;

  for (const auto &device : registry.devices()) {
    out << YAML::Key << device->address() << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << device->name();
    for (const auto &plug : device->plugs()) {
      out << YAML::Key << kPlugPrefix + std::to_string(plug->index())
          << YAML::Value << plug->name();
    }
    out << YAML::EndMap;
  }

  out << YAML::EndMap;

  if (!out.good()) {
    throw ConfigError("Failed to serialize config: " + out.GetLastError());
  }
  return std::string(out.c_str()) + "\n";
}

void save_config(const Registry &registry, const std::string &path) {
  const std::string text = emit_config(registry);

  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file) {
    throw ConfigError("Failed to open config file for writing: " + path);
  }
  file << text;
  file.close();
  if (!file) {
    throw ConfigError("Failed to write config file: " + path);
  }
}

} // namespace pwrctrl
