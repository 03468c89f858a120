#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"

namespace pwrctrl {

// Parsed command line. Unset optionals fall back to the config file, then
// to the built-in defaults.
struct CliOptions {
  bool list = false;
  bool discover = false;
  bool help = false;
  std::optional<std::string> user;
  std::optional<std::string> password;
  std::optional<uint16_t> pin;
  std::optional<uint16_t> pout;
  std::optional<std::string> config_path;
  std::optional<double> timeout_sec;
  std::vector<std::string> positional; // command followed by its arguments
};

// Parses argv[1..argc). Options may appear anywhere; "--" ends option
// parsing. Both "--user NAME" and "--user=NAME" are accepted.
// Throws std::invalid_argument on unknown options or bad values.
CliOptions parse_cli(int argc, const char *const *argv);

// Command line values take precedence over the file values
GeneralSettings merge_settings(const GeneralSettings &file,
                               const CliOptions &options);

void print_usage(std::ostream &out);

} // namespace pwrctrl
