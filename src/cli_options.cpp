#include "cli_options.hpp"

#include <ostream>
#include <stdexcept>

namespace pwrctrl {

static uint16_t parse_port_arg(const std::string &option,
                               const std::string &value) {
  int port = 0;
  try {
    std::size_t used = 0;
    port = std::stoi(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::exception &) {
    throw std::invalid_argument("option " + option +
                                ": invalid port value '" + value + "'");
  }
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("option " + option + ": port " + value +
                                " out of range");
  }
  return static_cast<uint16_t>(port);
}

static double parse_seconds_arg(const std::string &option,
                                const std::string &value) {
  double seconds = 0.0;
  try {
    std::size_t used = 0;
    seconds = std::stod(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::exception &) {
    throw std::invalid_argument("option " + option +
                                ": invalid number of seconds '" + value +
                                "'");
  }
  if (seconds <= 0.0 || seconds > 60.0) {
    throw std::invalid_argument("option " + option +
                                ": must be in range (0, 60]");
  }
  return seconds;
}

CliOptions parse_cli(int argc, const char *const *argv) {
  CliOptions options;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
      options.positional.push_back(arg);
      continue;
    }
    if (arg == "--") {
      options_done = true;
      continue;
    }

    // Split "--name=value"
    std::optional<std::string> inline_value;
    if (arg.compare(0, 2, "--") == 0) {
      const auto eq = arg.find('=');
      if (eq != std::string::npos) {
        inline_value = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
      }
    }

    auto take_value = [&]() -> std::string {
      if (inline_value) {
        return *inline_value;
      }
      if (i + 1 >= argc) {
        throw std::invalid_argument("option " + arg + " requires a value");
      }
      return argv[++i];
    };

    if (arg == "-l" || arg == "--list") {
      options.list = true;
    } else if (arg == "-d" || arg == "--discover") {
      options.discover = true;
    } else if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "-u" || arg == "--user") {
      options.user = take_value();
    } else if (arg == "-p" || arg == "--password") {
      options.password = take_value();
    } else if (arg == "-i" || arg == "--in") {
      options.pin = parse_port_arg(arg, take_value());
    } else if (arg == "-o" || arg == "--out") {
      options.pout = parse_port_arg(arg, take_value());
    } else if (arg == "-c" || arg == "--config") {
      options.config_path = take_value();
    } else if (arg == "-t" || arg == "--timeout") {
      options.timeout_sec = parse_seconds_arg(arg, take_value());
    } else {
      throw std::invalid_argument("unknown option: " + arg);
    }

    if (inline_value && (arg == "-l" || arg == "--list" || arg == "-d" ||
                         arg == "--discover" || arg == "-h" ||
                         arg == "--help")) {
      throw std::invalid_argument("option " + arg + " takes no value");
    }
  }

  return options;
}

GeneralSettings merge_settings(const GeneralSettings &file,
                               const CliOptions &options) {
  GeneralSettings merged = file;
  if (options.user) {
    merged.user = *options.user;
  }
  if (options.password) {
    merged.password = *options.password;
  }
  if (options.pin) {
    merged.pin = *options.pin;
  }
  if (options.pout) {
    merged.pout = *options.pout;
  }
  return merged;
}

void print_usage(std::ostream &out) {
  out << "usage: pwrctrl [options] command [command options]\n"
         "\n"
         "options:\n"
         "  -h, --help              show this help message and exit\n"
         "  -l, --list              list available commands and options\n"
         "  -d, --discover          discover devices on network\n"
         "  -u, --user USER         username on device (default from config "
         "or 'admin')\n"
         "  -p, --password PASSWORD password on device (default from config "
         "or 'anel')\n"
         "  -i, --in PORT           port to use for receiving (default from "
         "config or 75)\n"
         "  -o, --out PORT          port to use for sending (default from "
         "config or 77)\n"
         "  -c, --config PATH       configuration file (default "
         "~/.pwrctrl.yaml)\n"
         "  -t, --timeout SECONDS   discovery window (default 2)\n";
}

} // namespace pwrctrl
