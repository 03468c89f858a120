#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_options.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "devices/registry.hpp"
#include "errors.hpp"
#include "protocol/netpwrctrl_client.hpp"

static void log_err(const std::string &msg) {
  std::cerr << "pwrctrl: " << msg << "\n";
}

int main(int argc, char **argv) {
  // Parse command-line arguments
  pwrctrl::CliOptions options;
  try {
    options = pwrctrl::parse_cli(argc, argv);
  } catch (const std::invalid_argument &e) {
    log_err(e.what());
    pwrctrl::print_usage(std::cerr);
    return 1;
  }

  if (options.help) {
    pwrctrl::print_usage(std::cout);
    return 0;
  }

  if (options.list) {
    commands::print_command_list(std::cout);
    return 0;
  }

  if (options.positional.empty()) {
    std::cerr << "Command missing, please add one\n";
    return 1;
  }

  const std::string command = options.positional.front();
  const std::vector<std::string> rest(options.positional.begin() + 1,
                                      options.positional.end());

  if (commands::find_command(command) == nullptr) {
    std::cerr << "Unknown command, sorry\n";
    return 1;
  }

  // Load configuration (a missing file only means defaults)
  const std::string config_path =
      options.config_path ? *options.config_path
                          : pwrctrl::default_config_path();
  pwrctrl::PwrctrlConfig config;
  try {
    config = pwrctrl::load_config(config_path);
  } catch (const pwrctrl::ConfigError &e) {
    log_err(std::string("FATAL: ") + e.what());
    return 1;
  }

  const pwrctrl::GeneralSettings settings =
      pwrctrl::merge_settings(config.general, options);

  std::chrono::milliseconds window = std::chrono::seconds(2);
  if (options.timeout_sec) {
    window = std::chrono::milliseconds(
        static_cast<long long>(*options.timeout_sec * 1000));
  }

  pwrctrl::NetPwrCtrlClient client(window);
  pwrctrl::Registry registry(client,
                             pwrctrl::Credentials{settings.user,
                                                  settings.password},
                             pwrctrl::Ports{settings.pin, settings.pout});

  if (commands::populate_registry(registry, config, options.discover,
                                  command, std::cerr) != 0) {
    return 1;
  }

  commands::CommandContext ctx{registry, config_path, std::cout, std::cerr};
  return commands::run_command(command, ctx, rest);
}
