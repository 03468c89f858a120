#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "devices/registry.hpp"

namespace commands {

// Everything a command handler may touch
struct CommandContext {
  pwrctrl::Registry &registry;
  std::string config_path;
  std::ostream &out; // reports
  std::ostream &err; // warnings and errors
};

using Handler = std::function<int(CommandContext &,
                                  const std::vector<std::string> &)>;

struct CommandSpec {
  std::string name;
  Handler handler;
  std::size_t min_args;
  std::size_t max_args;
  std::string usage;
  std::string description;
  std::string too_few_message;
  std::string too_many_message;
};

// Fixed table, sorted by name
const std::vector<CommandSpec> &command_table();

// Returns nullptr for an unknown command
const CommandSpec *find_command(const std::string &name);

// "- <name> <usage> (<description>)" for every command
void print_command_list(std::ostream &out);

// Loads devices from config (skipped for 'save') or discovers them, never
// both. Returns 0 or 1 (exit code).
int populate_registry(pwrctrl::Registry &registry,
                      const pwrctrl::PwrctrlConfig &config, bool discover,
                      const std::string &command, std::ostream &err);

// Looks up the command, checks its arity and runs it. Errors raised by
// the handler are reported on ctx.err. Returns the process exit code.
int run_command(const std::string &name, CommandContext &ctx,
                const std::vector<std::string> &args);

// ---- Handlers ----

int switch_plugs(CommandContext &ctx, const std::vector<std::string> &args,
                 pwrctrl::PlugState state);
int reset_devices(CommandContext &ctx, const std::vector<std::string> &args);
int save(CommandContext &ctx, const std::vector<std::string> &args);
int show(CommandContext &ctx, const std::vector<std::string> &args);

// Lists devices and plugs; returns (device count, plug count)
std::pair<std::size_t, std::size_t>
print_registry(const pwrctrl::Registry &registry, std::ostream &out);

} // namespace commands
