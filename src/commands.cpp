#include "commands.hpp"

#include <algorithm>

#include "errors.hpp"

namespace commands {

using pwrctrl::Device;
using pwrctrl::Plug;
using pwrctrl::PlugState;
using pwrctrl::Registry;

const std::vector<CommandSpec> &command_table() {
  static const std::vector<CommandSpec> table = {
      {"off",
       [](CommandContext &ctx, const std::vector<std::string> &args) {
         return switch_plugs(ctx, args, PlugState::Off);
       },
       1, 2, "[device] plug", "switch plug off",
       "Not enough arguments. Please add at least a plug name.",
       "Too many arguments. Only plug name and optionally device name "
       "expected."},
      {"on",
       [](CommandContext &ctx, const std::vector<std::string> &args) {
         return switch_plugs(ctx, args, PlugState::On);
       },
       1, 2, "[device] plug", "switch plug on",
       "Not enough arguments. Please add at least a plug name.",
       "Too many arguments. Only plug name and optionally device name "
       "expected."},
      {"reset", reset_devices, 1, 1, "device", "power-cycle a device",
       "Not enough arguments. Please add the device name.",
       "Too many arguments. Only device name expected."},
      {"save", save, 0, 0, "", "save options and discovered devices", "",
       "Too many arguments. The save command takes none."},
      {"show", show, 0, 0, "", "show all discovered or saved devices", "",
       "Too many arguments. The show command takes none."},
  };
  return table;
}

const CommandSpec *find_command(const std::string &name) {
  for (const auto &spec : command_table()) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

void print_command_list(std::ostream &out) {
  out << "The following commands are available:\n";
  for (const auto &spec : command_table()) {
    out << "- " << spec.name;
    if (!spec.usage.empty()) {
      out << " " << spec.usage;
    }
    out << " (" << spec.description << ")\n";
  }
}

int populate_registry(Registry &registry, const pwrctrl::PwrctrlConfig &config,
                      bool discover, const std::string &command,
                      std::ostream &err) {
  if (discover) {
    try {
      registry.discover();
    } catch (const pwrctrl::NetworkFailure &e) {
      err << "Discovery failed: " << e.what() << "\n";
      return 1;
    }
    return 0;
  }

  // 'save' stores the options and what was discovered in this run only
  if (command != "save") {
    pwrctrl::bootstrap_registry(registry, config);
  }
  return 0;
}

int run_command(const std::string &name, CommandContext &ctx,
                const std::vector<std::string> &args) {
  const CommandSpec *spec = find_command(name);
  if (spec == nullptr) {
    ctx.err << "Unknown command, sorry\n";
    return 1;
  }

  if (args.size() < spec->min_args) {
    ctx.err << spec->too_few_message << "\n";
    return 1;
  }
  if (args.size() > spec->max_args) {
    ctx.err << spec->too_many_message << "\n";
    return 1;
  }

  try {
    return spec->handler(ctx, args);
  } catch (const pwrctrl::NetworkFailure &e) {
    ctx.err << "Network error: " << e.what() << "\n";
  } catch (const pwrctrl::ConfigError &e) {
    ctx.err << "Configuration error: " << e.what() << "\n";
  }
  return 1;
}

int switch_plugs(CommandContext &ctx, const std::vector<std::string> &args,
                 PlugState state) {
  std::vector<Plug *> plugs;

  if (args.size() == 1) {
    plugs = ctx.registry.search_plug(args[0]);
  } else if (args.size() == 2) {
    for (Device *device : ctx.registry.search_device(args[0])) {
      for (Plug *plug : device->search_plug(args[1])) {
        if (std::find(plugs.begin(), plugs.end(), plug) == plugs.end()) {
          plugs.push_back(plug);
        }
      }
    }
  } else {
    ctx.err << "Wrong number of arguments.\n";
    return 1;
  }

  if (plugs.empty()) {
    ctx.err << "No matching plugs found, sorry\n";
    return 1;
  }
  if (plugs.size() > 1) {
    ctx.err << "Warning: Setting multiple matching plugs\n";
  }

  for (Plug *plug : plugs) {
    plug->switch_to(state);
  }
  return 0;
}

int reset_devices(CommandContext &ctx, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    ctx.err << "Wrong number of arguments.\n";
    return 1;
  }

  const auto devices = ctx.registry.search_device(args[0]);
  if (devices.empty()) {
    ctx.err << "No matching devices found, sorry\n";
    return 1;
  }
  if (devices.size() > 1) {
    ctx.err << "Warning: Resetting multiple matching devices\n";
  }

  for (Device *device : devices) {
    device->reset();
  }
  return 0;
}

std::pair<std::size_t, std::size_t> print_registry(const Registry &registry,
                                                   std::ostream &out) {
  for (const auto &device : registry.devices()) {
    out << device->name() << " (" << device->address() << "):\n";
    for (const auto &plug : device->plugs()) {
      out << "- " << plug->name();
      if (pwrctrl::is_known(plug->state())) {
        out << " (" << pwrctrl::to_string(plug->state()) << ")";
      }
      out << "\n";
    }
    out << "\n";
  }
  return {registry.devices().size(), registry.plug_count()};
}

int save(CommandContext &ctx, const std::vector<std::string> &args) {
  (void)args;

  pwrctrl::save_config(ctx.registry, ctx.config_path);

  const auto counts = print_registry(ctx.registry, ctx.out);
  if (counts.first == 0) {
    ctx.out << "Saved config without any devices\n";
  } else {
    ctx.out << "Saved config with " << counts.first << " device(s) and "
            << counts.second << " plugs\n";
  }
  return 0;
}

int show(CommandContext &ctx, const std::vector<std::string> &args) {
  (void)args;

  const auto counts = print_registry(ctx.registry, ctx.out);
  ctx.out << "There are " << counts.first << " device(s) and "
          << counts.second << " plug(s)\n";
  return 0;
}

} // namespace commands
