#include <unity.h>

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "config.hpp"
#include "support/fake_protocol_client.hpp"

using commands::CommandContext;
using pwrctrl::PlugState;
using pwrctrl::Registry;

namespace fs = std::filesystem;

static std::string g_path;

void setUp(void) {
    g_path = (fs::temp_directory_path() / "pwrctrl_test_commands.yaml").string();
    std::remove(g_path.c_str());
}

void tearDown(void) {
    std::remove(g_path.c_str());
}

// Registry, streams and context for one command invocation
struct Harness {
    FakeProtocolClient client;
    Registry registry{client, pwrctrl::Credentials{"admin", "anel"},
                      pwrctrl::Ports{75, 77}};
    std::ostringstream out;
    std::ostringstream err;
    CommandContext ctx{registry, g_path, out, err};

    int run(const std::string &name, const std::vector<std::string> &args) {
        return commands::run_command(name, ctx, args);
    }
};

static void add_office(Registry &registry) {
    registry.create_device("192.168.1.50", "Strip1",
                           {{1, "Lamp"}, {2, "Fan"}, {3, "Desk"}});
    registry.create_device("192.168.1.51", "Strip2",
                           {{1, "Desk"}, {4, "Printer"}});
}

static bool contains(const std::ostringstream &s, const char *text) {
    return s.str().find(text) != std::string::npos;
}

// --- table ---

void test_command_table_lists_all_commands(void) {
    std::ostringstream out;
    commands::print_command_list(out);

    TEST_ASSERT_TRUE(contains(out, "- off [device] plug (switch plug off)"));
    TEST_ASSERT_TRUE(contains(out, "- on [device] plug (switch plug on)"));
    TEST_ASSERT_TRUE(contains(out, "- reset device"));
    TEST_ASSERT_TRUE(contains(out, "- save ("));
    TEST_ASSERT_TRUE(contains(out, "- show ("));
    TEST_ASSERT_NOT_NULL(commands::find_command("on"));
    TEST_ASSERT_NULL(commands::find_command("toggle"));
}

void test_unknown_command(void) {
    Harness h;
    TEST_ASSERT_EQUAL_INT(1, h.run("toggle", {"Lamp"}));
    TEST_ASSERT_TRUE(contains(h.err, "Unknown command"));
}

// --- on/off ---

void test_on_single_match(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("on", {"Lamp"}));
    TEST_ASSERT_EQUAL_size_t(1, h.client.switch_calls.size());
    TEST_ASSERT_TRUE(h.registry.find_device("192.168.1.50")->find_plug(1)->state() ==
                     PlugState::On);
    TEST_ASSERT_FALSE(contains(h.err, "Warning"));
}

void test_on_ambiguous_switches_all_and_warns(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("on", {"Desk"}));
    TEST_ASSERT_EQUAL_size_t(2, h.client.switch_calls.size());
    TEST_ASSERT_TRUE(h.registry.find_device("192.168.1.50")->find_plug(3)->state() ==
                     PlugState::On);
    TEST_ASSERT_TRUE(h.registry.find_device("192.168.1.51")->find_plug(1)->state() ==
                     PlugState::On);
    TEST_ASSERT_TRUE(contains(h.err, "Warning: Setting multiple matching plugs"));
}

void test_off_with_device_qualifier(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("off", {"Strip2", "Desk"}));
    TEST_ASSERT_EQUAL_size_t(1, h.client.switch_calls.size());
    TEST_ASSERT_EQUAL_STRING("192.168.1.51", h.client.switch_calls[0].address.c_str());
    TEST_ASSERT_TRUE(*h.client.switch_calls[0].desired == PlugState::Off);
    TEST_ASSERT_TRUE(h.registry.find_device("192.168.1.50")->find_plug(3)->state() ==
                     PlugState::Unknown);
}

void test_qualifier_matching_several_devices_unions_plugs(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("on", {"192.168.1", "desk"}));
    TEST_ASSERT_EQUAL_size_t(2, h.client.switch_calls.size());
    TEST_ASSERT_TRUE(contains(h.err, "multiple matching plugs"));
}

void test_on_without_match(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(1, h.run("on", {"Toaster"}));
    TEST_ASSERT_EQUAL_size_t(0, h.client.switch_calls.size());
    TEST_ASSERT_TRUE(contains(h.err, "No matching plugs found"));
}

void test_on_unknown_device_qualifier(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(1, h.run("on", {"Strip9", "Lamp"}));
    TEST_ASSERT_EQUAL_size_t(0, h.client.switch_calls.size());
}

void test_on_without_arguments(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(1, h.run("on", {}));
    TEST_ASSERT_EQUAL_size_t(0, h.client.switch_calls.size());
    TEST_ASSERT_TRUE(contains(h.err, "Not enough arguments"));
}

void test_on_with_too_many_arguments(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(1, h.run("on", {"Strip1", "Lamp", "extra"}));
    TEST_ASSERT_EQUAL_size_t(0, h.client.switch_calls.size());
    TEST_ASSERT_TRUE(contains(h.err, "Too many arguments"));
}

void test_on_already_on_succeeds(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("on", {"Fan"}));
    TEST_ASSERT_EQUAL_INT(0, h.run("on", {"Fan"}));
    TEST_ASSERT_TRUE(h.registry.find_device("192.168.1.50")->find_plug(2)->state() ==
                     PlugState::On);
}

void test_network_failure_exits_non_zero(void) {
    Harness h;
    add_office(h.registry);
    h.client.unreachable.insert("192.168.1.51");

    TEST_ASSERT_EQUAL_INT(1, h.run("on", {"Printer"}));
    TEST_ASSERT_TRUE(contains(h.err, "Network error"));
    TEST_ASSERT_TRUE(h.registry.find_device("192.168.1.51")->find_plug(4)->state() ==
                     PlugState::Unknown);

    // A failed command does not poison the next one
    TEST_ASSERT_EQUAL_INT(0, h.run("show", {}));
}

// --- reset ---

void test_reset_single_device(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("reset", {"Strip1"}));
    TEST_ASSERT_EQUAL_size_t(1, h.client.reset_calls.size());
    TEST_ASSERT_EQUAL_STRING("192.168.1.50", h.client.reset_calls[0].c_str());
}

void test_reset_ambiguous_resets_all(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("reset", {"strip"}));
    TEST_ASSERT_EQUAL_size_t(2, h.client.reset_calls.size());
    TEST_ASSERT_TRUE(contains(h.err, "Warning: Resetting multiple matching devices"));
}

void test_reset_nonexistent(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(1, h.run("reset", {"Nonexistent"}));
    TEST_ASSERT_EQUAL_size_t(0, h.client.reset_calls.size());
    TEST_ASSERT_TRUE(contains(h.err, "No matching devices found"));
}

void test_reset_with_two_arguments(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(1, h.run("reset", {"Strip1", "Strip2"}));
    TEST_ASSERT_EQUAL_size_t(0, h.client.reset_calls.size());
}

void test_reset_without_arguments(void) {
    Harness h;
    TEST_ASSERT_EQUAL_INT(1, h.run("reset", {}));
    TEST_ASSERT_TRUE(contains(h.err, "Not enough arguments"));
}

// --- show/save ---

void test_show_prints_devices_and_summary(void) {
    Harness h;
    add_office(h.registry);
    h.registry.find_device("192.168.1.50")->find_plug(1)->switch_to(PlugState::On);
    h.registry.find_device("192.168.1.50")->find_plug(2)->switch_to(PlugState::Off);

    TEST_ASSERT_EQUAL_INT(0, h.run("show", {}));
    TEST_ASSERT_TRUE(contains(h.out, "Strip1 (192.168.1.50):\n- Lamp (on)\n- Fan (off)\n- Desk\n\n"));
    TEST_ASSERT_TRUE(contains(h.out, "There are 2 device(s) and 5 plug(s)"));
    TEST_ASSERT_FALSE(fs::exists(g_path));
}

void test_show_rejects_arguments(void) {
    Harness h;
    TEST_ASSERT_EQUAL_INT(1, h.run("show", {"x"}));
}

void test_save_writes_config_and_summary(void) {
    Harness h;
    add_office(h.registry);

    TEST_ASSERT_EQUAL_INT(0, h.run("save", {}));
    TEST_ASSERT_TRUE(contains(h.out, "Saved config with 2 device(s) and 5 plugs"));

    pwrctrl::PwrctrlConfig config = pwrctrl::load_config(g_path);
    TEST_ASSERT_EQUAL_size_t(2, config.devices.size());
}

void test_save_without_devices(void) {
    Harness h;

    TEST_ASSERT_EQUAL_INT(0, h.run("save", {}));
    TEST_ASSERT_TRUE(contains(h.out, "Saved config without any devices"));

    pwrctrl::PwrctrlConfig config = pwrctrl::load_config(g_path);
    TEST_ASSERT_TRUE(config.file_found);
    TEST_ASSERT_EQUAL_STRING("admin", config.general.user.c_str());
    TEST_ASSERT_EQUAL_UINT16(77, config.general.pout);
}

// --- populate_registry ---

void test_populate_loads_config_devices(void) {
    Harness h;
    pwrctrl::PwrctrlConfig config;
    config.devices.push_back({"10.0.0.2", "Strip", {{1, "Lamp"}}});

    TEST_ASSERT_EQUAL_INT(0, commands::populate_registry(h.registry, config, false,
                                                         "show", h.err));
    TEST_ASSERT_EQUAL_size_t(1, h.registry.devices().size());
    TEST_ASSERT_EQUAL_INT(0, h.client.discover_calls);
}

void test_populate_for_save_skips_config_devices(void) {
    Harness h;
    pwrctrl::PwrctrlConfig config;
    config.devices.push_back({"10.0.0.2", "Strip", {{1, "Lamp"}}});

    TEST_ASSERT_EQUAL_INT(0, commands::populate_registry(h.registry, config, false,
                                                         "save", h.err));
    TEST_ASSERT_EQUAL_size_t(0, h.registry.devices().size());
}

void test_populate_discover_ignores_config(void) {
    Harness h;
    h.client.discovery_result = {
        {"192.168.1.60", "Rack", {{1, "Router", PlugState::On}}},
    };
    pwrctrl::PwrctrlConfig config;
    config.devices.push_back({"10.0.0.2", "Strip", {{1, "Lamp"}}});

    TEST_ASSERT_EQUAL_INT(0, commands::populate_registry(h.registry, config, true,
                                                         "show", h.err));
    TEST_ASSERT_EQUAL_INT(1, h.client.discover_calls);
    TEST_ASSERT_EQUAL_size_t(1, h.registry.devices().size());
    TEST_ASSERT_EQUAL_STRING("Rack", h.registry.devices()[0]->name().c_str());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_command_table_lists_all_commands);
    RUN_TEST(test_unknown_command);
    RUN_TEST(test_on_single_match);
    RUN_TEST(test_on_ambiguous_switches_all_and_warns);
    RUN_TEST(test_off_with_device_qualifier);
    RUN_TEST(test_qualifier_matching_several_devices_unions_plugs);
    RUN_TEST(test_on_without_match);
    RUN_TEST(test_on_unknown_device_qualifier);
    RUN_TEST(test_on_without_arguments);
    RUN_TEST(test_on_with_too_many_arguments);
    RUN_TEST(test_on_already_on_succeeds);
    RUN_TEST(test_network_failure_exits_non_zero);
    RUN_TEST(test_reset_single_device);
    RUN_TEST(test_reset_ambiguous_resets_all);
    RUN_TEST(test_reset_nonexistent);
    RUN_TEST(test_reset_with_two_arguments);
    RUN_TEST(test_reset_without_arguments);
    RUN_TEST(test_show_prints_devices_and_summary);
    RUN_TEST(test_show_rejects_arguments);
    RUN_TEST(test_save_writes_config_and_summary);
    RUN_TEST(test_save_without_devices);
    RUN_TEST(test_populate_loads_config_devices);
    RUN_TEST(test_populate_for_save_skips_config_devices);
    RUN_TEST(test_populate_discover_ignores_config);
    return UNITY_END();
}
