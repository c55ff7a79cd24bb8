// Tests for the simctl adapter against a scripted runner.

#include <algorithm>
#include <atomic>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "devices/device_identity.hpp"
#include "devices/simctl/simctl_adapter.hpp"
#include "fake_runner.hpp"
#include "test_support.hpp"

using test_support::expect;
using test_support::FakeRunner;
using devices::DeviceState;
using devices::ErrorKind;

namespace test_simctl_adapter {

static const char XCRUN[] = "/usr/bin/xcrun";
static const char VIEWER[] = "/usr/bin/open";
static const char UDID[] = "5A1B2C3D-AAAA-BBBB-CCCC-0123456789AB";

static std::string device_list_json(const std::string &state) {
    return std::string(R"({"devices": {"com.apple.CoreSimulator.SimRuntime.iOS-17-0": [)") +
           R"({"udid": ")" + UDID + R"(", "name": "iPhone 15", "state": ")" + state +
           R"(", "isAvailable": true, "deviceTypeIdentifier": "com.apple.CoreSimulator.SimDeviceType.iPhone-15"}]}})";
}

static simctl::SimctlSettings fast_settings() {
    simctl::SimctlSettings settings;
    settings.xcrun_path = XCRUN;
    settings.viewer_command = {VIEWER, "-a", "Simulator"};
    settings.boot_poll = {0, 20};
    settings.shutdown_poll = {0, 10};
    settings.restart_delay_milliseconds = 0;
    return settings;
}

static devices::Device simulator_device() {
    devices::Device device = devices::make_device(devices::DevicePlatform::Simulator, UDID, "iPhone 15",
                                                  std::string(UDID), DeviceState::Shutdown);
    return device;
}

// Answers `simctl list devices` from a sequence of states; the last one repeats.
static void script_states(FakeRunner &runner, const std::vector<std::string> &states) {
    auto calls = std::make_shared<std::atomic<size_t>>(0);
    runner.on(std::string(XCRUN) + " simctl list devices", [states, calls]() {
        size_t index = std::min(calls->fetch_add(1), states.size() - 1);
        return test_support::exited_with(0, device_list_json(states[index]), "");
    });
}

static std::unique_ptr<FakeRunner> make_runner() {
    std::unique_ptr<FakeRunner> runner(new FakeRunner());
    runner->set_executable(XCRUN, true);
    runner->set_executable(VIEWER, true);
    return runner;
}

static bool test_list_devices() {
    auto runner = make_runner();
    script_states(*runner, {"Booted"});
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::DeviceListResult result = adapter.list_devices();
    bool success = result.success && result.devices.size() == 1 &&
                   result.devices[0].state == DeviceState::Booted &&
                   result.devices[0].platform == devices::DevicePlatform::Simulator &&
                   result.devices[0].id == devices::derive_device_id(UDID);
    return expect(success, "list_devices() decodes simctl JSON");
}

static bool test_missing_xcrun() {
    FakeRunner runner;
    simctl::SimctlAdapter adapter(runner, fast_settings());
    devices::DeviceListResult result = adapter.list_devices();
    return expect(!result.success && result.error.kind == ErrorKind::ConfigurationError &&
                      runner.executed_commands().empty(),
                  "Missing xcrun is a configuration error and runs nothing");
}

static bool test_boot_from_shutdown() {
    auto runner = make_runner();
    script_states(*runner, {"Shutdown", "Shutdown", "Booting", "Booted"});
    runner->on_output(std::string(XCRUN) + " simctl boot", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::OperationResult result = adapter.boot(simulator_device(), token);
    std::vector<std::string> spawned = runner->spawned_commands();
    bool success = result.success &&
                   runner->count_calls(std::string(XCRUN) + " simctl boot " + UDID) == 1 &&
                   runner->count_calls(std::string(XCRUN) + " simctl list devices") == 4 &&
                   spawned.size() == 1 && spawned[0] == "/usr/bin/open -a Simulator";
    return expect(success, "Boot issues one boot command, polls until booted, then foregrounds the viewer");
}

static bool test_boot_timeout() {
    auto runner = make_runner();
    script_states(*runner, {"Shutdown"});
    runner->on_output(std::string(XCRUN) + " simctl boot", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::OperationResult result = adapter.boot(simulator_device(), token);
    bool success = !result.success && result.error.kind == ErrorKind::TimedOut &&
                   runner->count_calls(std::string(XCRUN) + " simctl list devices") == 21 &&
                   runner->spawned_commands().empty();
    return expect(success, "Boot that never completes times out after the poll bound");
}

static bool test_boot_already_booted() {
    auto runner = make_runner();
    script_states(*runner, {"Booted"});
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::OperationResult result = adapter.boot(simulator_device(), token);
    bool success = result.success &&
                   runner->count_calls(std::string(XCRUN) + " simctl boot") == 0 &&
                   runner->spawned_commands().size() == 1;
    return expect(success, "Booting a booted simulator only foregrounds the viewer");
}

static bool test_boot_while_shutting_down() {
    auto runner = make_runner();
    script_states(*runner, {"Shutting Down", "Shutting Down", "Shutdown", "Booted"});
    runner->on_output(std::string(XCRUN) + " simctl boot", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::OperationResult result = adapter.boot(simulator_device(), token);
    std::vector<std::string> executed = runner->executed_commands();
    auto boot_position = std::find(executed.begin(), executed.end(),
                                   std::string(XCRUN) + " simctl boot " + UDID);
    bool success = result.success && boot_position != executed.end() &&
                   std::distance(executed.begin(), boot_position) == 3;
    return expect(success, "Booting a shutting-down simulator waits for shutdown first");
}

static bool test_viewer_failure_is_ignored() {
    auto runner = make_runner();
    runner->set_spawn_succeeds(false);
    script_states(*runner, {"Booted"});
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    return expect(adapter.boot(simulator_device(), token).success,
                  "A viewer that fails to launch does not fail the boot");
}

static bool test_boot_unknown_udid() {
    auto runner = make_runner();
    runner->on_output(std::string(XCRUN) + " simctl list devices", R"({"devices": {}})");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::OperationResult result = adapter.boot(simulator_device(), token);
    return expect(!result.success && result.error.kind == ErrorKind::DeviceNotFound,
                  "Booting a UDID simctl does not list is device-not-found");
}

static bool test_shutdown() {
    auto runner = make_runner();
    script_states(*runner, {"Shutdown"});
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    bool already = adapter.shutdown(simulator_device(), token).success &&
                   runner->count_calls(std::string(XCRUN) + " simctl shutdown") == 0;

    auto booted_runner = make_runner();
    script_states(*booted_runner, {"Booted"});
    booted_runner->on(std::string(XCRUN) + " simctl shutdown", []() {
        return test_support::exited_with(148, "", "Invalid device: " + std::string(UDID));
    });
    simctl::SimctlAdapter booted_adapter(*booted_runner, fast_settings());
    devices::OperationResult failed = booted_adapter.shutdown(simulator_device(), token);
    return expect(already && !failed.success && failed.error.kind == ErrorKind::DeviceNotFound &&
                      failed.error.operation == "shutdown",
                  "Shutdown skips stopped simulators and maps simctl errors");
}

static bool test_delete_booted() {
    auto runner = make_runner();
    script_states(*runner, {"Booted"});
    runner->on_output(std::string(XCRUN) + " simctl shutdown", "");
    runner->on_output(std::string(XCRUN) + " simctl delete", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::OperationResult result = adapter.remove(simulator_device(), token);
    std::vector<std::string> executed = runner->executed_commands();
    bool success = result.success && executed.size() == 3 &&
                   executed[1] == std::string(XCRUN) + " simctl shutdown " + UDID &&
                   executed[2] == std::string(XCRUN) + " simctl delete " + UDID;
    return expect(success, "Deleting a booted simulator shuts it down first");
}

static bool test_restart_cycles() {
    auto runner = make_runner();
    script_states(*runner, {"Booted", "Shutdown", "Shutdown", "Booted"});
    runner->on_output(std::string(XCRUN) + " simctl shutdown", "");
    runner->on_output(std::string(XCRUN) + " simctl boot", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::OperationResult result = adapter.restart(simulator_device(), token);
    bool success = result.success &&
                   runner->count_calls(std::string(XCRUN) + " simctl shutdown") == 1 &&
                   runner->count_calls(std::string(XCRUN) + " simctl boot") == 1;
    return expect(success, "Restart is a shutdown followed by a boot");
}

static bool test_status() {
    auto runner = make_runner();
    script_states(*runner, {"Booting"});
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::StatusResult result = adapter.status(simulator_device());
    return expect(result.success && result.status.state == DeviceState::Booting &&
                      result.status.additional_info.at("udid") == UDID,
                  "Status reports the live simctl state");
}

static bool test_battery_states() {
    auto runner = make_runner();
    runner->on_output(std::string(XCRUN) + " simctl status_bar", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    bool full = adapter.apply_battery(simulator_device(), 150, true).success;
    bool partial = adapter.apply_battery(simulator_device(), 40, true).success;
    bool draining = adapter.apply_battery(simulator_device(), 40, false).success;
    std::string prefix = std::string(XCRUN) + " simctl status_bar " + UDID + " override --batteryLevel ";
    std::vector<std::string> executed = runner->executed_commands();
    bool success = full && partial && draining && executed.size() == 3 &&
                   executed[0] == prefix + "100 --batteryState charged" &&
                   executed[1] == prefix + "40 --batteryState charging" &&
                   executed[2] == prefix + "40 --batteryState discharging";
    return expect(success, "Battery overrides clamp the level and pick the charge state");
}

static bool test_location() {
    auto runner = make_runner();
    runner->on_output(std::string(XCRUN) + " simctl location", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    bool applied = adapter.apply_location(simulator_device(), 37.7749, -122.4194).success;
    std::vector<std::string> executed = runner->executed_commands();
    return expect(applied && executed.size() == 1 &&
                      executed[0] == std::string(XCRUN) + " simctl location " + UDID + " set 37.7749,-122.4194",
                  "Location is passed as latitude,longitude");
}

static bool test_install_requires_artifact() {
    auto runner = make_runner();
    script_states(*runner, {"Booted"});
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::DeviceResult result = adapter.install_app(simulator_device(), "/nonexistent/App.app", token);
    return expect(!result.success && result.error.kind == ErrorKind::FileNotFound &&
                      runner->executed_commands().empty(),
                  "Installing a missing artifact fails before any tool call");
}

static bool test_install_requires_booted() {
    std::string directory = test_support::make_scratch_directory("simctl");
    std::string artifact = directory + "/App.app";
    test_support::write_file(artifact, "bundle");

    auto runner = make_runner();
    script_states(*runner, {"Shutdown"});
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::DeviceResult result = adapter.install_app(simulator_device(), artifact, token);
    test_support::remove_scratch_directory(directory);
    bool success = !result.success && result.error.kind == ErrorKind::DeviceUnavailable &&
                   runner->count_calls(std::string(XCRUN) + " simctl install") == 0 &&
                   runner->count_calls(std::string(XCRUN) + " simctl boot") == 0;
    return expect(success, "Installing on a stopped simulator is unavailable and does not boot it");
}

static bool test_install_on_booted() {
    std::string directory = test_support::make_scratch_directory("simctl");
    std::string artifact = directory + "/App.app";
    test_support::write_file(artifact, "bundle");

    auto runner = make_runner();
    script_states(*runner, {"Booted"});
    runner->on_output(std::string(XCRUN) + " simctl install", "");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::CancellationToken token;
    devices::DeviceResult result = adapter.install_app(simulator_device(), artifact, token);
    test_support::remove_scratch_directory(directory);
    bool success = result.success && result.device.state == DeviceState::Booted &&
                   runner->count_calls(std::string(XCRUN) + " simctl install " + UDID + " " + artifact) == 1;
    return expect(success, "Installing on a booted simulator returns the booted device");
}

static bool test_missing_udid() {
    auto runner = make_runner();
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    devices::Device template_only = devices::make_device(devices::DevicePlatform::Simulator, "Ghost-ios",
                                                         "Ghost", std::nullopt, DeviceState::Shutdown);
    devices::CancellationToken token;
    devices::OperationResult result = adapter.boot(template_only, token);
    return expect(!result.success && result.error.kind == ErrorKind::InvalidInput,
                  "A simulator without a UDID cannot be addressed");
}

static bool test_create_and_options() {
    auto runner = make_runner();
    runner->on_output(std::string(XCRUN) + " simctl create", "NEW-UDID-0001\n");
    runner->on_output(std::string(XCRUN) + " simctl list runtimes",
                      R"({"runtimes": [{"identifier": "com.apple.CoreSimulator.SimRuntime.iOS-17-0", "isAvailable": true}]})");
    simctl::SimctlAdapter adapter(*runner, fast_settings());
    simctl::CreateResult created = adapter.create_simulator(
        "Test Phone", "com.apple.CoreSimulator.SimDeviceType.iPhone-15",
        "com.apple.CoreSimulator.SimRuntime.iOS-17-0");
    simctl::CreateResult invalid = adapter.create_simulator("", "type", "runtime");
    simctl::RuntimesResult runtimes = adapter.list_runtimes();
    bool success = created.success && created.udid == "NEW-UDID-0001" &&
                   !invalid.success && invalid.error.kind == ErrorKind::InvalidInput &&
                   runtimes.success && runtimes.runtimes.size() == 1;
    return expect(success, "Create returns the new UDID and runtimes are listed");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_list_devices();
    all_passed &= test_missing_xcrun();
    all_passed &= test_boot_from_shutdown();
    all_passed &= test_boot_timeout();
    all_passed &= test_boot_already_booted();
    all_passed &= test_boot_while_shutting_down();
    all_passed &= test_viewer_failure_is_ignored();
    all_passed &= test_boot_unknown_udid();
    all_passed &= test_shutdown();
    all_passed &= test_delete_booted();
    all_passed &= test_restart_cycles();
    all_passed &= test_status();
    all_passed &= test_battery_states();
    all_passed &= test_location();
    all_passed &= test_install_requires_artifact();
    all_passed &= test_install_requires_booted();
    all_passed &= test_install_on_booted();
    all_passed &= test_missing_udid();
    all_passed &= test_create_and_options();
    return all_passed;
}

} // namespace test_simctl_adapter
