#include "devices/simctl/simctl_adapter.hpp"
#include "devices/error_mapper.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace simctl {

using devices::CancellationToken;
using devices::Device;
using devices::DeviceError;
using devices::DeviceListResult;
using devices::DeviceResult;
using devices::DeviceState;
using devices::ErrorKind;
using devices::OperationResult;
using devices::StatusResult;

SimctlSettings make_simctl_settings(const config::SimdeckConfig &config) {
    SimctlSettings settings;
    settings.xcrun_path = config.xcrun_path;
    settings.viewer_command = config.simulator_viewer;
    settings.command_timeout_milliseconds = config.command_timeout_ms;
    settings.boot_poll.interval_milliseconds = config.poll_interval_ms;
    settings.shutdown_poll.interval_milliseconds = config.poll_interval_ms;
    settings.restart_delay_milliseconds = config.restart_delay_ms;
    return settings;
}

SimctlAdapter::SimctlAdapter(command_runner::Runner &runner, SimctlSettings settings)
    : runner_(runner), settings_(std::move(settings)) {}

devices::DevicePlatform SimctlAdapter::platform() const {
    return devices::DevicePlatform::Simulator;
}

command_runner::CheckedResult SimctlAdapter::run_simctl(const std::vector<std::string> &arguments) {
    std::vector<std::string> full_arguments = {"simctl"};
    full_arguments.insert(full_arguments.end(), arguments.begin(), arguments.end());
    return command_runner::run_checked(runner_, settings_.xcrun_path, full_arguments,
                                       settings_.command_timeout_milliseconds);
}

DeviceError SimctlAdapter::map_failure(const command_runner::ExecutionFailure &failure,
                                       const std::string &operation) const {
    return devices::error_mapper::map_simulator_failure(failure, operation);
}

bool SimctlAdapter::require_udid(const Device &device, const std::string &operation,
                                 std::string &out_udid, DeviceError &out_error) const {
    if (!device.native_identifier || device.native_identifier->empty()) {
        out_error = devices::make_error(ErrorKind::InvalidInput,
                                        "simulator '" + device.name + "' has no UDID", operation);
        return false;
    }
    out_udid = *device.native_identifier;
    return true;
}

bool SimctlAdapter::require_xcrun(const std::string &operation, DeviceError &out_error) const {
    if (runner_.is_executable(settings_.xcrun_path)) {
        return true;
    }
    out_error = devices::make_error(ErrorKind::ConfigurationError,
                                    "xcrun not found at '" + settings_.xcrun_path + "'", operation);
    return false;
}

DeviceListResult SimctlAdapter::list_devices() {
    DeviceListResult result;
    const std::string operation = "simctl list devices";
    if (!require_xcrun(operation, result.error)) {
        return result;
    }

    command_runner::CheckedResult output = run_simctl({"list", "devices", "-j"});
    if (!output.success) {
        result.error = map_failure(output.failure, operation);
        return result;
    }

    std::string parse_error;
    if (!parse_device_list(output.output, result.devices, parse_error)) {
        result.error = devices::make_error(ErrorKind::CommandFailed, parse_error, operation);
        return result;
    }

    std::stable_sort(result.devices.begin(), result.devices.end(),
                     [](const Device &left, const Device &right) { return left.name < right.name; });
    debug_log::log("simctl: " + std::to_string(result.devices.size()) + " simulators");
    result.success = true;
    return result;
}

bool SimctlAdapter::current_state(const std::string &udid, DeviceState &out_state,
                                  DeviceError &out_error) {
    DeviceListResult listing = list_devices();
    if (!listing.success) {
        out_error = listing.error;
        return false;
    }
    for (const auto &device : listing.devices) {
        if (device.native_identifier && *device.native_identifier == udid) {
            out_state = device.state;
            return true;
        }
    }
    out_error = devices::make_error(ErrorKind::DeviceNotFound, "no simulator with UDID " + udid,
                                    "simctl list devices");
    return false;
}

OperationResult SimctlAdapter::wait_for_state(const std::string &udid, DeviceState target,
                                              const devices::PollSettings &poll,
                                              const std::string &operation,
                                              CancellationToken &token) {
    devices::PollResult poll_result =
        devices::poll_until(poll, token, false, [&]() -> devices::CheckResult {
            DeviceState state = DeviceState::Unknown;
            DeviceError error;
            if (!current_state(udid, state, error)) {
                return devices::check_failed(error);
            }
            return state == target ? devices::check_ready() : devices::check_not_ready();
        });

    if (poll_result.outcome == devices::PollOutcome::Satisfied) {
        return devices::operation_ok();
    }
    return devices::operation_failed(devices::adapter_support::poll_failure(
        poll_result, operation, "simulator " + udid + " reaching state '" +
                                    devices::state_name(target) + "'"));
}

void SimctlAdapter::foreground_viewer() {
    if (settings_.viewer_command.empty()) {
        return;
    }
    std::vector<std::string> arguments(settings_.viewer_command.begin() + 1,
                                       settings_.viewer_command.end());
    command_runner::SpawnOutcome outcome = runner_.spawn(settings_.viewer_command.front(), arguments);
    if (!outcome.success) {
        debug_log::log("Could not foreground simulator viewer: " +
                       command_runner::describe_failure(outcome.failure));
    }
}

OperationResult SimctlAdapter::boot(const Device &device, CancellationToken &token) {
    const std::string operation = "boot";
    std::string udid;
    DeviceError error;
    if (!require_udid(device, operation, udid, error)) {
        return devices::operation_failed(error);
    }

    DeviceState state = DeviceState::Unknown;
    if (!current_state(udid, state, error)) {
        return devices::operation_failed(error);
    }
    debug_log::log("boot " + udid + ": current state " + devices::state_name(state));

    switch (state) {
    case DeviceState::Booted:
        foreground_viewer();
        return devices::operation_ok();
    case DeviceState::Booting: {
        OperationResult waited =
            wait_for_state(udid, DeviceState::Booted, settings_.boot_poll, operation, token);
        if (waited.success) {
            foreground_viewer();
        }
        return waited;
    }
    case DeviceState::ShuttingDown: {
        OperationResult waited =
            wait_for_state(udid, DeviceState::Shutdown, settings_.shutdown_poll, operation, token);
        if (!waited.success) {
            return waited;
        }
        break;
    }
    case DeviceState::Shutdown:
    case DeviceState::Unknown:
        break;
    }

    command_runner::CheckedResult output = run_simctl({"boot", udid});
    if (!output.success) {
        return devices::operation_failed(map_failure(output.failure, operation));
    }

    OperationResult waited =
        wait_for_state(udid, DeviceState::Booted, settings_.boot_poll, operation, token);
    if (!waited.success) {
        return waited;
    }
    foreground_viewer();
    return devices::operation_ok();
}

OperationResult SimctlAdapter::shutdown_udid(const std::string &udid) {
    command_runner::CheckedResult output = run_simctl({"shutdown", udid});
    if (!output.success) {
        return devices::operation_failed(map_failure(output.failure, "shutdown"));
    }
    return devices::operation_ok();
}

OperationResult SimctlAdapter::shutdown(const Device &device, CancellationToken &token) {
    (void)token;
    std::string udid;
    DeviceError error;
    if (!require_udid(device, "shutdown", udid, error)) {
        return devices::operation_failed(error);
    }

    DeviceState state = DeviceState::Unknown;
    if (!current_state(udid, state, error)) {
        return devices::operation_failed(error);
    }
    if (state == DeviceState::Shutdown) {
        debug_log::log("shutdown " + udid + ": already shut down");
        return devices::operation_ok();
    }
    return shutdown_udid(udid);
}

OperationResult SimctlAdapter::restart(const Device &device, CancellationToken &token) {
    return devices::adapter_support::restart_by_cycle(*this, device,
                                                      settings_.restart_delay_milliseconds, token);
}

OperationResult SimctlAdapter::remove(const Device &device, CancellationToken &token) {
    (void)token;
    std::string udid;
    DeviceError error;
    if (!require_udid(device, "delete", udid, error)) {
        return devices::operation_failed(error);
    }

    DeviceState state = DeviceState::Unknown;
    if (!current_state(udid, state, error)) {
        return devices::operation_failed(error);
    }
    if (state == DeviceState::Booted || state == DeviceState::Booting) {
        OperationResult stopped = shutdown_udid(udid);
        if (!stopped.success) {
            return stopped;
        }
    }

    command_runner::CheckedResult output = run_simctl({"delete", udid});
    if (!output.success) {
        return devices::operation_failed(map_failure(output.failure, "delete"));
    }
    return devices::operation_ok();
}

StatusResult SimctlAdapter::status(const Device &device) {
    StatusResult result;
    std::string udid;
    if (!require_udid(device, "status", udid, result.error)) {
        return result;
    }

    DeviceState state = DeviceState::Unknown;
    if (!current_state(udid, state, result.error)) {
        return result;
    }
    result.status = devices::make_status(state, {{"udid", udid}});
    result.success = true;
    return result;
}

OperationResult SimctlAdapter::apply_battery(const Device &device, int level, bool charging) {
    std::string udid;
    DeviceError error;
    if (!require_udid(device, "set battery", udid, error)) {
        return devices::operation_failed(error);
    }

    int clamped_level = std::max(0, std::min(level, 100));
    std::string battery_state = "discharging";
    if (charging) {
        battery_state = clamped_level == 100 ? "charged" : "charging";
    }

    command_runner::CheckedResult output =
        run_simctl({"status_bar", udid, "override", "--batteryLevel", std::to_string(clamped_level),
                    "--batteryState", battery_state});
    if (!output.success) {
        return devices::operation_failed(map_failure(output.failure, "set battery"));
    }
    return devices::operation_ok();
}

OperationResult SimctlAdapter::apply_location(const Device &device, double latitude,
                                              double longitude) {
    std::string udid;
    DeviceError error;
    if (!require_udid(device, "set location", udid, error)) {
        return devices::operation_failed(error);
    }

    std::ostringstream coordinates;
    coordinates << std::setprecision(9) << latitude << "," << longitude;

    command_runner::CheckedResult output = run_simctl({"location", udid, "set", coordinates.str()});
    if (!output.success) {
        return devices::operation_failed(map_failure(output.failure, "set location"));
    }
    return devices::operation_ok();
}

DeviceResult SimctlAdapter::install_app(const Device &device, const std::string &artifact_path,
                                        CancellationToken &token) {
    (void)token;
    const std::string operation = "install";
    DeviceResult result;
    std::string udid;
    if (!require_udid(device, operation, udid, result.error)) {
        return result;
    }

    std::error_code filesystem_error;
    if (!std::filesystem::exists(artifact_path, filesystem_error)) {
        result.error = devices::make_error(ErrorKind::FileNotFound,
                                           "app bundle not found: " + artifact_path, operation);
        return result;
    }

    DeviceState state = DeviceState::Unknown;
    if (!current_state(udid, state, result.error)) {
        return result;
    }
    if (state != DeviceState::Booted) {
        result.error = devices::make_error(
            ErrorKind::DeviceUnavailable,
            "simulator must be booted to install an app (current state: " +
                devices::state_name(state) + ")",
            operation);
        return result;
    }

    command_runner::CheckedResult output = run_simctl({"install", udid, artifact_path});
    if (!output.success) {
        result.error = map_failure(output.failure, operation);
        return result;
    }

    result.device = device;
    result.device.state = DeviceState::Booted;
    result.success = true;
    return result;
}

CreateResult SimctlAdapter::create_simulator(const std::string &name,
                                             const std::string &device_type_identifier,
                                             const std::string &runtime_identifier) {
    const std::string operation = "simctl create";
    CreateResult result;
    if (name.empty() || device_type_identifier.empty() || runtime_identifier.empty()) {
        result.error = devices::make_error(
            ErrorKind::InvalidInput, "name, device type and runtime are all required", operation);
        return result;
    }
    if (!require_xcrun(operation, result.error)) {
        return result;
    }

    command_runner::CheckedResult output =
        run_simctl({"create", name, device_type_identifier, runtime_identifier});
    if (!output.success) {
        result.error = map_failure(output.failure, operation);
        return result;
    }
    if (output.output.empty()) {
        result.error = devices::make_error(ErrorKind::CommandFailed,
                                           "simctl create printed no UDID", operation);
        return result;
    }

    debug_log::log("created simulator '" + name + "' with UDID " + output.output);
    result.udid = output.output;
    result.success = true;
    return result;
}

DeviceTypesResult SimctlAdapter::list_device_types() {
    const std::string operation = "simctl list devicetypes";
    DeviceTypesResult result;
    if (!require_xcrun(operation, result.error)) {
        return result;
    }

    command_runner::CheckedResult output = run_simctl({"list", "devicetypes", "-j"});
    if (!output.success) {
        result.error = map_failure(output.failure, operation);
        return result;
    }

    std::string parse_error;
    if (!parse_device_types(output.output, result.device_types, parse_error)) {
        result.error = devices::make_error(ErrorKind::CommandFailed, parse_error, operation);
        return result;
    }
    result.success = true;
    return result;
}

RuntimesResult SimctlAdapter::list_runtimes() {
    const std::string operation = "simctl list runtimes";
    RuntimesResult result;
    if (!require_xcrun(operation, result.error)) {
        return result;
    }

    command_runner::CheckedResult output = run_simctl({"list", "runtimes", "-j"});
    if (!output.success) {
        result.error = map_failure(output.failure, operation);
        return result;
    }

    std::string parse_error;
    if (!parse_runtimes(output.output, result.runtimes, parse_error)) {
        result.error = devices::make_error(ErrorKind::CommandFailed, parse_error, operation);
        return result;
    }
    result.success = true;
    return result;
}

} // namespace simctl
