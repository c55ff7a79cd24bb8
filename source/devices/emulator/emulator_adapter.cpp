#include "devices/emulator/emulator_adapter.hpp"
#include "devices/error_mapper.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

#include <filesystem>
#include <future>

namespace emulator {

using devices::CancellationToken;
using devices::Device;
using devices::DeviceError;
using devices::DeviceListResult;
using devices::DeviceResult;
using devices::DeviceState;
using devices::ErrorKind;
using devices::OperationResult;
using devices::StatusResult;

namespace {

const Device *find_by_name(const std::vector<Device> &list, const std::string &name) {
    for (const auto &device : list) {
        if (device.name == name) {
            return &device;
        }
    }
    return nullptr;
}

const Device *find_by_serial(const std::vector<Device> &list, const std::string &serial) {
    for (const auto &device : list) {
        if (device.native_identifier && *device.native_identifier == serial) {
            return &device;
        }
    }
    return nullptr;
}

bool has_serial(const Device &device) {
    return device.native_identifier && !device.native_identifier->empty() &&
           !text_utils::starts_with(*device.native_identifier, kTemplatePrefix);
}

} // namespace

EmulatorSettings make_emulator_settings(const config::SimdeckConfig &config) {
    EmulatorSettings settings;
    settings.adb_path = config.adb_path;
    settings.emulator_path = config.emulator_path;
    settings.avd_home = config.avd_home;
    settings.skin = config.emulator_skin;
    settings.command_timeout_milliseconds = config.command_timeout_ms;
    settings.boot_poll.interval_milliseconds = config.poll_interval_ms;
    settings.shutdown_poll.interval_milliseconds = config.poll_interval_ms;
    settings.ready_poll.interval_milliseconds = config.poll_interval_ms;
    settings.restart_delay_milliseconds = config.restart_delay_ms;
    return settings;
}

EmulatorAdapter::EmulatorAdapter(command_runner::Runner &runner, EmulatorSettings settings)
    : runner_(runner), settings_(std::move(settings)) {}

devices::DevicePlatform EmulatorAdapter::platform() const {
    return devices::DevicePlatform::Emulator;
}

DeviceError EmulatorAdapter::map_failure(const command_runner::ExecutionFailure &failure,
                                         const std::string &operation) const {
    return devices::error_mapper::map_emulator_failure(failure, operation);
}

bool EmulatorAdapter::require_tool(const std::string &path, const std::string &label,
                                   const std::string &operation, DeviceError &out_error) const {
    if (!path.empty() && runner_.is_executable(path)) {
        return true;
    }
    out_error = devices::make_error(ErrorKind::ConfigurationError,
                                    label + " is not available at '" + path + "'", operation);
    return false;
}

std::string EmulatorAdapter::resolve_instance_name(const RunningInstance &instance) {
    command_runner::CheckedResult console =
        command_runner::run_checked(runner_, settings_.adb_path,
                                    {"-s", instance.serial, "emu", "avd", "name"},
                                    settings_.command_timeout_milliseconds);
    if (console.success) {
        std::string name = parse_console_avd_name(console.output);
        if (!name.empty()) {
            return name;
        }
    } else {
        debug_log::log("emu avd name failed for " + instance.serial + ": " +
                       command_runner::describe_failure(console.failure));
    }
    return fallback_instance_name(instance);
}

DeviceListResult EmulatorAdapter::fetch_running() {
    DeviceListResult result;
    command_runner::CheckedResult output = command_runner::run_checked(
        runner_, settings_.adb_path, {"devices", "-l"}, settings_.command_timeout_milliseconds);
    if (!output.success) {
        result.error = map_failure(output.failure, "adb devices");
        return result;
    }

    for (const auto &instance : parse_running_instances(output.output)) {
        result.devices.push_back(make_running_device(resolve_instance_name(instance), instance.serial));
    }
    result.success = true;
    return result;
}

DeviceListResult EmulatorAdapter::fetch_templates() {
    DeviceListResult result;
    command_runner::CheckedResult output = command_runner::run_checked(
        runner_, settings_.emulator_path, {"-list-avds"}, settings_.command_timeout_milliseconds);
    if (!output.success) {
        result.error = map_failure(output.failure, "emulator -list-avds");
        return result;
    }

    for (const auto &name : parse_template_names(output.output)) {
        TemplateMetadata metadata;
        metadata.device_name = name;
        metadata.api_level = api_level_from_name(name);
        if (!settings_.avd_home.empty()) {
            std::string contents;
            std::string config_path = settings_.avd_home + "/" + name + ".avd/config.ini";
            if (platform::read_file_contents(config_path, contents)) {
                metadata = parse_avd_config(contents, name);
            }
        }
        result.devices.push_back(make_template_device(name, metadata));
    }
    result.success = true;
    return result;
}

DeviceListResult EmulatorAdapter::list_devices() {
    DeviceListResult result;
    const std::string operation = "list emulators";
    if (!require_tool(settings_.adb_path, "adb", operation, result.error) ||
        !require_tool(settings_.emulator_path, "emulator", operation, result.error)) {
        return result;
    }

    std::future<DeviceListResult> running = std::async(std::launch::async, [this]() { return fetch_running(); });
    std::future<DeviceListResult> templates = std::async(std::launch::async, [this]() { return fetch_templates(); });
    DeviceListResult running_result = running.get();
    DeviceListResult template_result = templates.get();

    if (!running_result.success) {
        return running_result;
    }
    if (!template_result.success) {
        return template_result;
    }

    result.devices = merge_devices(running_result.devices, template_result.devices);
    debug_log::log("emulator: " + std::to_string(running_result.devices.size()) + " running, " +
                   std::to_string(template_result.devices.size()) + " templates");
    result.success = true;
    return result;
}

OperationResult EmulatorAdapter::boot(const Device &device, CancellationToken &token) {
    const std::string operation = "boot";
    DeviceError error;
    if (!require_tool(settings_.emulator_path, "emulator", operation, error) ||
        !require_tool(settings_.adb_path, "adb", operation, error)) {
        return devices::operation_failed(error);
    }

    std::string name = strip_template_prefix(device.name);

    DeviceListResult running = fetch_running();
    if (!running.success) {
        return devices::operation_failed(running.error);
    }
    if (find_by_name(running.devices, name) != nullptr) {
        debug_log::log("boot '" + name + "': already running");
        return devices::operation_ok();
    }

    DeviceListResult templates = fetch_templates();
    if (!templates.success) {
        return devices::operation_failed(templates.error);
    }
    if (find_by_name(templates.devices, name) == nullptr) {
        return devices::operation_failed(
            devices::make_error(ErrorKind::DeviceNotFound, "no AVD named '" + name + "'", operation));
    }

    std::vector<std::string> arguments = {"-avd", name, "-no-snapshot-load", "-no-audio",
                                          "-gpu", "auto"};
    if (!settings_.skin.empty()) {
        arguments.push_back("-skin");
        arguments.push_back(settings_.skin);
    }
    command_runner::SpawnOutcome launched = runner_.spawn(settings_.emulator_path, arguments);
    if (!launched.success) {
        return devices::operation_failed(map_failure(launched.failure, operation));
    }
    debug_log::log("boot '" + name + "': emulator launched, pid " + std::to_string(launched.process_id));

    devices::PollResult poll_result =
        devices::poll_until(settings_.boot_poll, token, true, [&]() -> devices::CheckResult {
            DeviceListResult current = fetch_running();
            if (!current.success) {
                // adb is unreliable while the emulator is starting.
                return devices::check_not_ready();
            }
            return find_by_name(current.devices, name) != nullptr ? devices::check_ready()
                                                                  : devices::check_not_ready();
        });
    if (poll_result.outcome == devices::PollOutcome::Satisfied) {
        return devices::operation_ok();
    }
    return devices::operation_failed(devices::adapter_support::poll_failure(
        poll_result, operation, "emulator '" + name + "' appearing in adb"));
}

OperationResult EmulatorAdapter::shutdown(const Device &device, CancellationToken &token) {
    const std::string operation = "shutdown";
    if (!has_serial(device)) {
        debug_log::log("shutdown '" + device.name + "': not running");
        return devices::operation_ok();
    }
    const std::string serial = *device.native_identifier;

    DeviceError error;
    if (!require_tool(settings_.adb_path, "adb", operation, error)) {
        return devices::operation_failed(error);
    }

    command_runner::CheckedResult output = command_runner::run_checked(
        runner_, settings_.adb_path, {"-s", serial, "emu", "kill"},
        settings_.command_timeout_milliseconds);
    if (!output.success) {
        return devices::operation_failed(map_failure(output.failure, operation));
    }

    devices::PollResult poll_result =
        devices::poll_until(settings_.shutdown_poll, token, true, [&]() -> devices::CheckResult {
            DeviceListResult current = fetch_running();
            if (!current.success) {
                return devices::check_not_ready();
            }
            return find_by_serial(current.devices, serial) == nullptr ? devices::check_ready()
                                                                      : devices::check_not_ready();
        });

    switch (poll_result.outcome) {
    case devices::PollOutcome::Satisfied:
        return devices::operation_ok();
    case devices::PollOutcome::Exhausted:
        debug_log::warn("emulator " + serial + " still listed after " +
                        std::to_string(poll_result.attempts) + " checks; treating shutdown as done");
        return devices::operation_ok();
    case devices::PollOutcome::Cancelled:
    case devices::PollOutcome::Failed:
        break;
    }
    return devices::operation_failed(devices::adapter_support::poll_failure(
        poll_result, operation, "emulator " + serial + " leaving adb"));
}

OperationResult EmulatorAdapter::restart(const Device &device, CancellationToken &token) {
    return devices::adapter_support::restart_by_cycle(*this, device,
                                                      settings_.restart_delay_milliseconds, token);
}

OperationResult EmulatorAdapter::remove(const Device &device, CancellationToken &token) {
    const std::string operation = "delete";
    if (settings_.avd_home.empty()) {
        return devices::operation_failed(devices::make_error(
            ErrorKind::ConfigurationError, "AVD home directory is not configured", operation));
    }

    std::string name = strip_template_prefix(device.name);
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        return devices::operation_failed(
            devices::make_error(ErrorKind::InvalidInput, "invalid AVD name '" + name + "'", operation));
    }

    const std::filesystem::path avd_directory = std::filesystem::path(settings_.avd_home) / (name + ".avd");
    const std::filesystem::path avd_ini = std::filesystem::path(settings_.avd_home) / (name + ".ini");

    std::error_code filesystem_error;
    bool directory_exists = std::filesystem::exists(avd_directory, filesystem_error);
    bool ini_exists = std::filesystem::exists(avd_ini, filesystem_error);
    if (!directory_exists && !ini_exists) {
        return devices::operation_failed(devices::make_error(
            ErrorKind::DeviceNotFound, "no AVD files for '" + name + "' in " + settings_.avd_home,
            operation));
    }

    if (!settings_.adb_path.empty() && runner_.is_executable(settings_.adb_path)) {
        DeviceListResult running = fetch_running();
        const Device *instance = running.success ? find_by_name(running.devices, name) : nullptr;
        if (instance != nullptr) {
            debug_log::log("delete '" + name + "': shutting down running instance first");
            OperationResult stopped = shutdown(*instance, token);
            if (!stopped.success) {
                return stopped;
            }
        }
    }

    for (const auto &path : {avd_directory, avd_ini}) {
        if (!std::filesystem::exists(path, filesystem_error)) {
            continue;
        }
        std::filesystem::remove_all(path, filesystem_error);
        if (filesystem_error) {
            return devices::operation_failed(devices::make_error(
                ErrorKind::CommandFailed, "could not remove " + path.string(), operation,
                filesystem_error.message()));
        }
    }
    debug_log::log("delete '" + name + "': removed");
    return devices::operation_ok();
}

StatusResult EmulatorAdapter::status(const Device &device) {
    StatusResult result;
    DeviceListResult listing = list_devices();
    if (!listing.success) {
        result.error = listing.error;
        return result;
    }

    for (const auto &current : listing.devices) {
        if (current.id == device.id) {
            result.status = devices::make_status(current.state,
                                                 {{"serial", current.native_identifier.value_or("")}});
            result.success = true;
            return result;
        }
    }
    result.status = devices::make_status(DeviceState::Unknown);
    result.success = true;
    return result;
}

OperationResult EmulatorAdapter::apply_battery(const Device &device, int level, bool charging) {
    (void)device;
    (void)level;
    (void)charging;
    return devices::adapter_support::unsupported("battery simulation", platform());
}

OperationResult EmulatorAdapter::apply_location(const Device &device, double latitude,
                                                double longitude) {
    (void)device;
    (void)latitude;
    (void)longitude;
    return devices::adapter_support::unsupported("location simulation", platform());
}

bool EmulatorAdapter::ensure_serial(const Device &device, CancellationToken &token,
                                    std::string &out_serial, DeviceError &out_error) {
    if (has_serial(device)) {
        out_serial = *device.native_identifier;
        return true;
    }

    OperationResult booted = boot(device, token);
    if (!booted.success) {
        out_error = booted.error;
        return false;
    }

    DeviceListResult running = fetch_running();
    if (running.success) {
        const Device *instance = find_by_name(running.devices, strip_template_prefix(device.name));
        if (instance != nullptr && instance->native_identifier) {
            out_serial = *instance->native_identifier;
            return true;
        }
    }
    out_error = devices::make_error(ErrorKind::DeviceUnavailable,
                                    "could not resolve the adb serial of '" + device.name + "'",
                                    "install");
    return false;
}

OperationResult EmulatorAdapter::wait_for_device_ready(const std::string &serial,
                                                       CancellationToken &token) {
    devices::PollResult poll_result =
        devices::poll_until(settings_.ready_poll, token, false, [&]() -> devices::CheckResult {
            command_runner::CheckedResult output = command_runner::run_checked(
                runner_, settings_.adb_path, {"-s", serial, "shell", "getprop", "sys.boot_completed"},
                settings_.command_timeout_milliseconds);
            if (output.success && output.output == "1") {
                return devices::check_ready();
            }
            return devices::check_not_ready();
        });
    if (poll_result.outcome == devices::PollOutcome::Satisfied) {
        return devices::operation_ok();
    }
    return devices::operation_failed(devices::adapter_support::poll_failure(
        poll_result, "install", "sys.boot_completed on " + serial));
}

DeviceResult EmulatorAdapter::install_app(const Device &device, const std::string &artifact_path,
                                          CancellationToken &token) {
    const std::string operation = "install";
    DeviceResult result;

    std::error_code filesystem_error;
    if (!std::filesystem::exists(artifact_path, filesystem_error)) {
        result.error = devices::make_error(ErrorKind::FileNotFound, "APK not found: " + artifact_path,
                                           operation);
        return result;
    }
    if (!require_tool(settings_.adb_path, "adb", operation, result.error)) {
        return result;
    }

    std::string serial;
    if (!ensure_serial(device, token, serial, result.error)) {
        return result;
    }

    OperationResult ready = wait_for_device_ready(serial, token);
    if (!ready.success) {
        result.error = ready.error;
        return result;
    }

    command_runner::CheckedResult output = command_runner::run_checked(
        runner_, settings_.adb_path, {"-s", serial, "install", "-r", artifact_path},
        settings_.command_timeout_milliseconds);
    if (!output.success) {
        result.error = map_failure(output.failure, operation);
        return result;
    }

    DeviceListResult running = fetch_running();
    const Device *refreshed = running.success ? find_by_serial(running.devices, serial) : nullptr;
    if (refreshed != nullptr) {
        // adb knows nothing of the template; keep the caller's OS version, model and attributes.
        Device metadata = device;
        metadata.name = refreshed->name;
        result.device = merge_devices({*refreshed}, {metadata}).front();
    } else {
        result.device = device;
        result.device.native_identifier = serial;
        result.device.state = DeviceState::Booted;
        result.device.attributes["serial"] = serial;
        result.device.attributes["source"] = "running";
    }
    result.success = true;
    return result;
}

} // namespace emulator
