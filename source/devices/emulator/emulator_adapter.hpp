#ifndef SIMDECK_EMULATOR_ADAPTER_HPP
#define SIMDECK_EMULATOR_ADAPTER_HPP

// Platform B adapter: emulator templates (AVDs) launched with `emulator` and
// controlled through `adb`.
//
// A template has no runtime handle until it is launched; a running instance is
// addressed by its adb serial (emulator-<port>). Both share one identity, keyed
// by the AVD name, so a device keeps its id across boot/shutdown cycles.

#include <string>
#include <vector>

#include "command/command_runner.hpp"
#include "config/config.hpp"
#include "devices/emulator/emulator_parser.hpp"
#include "devices/platform_adapter.hpp"

namespace emulator {

struct EmulatorSettings {
    std::string adb_path;
    std::string emulator_path;
    std::string avd_home; // directory holding <name>.avd/ and <name>.ini
    std::string skin = "1080x1920";
    int command_timeout_milliseconds = command_runner::kDefaultTimeoutMilliseconds;
    devices::PollSettings boot_poll{1000, 60};
    devices::PollSettings shutdown_poll{1000, 15};
    devices::PollSettings ready_poll{1000, 60};
    int restart_delay_milliseconds = 2000;
};

EmulatorSettings make_emulator_settings(const config::SimdeckConfig &config);

class EmulatorAdapter : public devices::PlatformAdapter {
public:
    EmulatorAdapter(command_runner::Runner &runner, EmulatorSettings settings);

    devices::DevicePlatform platform() const override;

    // Running instances and templates are queried concurrently and merged.
    devices::DeviceListResult list_devices() override;

    devices::OperationResult boot(const devices::Device &device,
                                  devices::CancellationToken &token) override;

    // A kill that is not observed within the poll bound still counts as success.
    devices::OperationResult shutdown(const devices::Device &device,
                                      devices::CancellationToken &token) override;

    devices::OperationResult restart(const devices::Device &device,
                                     devices::CancellationToken &token) override;

    devices::OperationResult remove(const devices::Device &device,
                                    devices::CancellationToken &token) override;

    devices::StatusResult status(const devices::Device &device) override;

    devices::OperationResult apply_battery(const devices::Device &device, int level,
                                           bool charging) override;

    devices::OperationResult apply_location(const devices::Device &device, double latitude,
                                            double longitude) override;

    // Launches the template first when the device has no serial.
    devices::DeviceResult install_app(const devices::Device &device,
                                      const std::string &artifact_path,
                                      devices::CancellationToken &token) override;

private:
    devices::DeviceListResult fetch_running();
    devices::DeviceListResult fetch_templates();

    std::string resolve_instance_name(const RunningInstance &instance);

    bool require_tool(const std::string &path, const std::string &label,
                      const std::string &operation, devices::DeviceError &out_error) const;

    bool ensure_serial(const devices::Device &device, devices::CancellationToken &token,
                       std::string &out_serial, devices::DeviceError &out_error);

    devices::OperationResult wait_for_device_ready(const std::string &serial,
                                                   devices::CancellationToken &token);

    devices::DeviceError map_failure(const command_runner::ExecutionFailure &failure,
                                     const std::string &operation) const;

    command_runner::Runner &runner_;
    EmulatorSettings settings_;
};

} // namespace emulator

#endif // SIMDECK_EMULATOR_ADAPTER_HPP
