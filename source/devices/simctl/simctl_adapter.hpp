#ifndef SIMDECK_SIMCTL_ADAPTER_HPP
#define SIMDECK_SIMCTL_ADAPTER_HPP

// Platform A adapter: simulators driven through `xcrun simctl`.
//
// Every simulator has a persistent UDID, so every operation addresses the
// device by UDID. State transitions are observed by re-listing and polling.

#include <string>
#include <vector>

#include "command/command_runner.hpp"
#include "config/config.hpp"
#include "devices/platform_adapter.hpp"
#include "devices/simctl/simctl_parser.hpp"

namespace simctl {

struct SimctlSettings {
    std::string xcrun_path = "/usr/bin/xcrun";
    std::vector<std::string> viewer_command; // empty: never foreground a viewer
    int command_timeout_milliseconds = command_runner::kDefaultTimeoutMilliseconds;
    devices::PollSettings boot_poll{1000, 20};
    devices::PollSettings shutdown_poll{1000, 10};
    int restart_delay_milliseconds = 2000;
};

SimctlSettings make_simctl_settings(const config::SimdeckConfig &config);

struct CreateResult {
    bool success = false;
    std::string udid;
    devices::DeviceError error;
};

struct DeviceTypesResult {
    bool success = false;
    std::vector<SimulatorDeviceType> device_types;
    devices::DeviceError error;
};

struct RuntimesResult {
    bool success = false;
    std::vector<SimulatorRuntime> runtimes;
    devices::DeviceError error;
};

class SimctlAdapter : public devices::PlatformAdapter {
public:
    SimctlAdapter(command_runner::Runner &runner, SimctlSettings settings);

    devices::DevicePlatform platform() const override;

    devices::DeviceListResult list_devices() override;

    // booted: foreground only. booting: wait, then foreground.
    // shutting down: wait for shutdown, then boot. otherwise: boot and wait.
    devices::OperationResult boot(const devices::Device &device,
                                  devices::CancellationToken &token) override;

    // Issues the shutdown and returns without waiting for it to complete.
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

    // Requires an existing artifact and an already booted simulator.
    devices::DeviceResult install_app(const devices::Device &device,
                                      const std::string &artifact_path,
                                      devices::CancellationToken &token) override;

    CreateResult create_simulator(const std::string &name,
                                  const std::string &device_type_identifier,
                                  const std::string &runtime_identifier);

    DeviceTypesResult list_device_types();

    // Available runtimes only.
    RuntimesResult list_runtimes();

private:
    command_runner::CheckedResult run_simctl(const std::vector<std::string> &arguments);

    devices::DeviceError map_failure(const command_runner::ExecutionFailure &failure,
                                     const std::string &operation) const;

    bool require_udid(const devices::Device &device, const std::string &operation,
                      std::string &out_udid, devices::DeviceError &out_error) const;

    bool require_xcrun(const std::string &operation, devices::DeviceError &out_error) const;

    bool current_state(const std::string &udid, devices::DeviceState &out_state,
                       devices::DeviceError &out_error);

    devices::OperationResult wait_for_state(const std::string &udid,
                                            devices::DeviceState target,
                                            const devices::PollSettings &poll,
                                            const std::string &operation,
                                            devices::CancellationToken &token);

    devices::OperationResult shutdown_udid(const std::string &udid);

    void foreground_viewer();

    command_runner::Runner &runner_;
    SimctlSettings settings_;
};

} // namespace simctl

#endif // SIMDECK_SIMCTL_ADAPTER_HPP
