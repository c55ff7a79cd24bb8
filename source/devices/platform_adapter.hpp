#ifndef SIMDECK_PLATFORM_ADAPTER_HPP
#define SIMDECK_PLATFORM_ADAPTER_HPP

// Platform adapter interface.
// One implementation per device toolchain (simctl, adb/emulator). This keeps
// the aggregator and the tool layer decoupled from any particular toolchain.
//
// There are no inherited defaults: an adapter that does not support an
// operation says so explicitly with adapter_support::unsupported(), and one
// that restarts by shutdown + boot uses adapter_support::restart_by_cycle().

#include <string>

#include "devices/cancellation.hpp"
#include "devices/device_results.hpp"

namespace devices {

class PlatformAdapter {
public:
    virtual ~PlatformAdapter() = default;

    virtual DevicePlatform platform() const = 0;

    virtual DeviceListResult list_devices() = 0;

    virtual OperationResult boot(const Device &device, CancellationToken &token) = 0;

    virtual OperationResult shutdown(const Device &device, CancellationToken &token) = 0;

    virtual OperationResult restart(const Device &device, CancellationToken &token) = 0;

    // Delete the device definition.
    virtual OperationResult remove(const Device &device, CancellationToken &token) = 0;

    virtual StatusResult status(const Device &device) = 0;

    virtual OperationResult apply_battery(const Device &device, int level, bool charging) = 0;

    virtual OperationResult apply_location(const Device &device, double latitude, double longitude) = 0;

    // Returns the device as it is after installation (e.g. with a newly
    // resolved native identifier).
    virtual DeviceResult install_app(const Device &device, const std::string &artifact_path,
                                     CancellationToken &token) = 0;
};

namespace adapter_support {

// UnsupportedFeature error naming the feature and the platform.
DeviceError unsupported_error(const std::string &feature, DevicePlatform platform);

OperationResult unsupported(const std::string &feature, DevicePlatform platform);

// Shutdown, wait delay_milliseconds, then boot. Stops at the first failure.
OperationResult restart_by_cycle(PlatformAdapter &adapter, const Device &device,
                                 int delay_milliseconds, CancellationToken &token);

// TimedOut / Cancelled / passthrough error for a poll that did not succeed.
DeviceError poll_failure(const PollResult &poll_result, const std::string &operation,
                         const std::string &what);

} // namespace adapter_support

} // namespace devices

#endif // SIMDECK_PLATFORM_ADAPTER_HPP
