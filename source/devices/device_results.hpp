#ifndef SIMDECK_DEVICE_RESULTS_HPP
#define SIMDECK_DEVICE_RESULTS_HPP

// Result structs returned by adapters, the aggregator and the repository.
// success == false always comes with a populated error.

#include <vector>

#include "devices/device_error.hpp"
#include "devices/device_model.hpp"

namespace devices {

struct OperationResult {
    bool success = false;
    DeviceError error;
};

// One platform whose listing failed while others succeeded.
struct PlatformFailure {
    DevicePlatform platform = DevicePlatform::Simulator;
    DeviceError error;
};

struct DeviceListResult {
    bool success = false;
    std::vector<Device> devices;
    std::vector<PlatformFailure> platform_failures;
    DeviceError error;
};

struct DeviceResult {
    bool success = false;
    Device device;
    DeviceError error;
};

struct StatusResult {
    bool success = false;
    DeviceStatus status;
    DeviceError error;
};

inline OperationResult operation_ok() {
    OperationResult result;
    result.success = true;
    return result;
}

inline OperationResult operation_failed(const DeviceError &error) {
    OperationResult result;
    result.error = error;
    return result;
}

} // namespace devices

#endif // SIMDECK_DEVICE_RESULTS_HPP
