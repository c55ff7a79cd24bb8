#ifndef SIMDECK_DEVICE_AGGREGATOR_HPP
#define SIMDECK_DEVICE_AGGREGATOR_HPP

// Fans listing out to every registered platform adapter and routes control
// operations to the adapter that owns the device's platform.
//
// Listing returns partial results: a platform whose listing fails is reported
// in platform_failures and the call only fails when every platform fails.
// Mutating operations on the same device id are serialized.

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "devices/platform_adapter.hpp"

namespace devices {

class DeviceAggregator {
public:
    // Adapters are not owned and must outlive the aggregator.
    explicit DeviceAggregator(std::vector<PlatformAdapter *> adapters);

    // Sorted by name, then id.
    DeviceListResult list_devices();

    OperationResult boot(const Device &device, CancellationToken &token);
    OperationResult shutdown(const Device &device, CancellationToken &token);
    OperationResult restart(const Device &device, CancellationToken &token);
    OperationResult remove(const Device &device, CancellationToken &token);
    StatusResult status(const Device &device);
    OperationResult apply_battery(const Device &device, int level, bool charging);
    OperationResult apply_location(const Device &device, double latitude, double longitude);
    DeviceResult install_app(const Device &device, const std::string &artifact_path,
                             CancellationToken &token);

    // nullptr when no adapter is registered for the platform.
    PlatformAdapter *adapter_for(DevicePlatform platform) const;

    // Device ids with an operation running or waiting.
    size_t locked_device_count() const;

private:
    std::shared_ptr<std::mutex> device_mutex(const std::string &device_id);
    void release_device_mutex(const std::string &device_id, std::shared_ptr<std::mutex> &device_lock);

    template <typename Result, typename Call>
    Result route(const Device &device, const std::string &operation, bool serialize, Call call);

    std::vector<PlatformAdapter *> adapters_;

    mutable std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> device_locks_;
};

} // namespace devices

#endif // SIMDECK_DEVICE_AGGREGATOR_HPP
