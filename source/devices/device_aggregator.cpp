#include "devices/device_aggregator.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <future>

namespace devices {

DeviceAggregator::DeviceAggregator(std::vector<PlatformAdapter *> adapters)
    : adapters_(std::move(adapters)) {}

PlatformAdapter *DeviceAggregator::adapter_for(DevicePlatform platform) const {
    for (PlatformAdapter *adapter : adapters_) {
        if (adapter->platform() == platform) {
            return adapter;
        }
    }
    return nullptr;
}

DeviceListResult DeviceAggregator::list_devices() {
    DeviceListResult result;
    if (adapters_.empty()) {
        result.error = make_error(ErrorKind::ConfigurationError, "no platform adapters are registered",
                                  "list");
        return result;
    }

    std::vector<std::future<DeviceListResult>> pending;
    for (PlatformAdapter *adapter : adapters_) {
        pending.push_back(std::async(std::launch::async, [adapter]() { return adapter->list_devices(); }));
    }

    bool any_success = false;
    for (size_t index = 0; index < pending.size(); ++index) {
        DeviceListResult platform_result = pending[index].get();
        if (platform_result.success) {
            any_success = true;
            result.devices.insert(result.devices.end(), platform_result.devices.begin(),
                                  platform_result.devices.end());
            continue;
        }

        PlatformFailure failure;
        failure.platform = adapters_[index]->platform();
        failure.error = platform_result.error;
        debug_log::log("listing failed for " + platform_name(failure.platform) + ": " +
                       describe(failure.error));
        result.platform_failures.push_back(failure);
    }

    if (!any_success) {
        result.error = result.platform_failures.front().error;
        result.devices.clear();
        return result;
    }

    std::stable_sort(result.devices.begin(), result.devices.end(), listed_before);
    result.success = true;
    return result;
}

std::shared_ptr<std::mutex> DeviceAggregator::device_mutex(const std::string &device_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    std::shared_ptr<std::mutex> &entry = device_locks_[device_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

// Entries are copied and dropped only under locks_mutex_, so use_count() is exact here.
void DeviceAggregator::release_device_mutex(const std::string &device_id,
                                            std::shared_ptr<std::mutex> &device_lock) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    device_lock.reset();
    auto entry = device_locks_.find(device_id);
    if (entry != device_locks_.end() && entry->second.use_count() == 1) {
        device_locks_.erase(entry);
    }
}

size_t DeviceAggregator::locked_device_count() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return device_locks_.size();
}

template <typename Result, typename Call>
Result DeviceAggregator::route(const Device &device, const std::string &operation, bool serialize,
                               Call call) {
    PlatformAdapter *adapter = adapter_for(device.platform);
    if (adapter == nullptr) {
        Result result;
        result.error = make_error(ErrorKind::UnsupportedFeature,
                                  "no adapter for platform '" + platform_name(device.platform) + "'",
                                  operation);
        return result;
    }

    if (!serialize) {
        return call(*adapter);
    }
    std::shared_ptr<std::mutex> device_lock = device_mutex(device.id);
    Result result;
    {
        std::lock_guard<std::mutex> lock(*device_lock);
        result = call(*adapter);
    }
    release_device_mutex(device.id, device_lock);
    return result;
}

OperationResult DeviceAggregator::boot(const Device &device, CancellationToken &token) {
    return route<OperationResult>(device, "boot", true,
                                  [&](PlatformAdapter &adapter) { return adapter.boot(device, token); });
}

OperationResult DeviceAggregator::shutdown(const Device &device, CancellationToken &token) {
    return route<OperationResult>(device, "shutdown", true, [&](PlatformAdapter &adapter) {
        return adapter.shutdown(device, token);
    });
}

OperationResult DeviceAggregator::restart(const Device &device, CancellationToken &token) {
    return route<OperationResult>(device, "restart", true, [&](PlatformAdapter &adapter) {
        return adapter.restart(device, token);
    });
}

OperationResult DeviceAggregator::remove(const Device &device, CancellationToken &token) {
    return route<OperationResult>(device, "delete", true, [&](PlatformAdapter &adapter) {
        return adapter.remove(device, token);
    });
}

StatusResult DeviceAggregator::status(const Device &device) {
    return route<StatusResult>(device, "status", false,
                               [&](PlatformAdapter &adapter) { return adapter.status(device); });
}

OperationResult DeviceAggregator::apply_battery(const Device &device, int level, bool charging) {
    return route<OperationResult>(device, "set battery", true, [&](PlatformAdapter &adapter) {
        return adapter.apply_battery(device, level, charging);
    });
}

OperationResult DeviceAggregator::apply_location(const Device &device, double latitude,
                                                 double longitude) {
    return route<OperationResult>(device, "set location", true, [&](PlatformAdapter &adapter) {
        return adapter.apply_location(device, latitude, longitude);
    });
}

DeviceResult DeviceAggregator::install_app(const Device &device, const std::string &artifact_path,
                                           CancellationToken &token) {
    return route<DeviceResult>(device, "install", true, [&](PlatformAdapter &adapter) {
        return adapter.install_app(device, artifact_path, token);
    });
}

} // namespace devices
