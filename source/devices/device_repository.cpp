#include "devices/device_repository.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>

namespace devices {

DeviceRepository::DeviceRepository(DeviceAggregator &aggregator, int cache_validity_milliseconds,
                                   Clock clock)
    : aggregator_(aggregator), validity_(cache_validity_milliseconds), clock_(std::move(clock)) {}

bool DeviceRepository::has_valid_cache() const {
    if (!cached_at_) {
        return false;
    }
    return clock_() - *cached_at_ < validity_;
}

DeviceListResult DeviceRepository::fetch_devices(bool force_refresh) {
    if (!force_refresh && has_valid_cache()) {
        debug_log::log("device list served from cache");
        DeviceListResult cached;
        cached.success = true;
        cached.devices = cached_devices_;
        return cached;
    }

    DeviceListResult result = aggregator_.list_devices();
    if (!result.success) {
        return result;
    }
    if (result.platform_failures.empty()) {
        cached_devices_ = result.devices;
        cached_at_ = clock_();
    } else {
        cached_at_.reset();
    }
    return result;
}

DeviceResult DeviceRepository::find_device(const std::string &device_id) {
    DeviceResult result;
    for (int pass = 0; pass < 2; ++pass) {
        DeviceListResult listing = fetch_devices(pass == 1);
        if (!listing.success) {
            result.error = listing.error;
            return result;
        }
        for (const auto &device : listing.devices) {
            if (device.id == device_id) {
                result.device = device;
                result.success = true;
                return result;
            }
        }
    }
    result.error = make_error(ErrorKind::DeviceNotFound, "no device with id " + device_id, "find");
    return result;
}

void DeviceRepository::invalidate() {
    cached_at_.reset();
    notify_listeners();
}

OperationResult DeviceRepository::boot(const Device &device, CancellationToken &token) {
    OperationResult result = aggregator_.boot(device, token);
    invalidate();
    return result;
}

OperationResult DeviceRepository::shutdown(const Device &device, CancellationToken &token) {
    OperationResult result = aggregator_.shutdown(device, token);
    invalidate();
    return result;
}

OperationResult DeviceRepository::restart(const Device &device, CancellationToken &token) {
    OperationResult result = aggregator_.restart(device, token);
    invalidate();
    return result;
}

OperationResult DeviceRepository::remove(const Device &device, CancellationToken &token) {
    OperationResult result = aggregator_.remove(device, token);
    invalidate();
    return result;
}

StatusResult DeviceRepository::status(const Device &device) {
    return aggregator_.status(device);
}

OperationResult DeviceRepository::apply_battery(const Device &device, int level, bool charging) {
    return aggregator_.apply_battery(device, level, charging);
}

OperationResult DeviceRepository::apply_location(const Device &device, double latitude,
                                                 double longitude) {
    return aggregator_.apply_location(device, latitude, longitude);
}

DeviceResult DeviceRepository::install_app(const Device &device, const std::string &artifact_path,
                                           CancellationToken &token) {
    DeviceResult result = aggregator_.install_app(device, artifact_path, token);
    if (!result.success) {
        return result;
    }

    // Without a live list there is nothing to patch; the next fetch re-queries.
    if (!has_valid_cache()) {
        notify_listeners();
        return result;
    }

    auto existing = std::find_if(cached_devices_.begin(), cached_devices_.end(),
                                 [&](const Device &cached) { return cached.id == result.device.id; });
    if (existing != cached_devices_.end()) {
        *existing = result.device;
    } else {
        cached_devices_.push_back(result.device);
        std::stable_sort(cached_devices_.begin(), cached_devices_.end(), listed_before);
    }
    cached_at_ = clock_();
    notify_listeners();
    return result;
}

int DeviceRepository::add_change_listener(ChangeListener listener) {
    int handle = next_listener_handle_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

void DeviceRepository::remove_change_listener(int handle) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [handle](const std::pair<int, ChangeListener> &entry) {
                                        return entry.first == handle;
                                    }),
                     listeners_.end());
}

void DeviceRepository::notify_listeners() {
    // Copy so a listener may unregister itself.
    std::vector<std::pair<int, ChangeListener>> snapshot = listeners_;
    for (const auto &entry : snapshot) {
        entry.second();
    }
}

} // namespace devices
