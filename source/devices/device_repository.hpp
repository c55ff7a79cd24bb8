#ifndef SIMDECK_DEVICE_REPOSITORY_HPP
#define SIMDECK_DEVICE_REPOSITORY_HPP

// Short-lived cache in front of the aggregator.
//
// A fetched list is served again until it is older than the validity window.
// Mutating calls clear it so the next fetch re-queries. Not thread-safe: the
// repository belongs to the server loop.

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "devices/device_aggregator.hpp"

namespace devices {

class DeviceRepository {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using ChangeListener = std::function<void()>;

    DeviceRepository(DeviceAggregator &aggregator, int cache_validity_milliseconds,
                     Clock clock = std::chrono::steady_clock::now);

    // Lists with platform failures are returned but never cached.
    DeviceListResult fetch_devices(bool force_refresh);

    // Looks the id up in the cached list, then once more after a forced refresh.
    DeviceResult find_device(const std::string &device_id);

    OperationResult boot(const Device &device, CancellationToken &token);
    OperationResult shutdown(const Device &device, CancellationToken &token);
    OperationResult restart(const Device &device, CancellationToken &token);
    OperationResult remove(const Device &device, CancellationToken &token);

    StatusResult status(const Device &device);
    OperationResult apply_battery(const Device &device, int level, bool charging);
    OperationResult apply_location(const Device &device, double latitude, double longitude);

    // Updates or appends the returned device in the cached list when that list
    // is still valid.
    DeviceResult install_app(const Device &device, const std::string &artifact_path,
                             CancellationToken &token);

    // Listeners run synchronously, in registration order, after every
    // invalidation or in-place update. Returns a handle for removal.
    int add_change_listener(ChangeListener listener);
    void remove_change_listener(int handle);

    void invalidate();

    bool has_valid_cache() const;

private:
    void notify_listeners();

    DeviceAggregator &aggregator_;
    std::chrono::milliseconds validity_;
    Clock clock_;

    std::vector<Device> cached_devices_;
    std::optional<std::chrono::steady_clock::time_point> cached_at_;

    std::vector<std::pair<int, ChangeListener>> listeners_;
    int next_listener_handle_ = 1;
};

} // namespace devices

#endif // SIMDECK_DEVICE_REPOSITORY_HPP
