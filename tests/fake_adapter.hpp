#ifndef SIMDECK_FAKE_ADAPTER_HPP
#define SIMDECK_FAKE_ADAPTER_HPP

// In-memory PlatformAdapter for aggregator, repository and tool tests.

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "devices/platform_adapter.hpp"

namespace test_support {

class FakeAdapter : public devices::PlatformAdapter {
public:
    explicit FakeAdapter(devices::DevicePlatform platform) : platform_(platform) {}

    void set_devices(const std::vector<devices::Device> &devices) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_ = devices;
    }

    // When set, list_devices() fails with this error.
    void fail_listing(const devices::DeviceError &error) {
        std::lock_guard<std::mutex> lock(mutex_);
        listing_error_ = error;
        listing_fails_ = true;
    }

    // Replaces the default (successful, no-op) boot.
    std::function<devices::OperationResult(const devices::Device &)> boot_hook;

    devices::DevicePlatform platform() const override { return platform_; }

    devices::DeviceListResult list_devices() override {
        list_calls++;
        std::lock_guard<std::mutex> lock(mutex_);
        devices::DeviceListResult result;
        if (listing_fails_) {
            result.error = listing_error_;
            return result;
        }
        result.success = true;
        result.devices = devices_;
        return result;
    }

    devices::OperationResult boot(const devices::Device &device, devices::CancellationToken &) override {
        boot_calls++;
        if (boot_hook) {
            return boot_hook(device);
        }
        return devices::operation_ok();
    }

    devices::OperationResult shutdown(const devices::Device &, devices::CancellationToken &) override {
        shutdown_calls++;
        return devices::operation_ok();
    }

    devices::OperationResult restart(const devices::Device &device, devices::CancellationToken &token) override {
        return devices::adapter_support::restart_by_cycle(*this, device, 0, token);
    }

    devices::OperationResult remove(const devices::Device &, devices::CancellationToken &) override {
        return devices::adapter_support::unsupported("delete", platform_);
    }

    devices::StatusResult status(const devices::Device &device) override {
        devices::StatusResult result;
        result.success = true;
        result.status = devices::make_status(device.state, {{"fake", "yes"}});
        return result;
    }

    devices::OperationResult apply_battery(const devices::Device &, int level, bool) override {
        last_battery_level = level;
        return devices::operation_ok();
    }

    devices::OperationResult apply_location(const devices::Device &, double, double) override {
        return devices::adapter_support::unsupported("location simulation", platform_);
    }

    devices::DeviceResult install_app(const devices::Device &device, const std::string &,
                                      devices::CancellationToken &) override {
        devices::DeviceResult result;
        result.success = true;
        result.device = device;
        result.device.state = devices::DeviceState::Booted;
        result.device.native_identifier = "installed-serial";
        return result;
    }

    std::atomic<int> list_calls{0};
    std::atomic<int> boot_calls{0};
    std::atomic<int> shutdown_calls{0};
    std::atomic<int> last_battery_level{-1};

private:
    devices::DevicePlatform platform_;
    std::mutex mutex_;
    std::vector<devices::Device> devices_;
    bool listing_fails_ = false;
    devices::DeviceError listing_error_;
};

} // namespace test_support

#endif // SIMDECK_FAKE_ADAPTER_HPP
