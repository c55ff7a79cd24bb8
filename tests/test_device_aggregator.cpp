// Tests for cross-platform listing and per-device operation routing.

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "devices/device_aggregator.hpp"
#include "fake_adapter.hpp"
#include "test_support.hpp"

using test_support::expect;
using test_support::FakeAdapter;
using devices::DevicePlatform;
using devices::DeviceState;
using devices::ErrorKind;

namespace test_device_aggregator {

static devices::Device named(DevicePlatform platform, const std::string &key, const std::string &name) {
    return devices::make_device(platform, key, name, std::string(key), DeviceState::Shutdown);
}

static bool test_merged_and_sorted() {
    FakeAdapter simulators(DevicePlatform::Simulator);
    FakeAdapter emulators(DevicePlatform::Emulator);
    simulators.set_devices({named(DevicePlatform::Simulator, "u1", "iPhone 15"),
                            named(DevicePlatform::Simulator, "u2", "Beta")});
    emulators.set_devices({named(DevicePlatform::Emulator, "e1", "Alpha")});
    devices::DeviceAggregator aggregator({&simulators, &emulators});
    devices::DeviceListResult result = aggregator.list_devices();
    bool success = result.success && result.devices.size() == 3 && result.platform_failures.empty() &&
                   result.devices[0].name == "Alpha" && result.devices[1].name == "Beta" &&
                   result.devices[2].name == "iPhone 15";
    return expect(success, "Listing merges every platform and sorts by name");
}

static bool test_partial_failure() {
    FakeAdapter simulators(DevicePlatform::Simulator);
    FakeAdapter emulators(DevicePlatform::Emulator);
    simulators.fail_listing(devices::make_error(ErrorKind::ConfigurationError, "xcrun missing"));
    emulators.set_devices({named(DevicePlatform::Emulator, "e1", "Pixel")});
    devices::DeviceAggregator aggregator({&simulators, &emulators});
    devices::DeviceListResult result = aggregator.list_devices();
    bool success = result.success && result.devices.size() == 1 &&
                   result.platform_failures.size() == 1 &&
                   result.platform_failures[0].platform == DevicePlatform::Simulator &&
                   result.platform_failures[0].error.kind == ErrorKind::ConfigurationError;
    return expect(success, "One failing platform yields a partial list with the failure attached");
}

static bool test_total_failure() {
    FakeAdapter simulators(DevicePlatform::Simulator);
    FakeAdapter emulators(DevicePlatform::Emulator);
    simulators.fail_listing(devices::make_error(ErrorKind::ConfigurationError, "xcrun missing"));
    emulators.fail_listing(devices::make_error(ErrorKind::CommandFailed, "adb broke"));
    devices::DeviceAggregator aggregator({&simulators, &emulators});
    devices::DeviceListResult result = aggregator.list_devices();
    devices::DeviceAggregator empty(std::vector<devices::PlatformAdapter *>{});
    devices::DeviceListResult none = empty.list_devices();
    return expect(!result.success && result.error.kind == ErrorKind::ConfigurationError &&
                      result.platform_failures.size() == 2 && result.devices.empty() &&
                      !none.success,
                  "Listing fails only when every platform fails");
}

static bool test_routing_by_platform() {
    FakeAdapter simulators(DevicePlatform::Simulator);
    FakeAdapter emulators(DevicePlatform::Emulator);
    devices::DeviceAggregator aggregator({&simulators, &emulators});
    devices::CancellationToken token;
    bool booted = aggregator.boot(named(DevicePlatform::Emulator, "e1", "Pixel"), token).success;
    bool charged = aggregator.apply_battery(named(DevicePlatform::Simulator, "u1", "iPhone"), 42, false).success;
    devices::OperationResult located =
        aggregator.apply_location(named(DevicePlatform::Emulator, "e1", "Pixel"), 1.0, 2.0);
    bool success = booted && charged && emulators.boot_calls == 1 && simulators.boot_calls == 0 &&
                   simulators.last_battery_level == 42 &&
                   located.error.kind == ErrorKind::UnsupportedFeature;
    return expect(success, "Operations reach the adapter that owns the device's platform");
}

static bool test_missing_adapter() {
    FakeAdapter simulators(DevicePlatform::Simulator);
    devices::DeviceAggregator aggregator({&simulators});
    devices::CancellationToken token;
    devices::OperationResult result = aggregator.boot(named(DevicePlatform::Emulator, "e1", "Pixel"), token);
    devices::StatusResult status = aggregator.status(named(DevicePlatform::Emulator, "e1", "Pixel"));
    return expect(!result.success && result.error.kind == ErrorKind::UnsupportedFeature &&
                      result.error.operation == "boot" && !status.success,
                  "Devices of an unregistered platform are unsupported");
}

static bool test_restart_through_adapter() {
    FakeAdapter emulators(DevicePlatform::Emulator);
    devices::DeviceAggregator aggregator({&emulators});
    devices::CancellationToken token;
    bool restarted = aggregator.restart(named(DevicePlatform::Emulator, "e1", "Pixel"), token).success;
    return expect(restarted && emulators.shutdown_calls == 1 && emulators.boot_calls == 1,
                  "Restart runs shutdown then boot on the adapter");
}

static bool test_different_devices_run_concurrently() {
    FakeAdapter emulators(DevicePlatform::Emulator);
    std::mutex mutex;
    std::condition_variable condition;
    int entered = 0;
    bool both_seen = true;
    emulators.boot_hook = [&](const devices::Device &) {
        std::unique_lock<std::mutex> lock(mutex);
        entered++;
        condition.notify_all();
        if (!condition.wait_for(lock, std::chrono::seconds(2), [&]() { return entered >= 2; })) {
            both_seen = false;
        }
        return devices::operation_ok();
    };
    devices::DeviceAggregator aggregator({&emulators});
    devices::CancellationToken token;
    std::thread first([&]() { aggregator.boot(named(DevicePlatform::Emulator, "e1", "One"), token); });
    std::thread second([&]() { aggregator.boot(named(DevicePlatform::Emulator, "e2", "Two"), token); });
    first.join();
    second.join();
    return expect(both_seen && entered == 2, "Operations on different devices proceed in parallel");
}

static bool test_same_device_is_serialized() {
    FakeAdapter emulators(DevicePlatform::Emulator);
    std::mutex mutex;
    int active = 0;
    int peak = 0;
    emulators.boot_hook = [&](const devices::Device &) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            active++;
            peak = std::max(peak, active);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        {
            std::lock_guard<std::mutex> lock(mutex);
            active--;
        }
        return devices::operation_ok();
    };
    devices::DeviceAggregator aggregator({&emulators});
    devices::CancellationToken token;
    devices::Device device = named(DevicePlatform::Emulator, "e1", "One");
    std::thread first([&]() { aggregator.boot(device, token); });
    std::thread second([&]() { aggregator.boot(device, token); });
    std::thread third([&]() { aggregator.boot(device, token); });
    first.join();
    second.join();
    third.join();
    return expect(peak == 1 && emulators.boot_calls == 3 && aggregator.locked_device_count() == 0,
                  "Operations on the same device never overlap");
}

static bool test_device_locks_are_released() {
    FakeAdapter emulators(DevicePlatform::Emulator);
    devices::DeviceAggregator aggregator({&emulators});
    size_t during_boot = 0;
    emulators.boot_hook = [&](const devices::Device &) {
        during_boot = aggregator.locked_device_count();
        return devices::operation_ok();
    };
    devices::CancellationToken token;
    for (int index = 0; index < 5; ++index) {
        std::string key = "e" + std::to_string(index);
        aggregator.boot(named(DevicePlatform::Emulator, key, key), token);
    }
    aggregator.apply_battery(named(DevicePlatform::Emulator, "e9", "Nine"), 40, false);
    return expect(during_boot == 1 && aggregator.locked_device_count() == 0,
                  "Per-device locks are dropped once no operation holds them");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_merged_and_sorted();
    all_passed &= test_partial_failure();
    all_passed &= test_total_failure();
    all_passed &= test_routing_by_platform();
    all_passed &= test_missing_adapter();
    all_passed &= test_restart_through_adapter();
    all_passed &= test_different_devices_run_concurrently();
    all_passed &= test_same_device_is_serialized();
    all_passed &= test_device_locks_are_released();
    return all_passed;
}

} // namespace test_device_aggregator
