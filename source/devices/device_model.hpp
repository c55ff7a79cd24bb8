#ifndef SIMDECK_DEVICE_MODEL_HPP
#define SIMDECK_DEVICE_MODEL_HPP

// Device data model shared by every platform adapter, the aggregator, the
// repository and the tool layer.

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace devices {

using json = nlohmann::json;

// Platform A is the iOS-style simulator toolchain (xcrun simctl),
// platform B the Android-style emulator toolchain (adb + emulator).
enum class DevicePlatform {
    Simulator,
    Emulator
};

// Not every platform can observe every intermediate state.
enum class DeviceState {
    Shutdown,
    Booting,
    Booted,
    ShuttingDown,
    Unknown
};

struct Device {
    std::string id;   // stable, derived from the natural key
    std::string name;
    DevicePlatform platform = DevicePlatform::Simulator;
    std::optional<std::string> native_identifier; // UDID or emulator serial
    DeviceState state = DeviceState::Unknown;
    bool is_available = true;
    std::optional<std::string> os_version;
    std::optional<std::string> model;
    std::map<std::string, std::string> attributes;
};

// Point-in-time snapshot, created fresh by every status query.
struct DeviceStatus {
    DeviceState state = DeviceState::Unknown;
    std::chrono::system_clock::time_point last_updated;
    std::map<std::string, std::string> additional_info;
};

// Builds a device whose id is derived from natural_key. A device without a
// native identifier exists only as a template, so its state is forced to Shutdown.
Device make_device(DevicePlatform platform,
                   const std::string &natural_key,
                   const std::string &name,
                   const std::optional<std::string> &native_identifier,
                   DeviceState state);

DeviceStatus make_status(DeviceState state,
                         std::map<std::string, std::string> additional_info = {});

// Wire names: "ios" / "android".
std::string platform_name(DevicePlatform platform);
bool parse_platform(const std::string &text, DevicePlatform &out_platform);

// Wire names: "shutdown", "booting", "booted", "shutting_down", "unknown".
std::string state_name(DeviceState state);

// Listing order: by name, then id.
bool listed_before(const Device &left, const Device &right);

json device_to_json(const Device &device);
json status_to_json(const DeviceStatus &status);

} // namespace devices

#endif // SIMDECK_DEVICE_MODEL_HPP
