#include "devices/device_model.hpp"
#include "devices/device_identity.hpp"
#include "utils/text_utils.hpp"

#include <ctime>

namespace devices {

Device make_device(DevicePlatform platform,
                   const std::string &natural_key,
                   const std::string &name,
                   const std::optional<std::string> &native_identifier,
                   DeviceState state) {
    Device device;
    device.id = derive_device_id(natural_key);
    device.name = name;
    device.platform = platform;
    if (native_identifier.has_value() && !native_identifier->empty()) {
        device.native_identifier = native_identifier;
        device.state = state;
    } else {
        device.state = DeviceState::Shutdown;
    }
    return device;
}

DeviceStatus make_status(DeviceState state, std::map<std::string, std::string> additional_info) {
    DeviceStatus status;
    status.state = state;
    status.last_updated = std::chrono::system_clock::now();
    status.additional_info = std::move(additional_info);
    return status;
}

std::string platform_name(DevicePlatform platform) {
    switch (platform) {
    case DevicePlatform::Simulator:
        return "ios";
    case DevicePlatform::Emulator:
        return "android";
    }
    return "unknown";
}

bool parse_platform(const std::string &text, DevicePlatform &out_platform) {
    std::string normalized = text_utils::to_lower(text_utils::trim(text));
    if (normalized == "ios" || normalized == "simulator") {
        out_platform = DevicePlatform::Simulator;
        return true;
    }
    if (normalized == "android" || normalized == "emulator") {
        out_platform = DevicePlatform::Emulator;
        return true;
    }
    return false;
}

std::string state_name(DeviceState state) {
    switch (state) {
    case DeviceState::Shutdown:
        return "shutdown";
    case DeviceState::Booting:
        return "booting";
    case DeviceState::Booted:
        return "booted";
    case DeviceState::ShuttingDown:
        return "shutting_down";
    case DeviceState::Unknown:
        return "unknown";
    }
    return "unknown";
}

static std::string format_utc(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc_time{};
    gmtime_r(&seconds, &utc_time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc_time);
    return buffer;
}

bool listed_before(const Device &left, const Device &right) {
    if (left.name != right.name) {
        return left.name < right.name;
    }
    return left.id < right.id;
}

json device_to_json(const Device &device) {
    json entry;
    entry["id"] = device.id;
    entry["name"] = device.name;
    entry["platform"] = platform_name(device.platform);
    entry["native_identifier"] = device.native_identifier.has_value()
                                     ? json(*device.native_identifier) : json(nullptr);
    entry["state"] = state_name(device.state);
    entry["is_available"] = device.is_available;
    entry["os_version"] = device.os_version.has_value() ? json(*device.os_version) : json(nullptr);
    entry["model"] = device.model.has_value() ? json(*device.model) : json(nullptr);
    entry["attributes"] = device.attributes;
    return entry;
}

json status_to_json(const DeviceStatus &status) {
    json entry;
    entry["state"] = state_name(status.state);
    entry["last_updated"] = format_utc(status.last_updated);
    entry["additional_info"] = status.additional_info;
    return entry;
}

} // namespace devices
