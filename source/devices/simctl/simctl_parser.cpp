#include "devices/simctl/simctl_parser.hpp"
#include "utils/text_utils.hpp"

#include <nlohmann/json.hpp>

namespace simctl {

using json = nlohmann::json;
using devices::Device;
using devices::DeviceState;

static const char RUNTIME_PREFIX[] = "com.apple.CoreSimulator.SimRuntime.";
static const char DEVICE_TYPE_PREFIX[] = "com.apple.CoreSimulator.SimDeviceType.";

namespace {

// "17-0" -> "17.0", "17-0-1" -> "17.0.1"
std::string format_os_version(const std::string &os_name, const std::string &version) {
    return os_name + " " + text_utils::replace_all(version, "-", ".");
}

std::string string_field(const json &object, const char *key) {
    auto iterator = object.find(key);
    if (iterator == object.end() || !iterator->is_string()) {
        return "";
    }
    return iterator->get<std::string>();
}

bool bool_field(const json &object, const char *key, bool fallback) {
    auto iterator = object.find(key);
    if (iterator == object.end() || !iterator->is_boolean()) {
        return fallback;
    }
    return iterator->get<bool>();
}

bool parse_document(const std::string &json_text, const char *array_key, json &out_array,
                    std::string &error_message) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error &error) {
        error_message = std::string("malformed simctl output: ") + error.what();
        return false;
    }
    if (!document.is_object() || !document.contains(array_key)) {
        error_message = std::string("simctl output has no '") + array_key + "' member";
        return false;
    }
    out_array = document.at(array_key);
    return true;
}

} // namespace

std::string extract_os_version(const std::string &runtime_identifier) {
    std::string cleaned = text_utils::replace_all(runtime_identifier, RUNTIME_PREFIX, "");

    static const char *const os_names[] = {"iOS", "watchOS", "tvOS"};
    for (const char *os_name : os_names) {
        std::string prefix = std::string(os_name) + "-";
        if (text_utils::starts_with(cleaned, prefix)) {
            return format_os_version(os_name, cleaned.substr(prefix.size()));
        }
    }
    return text_utils::replace_all(cleaned, "-", ".");
}

std::string extract_device_model(const std::string &device_type_identifier) {
    std::string cleaned = text_utils::replace_all(device_type_identifier, DEVICE_TYPE_PREFIX, "");
    return text_utils::replace_all(cleaned, "-", " ");
}

DeviceState map_state(const std::string &state_text) {
    std::string lowered = text_utils::to_lower(text_utils::trim(state_text));
    if (lowered == "booted") {
        return DeviceState::Booted;
    }
    if (lowered == "shutdown") {
        return DeviceState::Shutdown;
    }
    if (lowered == "booting") {
        return DeviceState::Booting;
    }
    if (lowered == "shutting down") {
        return DeviceState::ShuttingDown;
    }
    return DeviceState::Unknown;
}

bool parse_device_list(const std::string &json_text, std::vector<Device> &out_devices,
                       std::string &error_message) {
    json runtimes;
    if (!parse_document(json_text, "devices", runtimes, error_message)) {
        return false;
    }
    if (!runtimes.is_object()) {
        error_message = "simctl 'devices' member is not an object";
        return false;
    }

    std::vector<Device> parsed;
    for (auto runtime = runtimes.begin(); runtime != runtimes.end(); ++runtime) {
        if (!runtime.value().is_array()) {
            continue;
        }
        const std::string &runtime_key = runtime.key();
        for (const auto &entry : runtime.value()) {
            if (!entry.is_object()) {
                continue;
            }
            std::string udid = string_field(entry, "udid");
            std::string name = string_field(entry, "name");
            std::string device_type = string_field(entry, "deviceTypeIdentifier");
            std::string natural_key = udid.empty() ? name + "-ios" : udid;

            std::optional<std::string> native_identifier;
            if (!udid.empty()) {
                native_identifier = udid;
            }

            Device device = devices::make_device(devices::DevicePlatform::Simulator, natural_key,
                                                 name, native_identifier,
                                                 map_state(string_field(entry, "state")));
            device.is_available = bool_field(entry, "isAvailable", true);
            device.os_version = extract_os_version(runtime_key);
            if (!device_type.empty()) {
                device.model = extract_device_model(device_type);
            }
            device.attributes["runtimeIdentifier"] = runtime_key;
            device.attributes["deviceTypeIdentifier"] = device_type;
            parsed.push_back(device);
        }
    }

    out_devices = parsed;
    return true;
}

bool parse_device_types(const std::string &json_text, std::vector<SimulatorDeviceType> &out_types,
                        std::string &error_message) {
    json entries;
    if (!parse_document(json_text, "devicetypes", entries, error_message)) {
        return false;
    }
    if (!entries.is_array()) {
        error_message = "simctl 'devicetypes' member is not an array";
        return false;
    }

    out_types.clear();
    for (const auto &entry : entries) {
        if (!entry.is_object()) {
            continue;
        }
        SimulatorDeviceType type;
        type.identifier = string_field(entry, "identifier");
        type.name = string_field(entry, "name");
        if (type.identifier.empty()) {
            continue;
        }
        type.display_name = extract_device_model(type.identifier);
        out_types.push_back(type);
    }
    return true;
}

bool parse_runtimes(const std::string &json_text, std::vector<SimulatorRuntime> &out_runtimes,
                    std::string &error_message) {
    json entries;
    if (!parse_document(json_text, "runtimes", entries, error_message)) {
        return false;
    }
    if (!entries.is_array()) {
        error_message = "simctl 'runtimes' member is not an array";
        return false;
    }

    out_runtimes.clear();
    for (const auto &entry : entries) {
        if (!entry.is_object()) {
            continue;
        }
        SimulatorRuntime runtime;
        runtime.identifier = string_field(entry, "identifier");
        runtime.name = string_field(entry, "name");
        runtime.version = string_field(entry, "version");
        runtime.is_available = bool_field(entry, "isAvailable", false);
        if (!runtime.is_available || runtime.identifier.empty()) {
            continue;
        }
        runtime.display_version = extract_os_version(runtime.identifier);
        out_runtimes.push_back(runtime);
    }
    return true;
}

} // namespace simctl
