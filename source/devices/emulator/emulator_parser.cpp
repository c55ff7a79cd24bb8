#include "devices/emulator/emulator_parser.hpp"
#include "utils/text_utils.hpp"

#include <cctype>
#include <map>
#include <regex>
#include <set>
#include <sstream>

namespace emulator {

using devices::Device;
using devices::DevicePlatform;
using devices::DeviceState;

static const std::map<int, std::string> ANDROID_VERSIONS = {
    {24, "7.0"},  {25, "7.1"},  {26, "8.0"},  {27, "8.1"},  {28, "9.0"},  {29, "10.0"},
    {30, "11.0"}, {31, "12.0"}, {32, "12.1"}, {33, "13.0"}, {34, "14.0"}, {35, "15.0"},
};

namespace {

std::string digits_of(const std::string &text) {
    std::string digits;
    for (char character : text) {
        if (std::isdigit(static_cast<unsigned char>(character))) {
            digits += character;
        }
    }
    return digits;
}

} // namespace

std::vector<RunningInstance> parse_running_instances(const std::string &adb_devices_output) {
    std::vector<RunningInstance> instances;
    for (const auto &line : text_utils::split_lines(adb_devices_output)) {
        std::vector<std::string> parts = text_utils::split_whitespace(line);
        if (parts.size() < 2) {
            continue;
        }
        if (!text_utils::starts_with(parts[0], "emulator-") || parts[1] != "device") {
            continue;
        }

        RunningInstance instance;
        instance.serial = parts[0];
        instance.port = parts[0].substr(std::string("emulator-").size());
        for (size_t index = 2; index < parts.size(); ++index) {
            if (text_utils::starts_with(parts[index], "device:")) {
                instance.device_field = parts[index].substr(7);
                break;
            }
        }
        instances.push_back(instance);
    }
    return instances;
}

std::vector<std::string> parse_template_names(const std::string &list_avds_output) {
    std::vector<std::string> names;
    for (const auto &line : text_utils::split_lines(list_avds_output)) {
        // AVD names never contain spaces; "INFO    | ..." diagnostics sometimes land on stdout.
        if (line.find(' ') != std::string::npos || line.find('\t') != std::string::npos) {
            continue;
        }
        names.push_back(line);
    }
    return names;
}

std::string parse_console_avd_name(const std::string &console_output) {
    for (const auto &line : text_utils::split_lines(console_output)) {
        if (line == "OK") {
            continue;
        }
        if (text_utils::starts_with(line, "KO")) {
            return "";
        }
        return line;
    }
    return "";
}

std::string fallback_instance_name(const RunningInstance &instance) {
    if (!instance.device_field.empty()) {
        return instance.device_field;
    }
    return "Emulator " + instance.port;
}

std::string api_level_from_name(const std::string &avd_name) {
    static const std::regex patterns[] = {
        std::regex("API_\\d+"),
        std::regex("api\\d+"),
        std::regex("Android\\d+"),
        std::regex("\\d+"),
    };
    for (const auto &pattern : patterns) {
        std::smatch match;
        if (std::regex_search(avd_name, match, pattern)) {
            std::string digits = digits_of(match.str());
            if (!digits.empty()) {
                return digits;
            }
        }
    }
    return "";
}

TemplateMetadata parse_avd_config(const std::string &config_contents, const std::string &avd_name) {
    static const std::regex sysdir_api("android-(\\d+)");

    TemplateMetadata metadata;
    metadata.device_name = avd_name;
    std::string target_api;

    for (const auto &line : text_utils::split_lines(config_contents)) {
        if (text_utils::starts_with(line, "image.sysdir.1=")) {
            std::smatch match;
            if (std::regex_search(line, match, sysdir_api)) {
                target_api = match.str(1);
            }
        } else if (text_utils::starts_with(line, "target=")) {
            std::string value = line.substr(7);
            if (text_utils::starts_with(value, "android-")) {
                target_api = value.substr(8);
            }
        } else if (text_utils::starts_with(line, "hw.device.name=")) {
            metadata.device_name = text_utils::replace_all(line.substr(15), "_", " ");
        }
    }

    metadata.api_level = target_api.empty() ? api_level_from_name(avd_name) : target_api;
    return metadata;
}

std::string android_version_for_api(const std::string &api_level) {
    if (api_level.empty() || digits_of(api_level) != api_level || api_level.size() > 4) {
        return "";
    }
    int api = std::stoi(api_level);
    auto known = ANDROID_VERSIONS.find(api);
    if (known != ANDROID_VERSIONS.end()) {
        return known->second;
    }

    std::ostringstream estimate;
    estimate << static_cast<double>(api - 19) + 4.4;
    return estimate.str();
}

std::string strip_template_prefix(const std::string &identifier) {
    if (text_utils::starts_with(identifier, kTemplatePrefix)) {
        return identifier.substr(std::string(kTemplatePrefix).size());
    }
    return identifier;
}

std::string natural_key_for(const std::string &avd_name) {
    return avd_name + "-android";
}

Device make_template_device(const std::string &avd_name, const TemplateMetadata &metadata) {
    Device device = devices::make_device(DevicePlatform::Emulator, natural_key_for(avd_name),
                                         avd_name, std::nullopt, DeviceState::Shutdown);
    std::string version = android_version_for_api(metadata.api_level);
    if (!version.empty()) {
        device.os_version = "Android " + version;
    }
    if (!metadata.device_name.empty()) {
        device.model = metadata.device_name;
    }
    device.attributes["apiLevel"] = metadata.api_level;
    device.attributes["deviceName"] = metadata.device_name;
    device.attributes["source"] = "template";
    return device;
}

Device make_running_device(const std::string &avd_name, const std::string &serial) {
    Device device = devices::make_device(DevicePlatform::Emulator, natural_key_for(avd_name),
                                         avd_name, serial, DeviceState::Booted);
    device.attributes["serial"] = serial;
    device.attributes["source"] = "running";
    return device;
}

std::vector<Device> merge_devices(const std::vector<Device> &running,
                                  const std::vector<Device> &templates) {
    std::map<std::string, const Device *> templates_by_name;
    for (const auto &template_device : templates) {
        templates_by_name.emplace(template_device.name, &template_device);
    }

    std::vector<Device> merged;
    std::set<std::string> running_names;
    for (const auto &instance : running) {
        Device device = instance;
        auto match = templates_by_name.find(device.name);
        if (match != templates_by_name.end()) {
            const Device &template_device = *match->second;
            if (!device.os_version) {
                device.os_version = template_device.os_version;
            }
            if (!device.model) {
                device.model = template_device.model;
            }
            for (const auto &attribute : template_device.attributes) {
                device.attributes.emplace(attribute.first, attribute.second);
            }
            device.attributes["source"] = "running";
        }
        if (running_names.insert(device.name).second) {
            merged.push_back(device);
        }
    }

    for (const auto &template_device : templates) {
        if (running_names.count(template_device.name) == 0) {
            merged.push_back(template_device);
        }
    }
    return merged;
}

} // namespace emulator
