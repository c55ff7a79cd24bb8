#ifndef SIMDECK_SIMCTL_PARSER_HPP
#define SIMDECK_SIMCTL_PARSER_HPP

// Decoding of `xcrun simctl list ... -j` output.
// All functions are pure; JSON errors are caught here and reported through
// error_message, never thrown.

#include <string>
#include <vector>

#include "devices/device_model.hpp"

namespace simctl {

struct SimulatorDeviceType {
    std::string identifier;   // com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro
    std::string name;         // iPhone 15 Pro
    std::string display_name; // derived from identifier
};

struct SimulatorRuntime {
    std::string identifier; // com.apple.CoreSimulator.SimRuntime.iOS-17-0
    std::string name;
    std::string version;
    bool is_available = false;
    std::string display_version; // iOS 17.0
};

// {"devices": {"<runtime key>": [{udid, name, state, isAvailable, deviceTypeIdentifier}]}}
bool parse_device_list(const std::string &json_text,
                       std::vector<devices::Device> &out_devices,
                       std::string &error_message);

// {"devicetypes": [{identifier, name}]}
bool parse_device_types(const std::string &json_text,
                        std::vector<SimulatorDeviceType> &out_types,
                        std::string &error_message);

// {"runtimes": [{identifier, name, version, isAvailable}]}. Unavailable runtimes are dropped.
bool parse_runtimes(const std::string &json_text,
                    std::vector<SimulatorRuntime> &out_runtimes,
                    std::string &error_message);

// "com.apple.CoreSimulator.SimRuntime.iOS-17-0" -> "iOS 17.0" (also watchOS, tvOS).
std::string extract_os_version(const std::string &runtime_identifier);

// "com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro" -> "iPhone 15 Pro".
std::string extract_device_model(const std::string &device_type_identifier);

// "Booted", "Shutdown", "Booting", "Shutting Down" (any case); anything else is Unknown.
devices::DeviceState map_state(const std::string &state_text);

} // namespace simctl

#endif // SIMDECK_SIMCTL_PARSER_HPP
