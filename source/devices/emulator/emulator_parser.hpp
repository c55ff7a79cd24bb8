#ifndef SIMDECK_EMULATOR_PARSER_HPP
#define SIMDECK_EMULATOR_PARSER_HPP

// Parsing of adb / emulator output and AVD config files, and the
// template/running-instance merge. Pure functions, no process access.

#include <string>
#include <vector>

#include "devices/device_model.hpp"

namespace emulator {

// Prefix some callers put in front of a template name to address the template
// rather than a running instance.
constexpr const char *kTemplatePrefix = "avd:";

// One line of `adb devices -l` that describes a ready emulator instance.
struct RunningInstance {
    std::string serial;       // emulator-5554
    std::string port;         // 5554
    std::string device_field; // value of "device:" if present
};

struct TemplateMetadata {
    std::string api_level;   // "33", "" when unknown
    std::string device_name; // hw.device.name with '_' -> ' ', else the AVD name
};

// Keeps lines whose first field starts with "emulator-" and whose status is "device".
std::vector<RunningInstance> parse_running_instances(const std::string &adb_devices_output);

// `emulator -list-avds`: one template name per non-empty line.
std::vector<std::string> parse_template_names(const std::string &list_avds_output);

// `adb -s <serial> emu avd name`: first line that is not "OK". "" when absent.
std::string parse_console_avd_name(const std::string &console_output);

// "device:" value, else "Emulator <port>".
std::string fallback_instance_name(const RunningInstance &instance);

// Reads image.sysdir.1 (android-NN), target=android-NN and hw.device.name.
// Falls back to api_level_from_name() when no API level is present.
TemplateMetadata parse_avd_config(const std::string &config_contents, const std::string &avd_name);

// Tries API_33, api33, Android33, then any digit run. "" when nothing matches.
std::string api_level_from_name(const std::string &avd_name);

// 24 -> "7.0" ... 35 -> "15.0"; other levels are estimated. "" if not numeric.
std::string android_version_for_api(const std::string &api_level);

std::string strip_template_prefix(const std::string &identifier);

// Identity for both templates and running instances: <name>-android.
std::string natural_key_for(const std::string &avd_name);

devices::Device make_template_device(const std::string &avd_name, const TemplateMetadata &metadata);

devices::Device make_running_device(const std::string &avd_name, const std::string &serial);

// Running instances first, then templates whose name is not running. Running
// instances pick up OS version, model and attributes from their template.
std::vector<devices::Device> merge_devices(const std::vector<devices::Device> &running,
                                           const std::vector<devices::Device> &templates);

} // namespace emulator

#endif // SIMDECK_EMULATOR_PARSER_HPP
