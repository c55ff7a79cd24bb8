#include "config/config.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <filesystem>

namespace config {

namespace {

std::string environment_value(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return value;
}

std::string home_directory() {
    return environment_value("HOME");
}

bool read_string(const json &object, const char *key, std::string &target,
                 std::string &error_message) {
    if (!object.contains(key)) {
        return true;
    }
    const json &value = object.at(key);
    if (!value.is_string()) {
        error_message = std::string("'") + key + "' must be a string";
        return false;
    }
    target = value.get<std::string>();
    return true;
}

bool read_milliseconds(const json &object, const char *key, int &target,
                       std::string &error_message) {
    if (!object.contains(key)) {
        return true;
    }
    const json &value = object.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0 ||
        value.get<long long>() > 86400000LL) {
        error_message = std::string("'") + key + "' must be a non-negative integer (milliseconds)";
        return false;
    }
    target = value.get<int>();
    return true;
}

// First candidate that is an executable file, or "".
std::string first_executable(const std::vector<std::string> &candidates) {
    for (const auto &candidate : candidates) {
        if (platform::is_executable_file(candidate)) {
            return candidate;
        }
    }
    return "";
}

} // namespace

std::string resolve_config_path() {
    std::string explicit_path = environment_value("SIMDECK_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    std::string xdg_home = environment_value("XDG_CONFIG_HOME");
    if (!xdg_home.empty()) {
        return xdg_home + "/simdeck/config.json";
    }
    std::string home = home_directory();
    if (!home.empty()) {
        return home + "/.config/simdeck/config.json";
    }
    return "";
}

bool apply_json(const json &object, SimdeckConfig &config, std::string &error_message) {
    if (!object.is_object()) {
        error_message = "top-level value must be an object";
        return false;
    }

    if (!read_string(object, "xcrun_path", config.xcrun_path, error_message) ||
        !read_string(object, "adb_path", config.adb_path, error_message) ||
        !read_string(object, "emulator_path", config.emulator_path, error_message) ||
        !read_string(object, "android_sdk_path", config.android_sdk_path, error_message) ||
        !read_string(object, "avd_home", config.avd_home, error_message) ||
        !read_string(object, "emulator_skin", config.emulator_skin, error_message)) {
        return false;
    }

    if (!read_milliseconds(object, "command_timeout_ms", config.command_timeout_ms, error_message) ||
        !read_milliseconds(object, "cache_validity_ms", config.cache_validity_ms, error_message) ||
        !read_milliseconds(object, "poll_interval_ms", config.poll_interval_ms, error_message) ||
        !read_milliseconds(object, "restart_delay_ms", config.restart_delay_ms, error_message)) {
        return false;
    }

    if (object.contains("simulator_viewer")) {
        const json &viewer = object.at("simulator_viewer");
        if (!viewer.is_array()) {
            error_message = "'simulator_viewer' must be an array of strings";
            return false;
        }
        std::vector<std::string> argv;
        for (const auto &element : viewer) {
            if (!element.is_string()) {
                error_message = "'simulator_viewer' must be an array of strings";
                return false;
            }
            argv.push_back(element.get<std::string>());
        }
        config.simulator_viewer = argv;
    }

    if (config.command_timeout_ms == 0) {
        error_message = "'command_timeout_ms' must be greater than zero";
        return false;
    }
    return true;
}

void apply_environment(SimdeckConfig &config) {
    std::string value = environment_value("SIMDECK_XCRUN");
    if (!value.empty()) {
        config.xcrun_path = value;
    }
    value = environment_value("SIMDECK_ADB");
    if (!value.empty()) {
        config.adb_path = value;
    }
    value = environment_value("SIMDECK_EMULATOR");
    if (!value.empty()) {
        config.emulator_path = value;
    }
    value = environment_value("ANDROID_SDK_ROOT");
    if (value.empty()) {
        value = environment_value("ANDROID_HOME");
    }
    if (!value.empty()) {
        config.android_sdk_path = value;
    }
    value = environment_value("ANDROID_AVD_HOME");
    if (!value.empty()) {
        config.avd_home = value;
    }
}

void detect_toolchain(SimdeckConfig &config) {
    std::string home = home_directory();

    if (config.xcrun_path.empty()) {
        config.xcrun_path = "/usr/bin/xcrun";
    }

    if (config.android_sdk_path.empty()) {
        std::vector<std::string> sdk_candidates = {
            "/usr/local/share/android-sdk",
            "/opt/android-sdk",
        };
        if (!home.empty()) {
            sdk_candidates.insert(sdk_candidates.begin(),
                                  {home + "/Android/Sdk", home + "/Library/Android/sdk"});
        }
        for (const auto &candidate : sdk_candidates) {
            std::error_code error;
            if (std::filesystem::is_directory(candidate, error)) {
                config.android_sdk_path = candidate;
                break;
            }
        }
    }

    const std::string &sdk = config.android_sdk_path;
    if (config.adb_path.empty()) {
        if (!sdk.empty()) {
            config.adb_path = first_executable({sdk + "/platform-tools/adb"});
        }
        if (config.adb_path.empty()) {
            config.adb_path = platform::locate_executable("adb");
        }
    }
    if (config.emulator_path.empty()) {
        if (!sdk.empty()) {
            config.emulator_path = first_executable({sdk + "/emulator/emulator", sdk + "/tools/emulator"});
        }
        if (config.emulator_path.empty()) {
            config.emulator_path = platform::locate_executable("emulator");
        }
    }

    if (config.avd_home.empty() && !home.empty()) {
        config.avd_home = home + "/.android/avd";
    }

    debug_log::log("toolchain: xcrun='" + config.xcrun_path + "' adb='" + config.adb_path +
                   "' emulator='" + config.emulator_path + "' avd_home='" + config.avd_home + "'");
}

LoadResult load_config_file(const std::string &file_path) {
    LoadResult result;
    std::error_code error;
    if (file_path.empty() || !std::filesystem::exists(file_path, error)) {
        debug_log::log("No config file at '" + file_path + "', using defaults.");
        result.success = true;
        return result;
    }

    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        result.error_message = "cannot read config file " + file_path;
        return result;
    }

    json parsed;
    try {
        parsed = json::parse(contents);
    } catch (const json::parse_error &parse_error) {
        result.error_message = "invalid JSON in " + file_path + ": " + parse_error.what();
        return result;
    }

    std::string apply_error;
    if (!apply_json(parsed, result.config, apply_error)) {
        result.error_message = file_path + ": " + apply_error;
        return result;
    }

    result.success = true;
    result.source_path = file_path;
    return result;
}

LoadResult load_config() {
    LoadResult result = load_config_file(resolve_config_path());
    if (!result.success) {
        return result;
    }
    apply_environment(result.config);
    detect_toolchain(result.config);
    return result;
}

json config_to_json(const SimdeckConfig &config) {
    json object;
    object["xcrun_path"] = config.xcrun_path;
    object["adb_path"] = config.adb_path;
    object["emulator_path"] = config.emulator_path;
    object["android_sdk_path"] = config.android_sdk_path;
    object["avd_home"] = config.avd_home;
    object["simulator_viewer"] = config.simulator_viewer;
    object["command_timeout_ms"] = config.command_timeout_ms;
    object["cache_validity_ms"] = config.cache_validity_ms;
    object["poll_interval_ms"] = config.poll_interval_ms;
    object["restart_delay_ms"] = config.restart_delay_ms;
    object["emulator_skin"] = config.emulator_skin;
    return object;
}

} // namespace config
