#ifndef SIMDECK_CONFIG_HPP
#define SIMDECK_CONFIG_HPP

// Server configuration: toolchain paths, poll settings and cache validity.
//
// Sources, lowest to highest precedence: built-in defaults, detection of
// well-known toolchain locations, the JSON config file, environment variables.
// Detection only fills paths that are still empty after file and environment.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace config {

using json = nlohmann::json;

struct SimdeckConfig {
    std::string xcrun_path;
    std::string adb_path;
    std::string emulator_path;
    std::string android_sdk_path;
    std::string avd_home;

    // argv used to bring the simulator viewer to the foreground after boot.
    // Empty disables foregrounding.
    std::vector<std::string> simulator_viewer = {"/usr/bin/open", "-a", "Simulator"};

    int command_timeout_ms = 30000;
    int cache_validity_ms = 5000;
    int poll_interval_ms = 1000;
    int restart_delay_ms = 2000;
    std::string emulator_skin = "1080x1920";
};

struct LoadResult {
    bool success = false;
    SimdeckConfig config;
    std::string source_path; // file that was read, "" when defaults only
    std::string error_message;
};

// Config file location: $SIMDECK_CONFIG, else $XDG_CONFIG_HOME/simdeck/config.json,
// else $HOME/.config/simdeck/config.json. Returns "" when none can be formed.
std::string resolve_config_path();

// Full load: file (if present) + environment + detection.
LoadResult load_config();

// Reads one JSON file on top of the defaults. A missing file is not an error.
LoadResult load_config_file(const std::string &file_path);

// Applies the keys present in object onto config. Unknown keys are ignored;
// a known key with the wrong type fails with a message naming the key.
bool apply_json(const json &object, SimdeckConfig &config, std::string &error_message);

// SIMDECK_XCRUN, SIMDECK_ADB, SIMDECK_EMULATOR, ANDROID_SDK_ROOT / ANDROID_HOME,
// ANDROID_AVD_HOME.
void apply_environment(SimdeckConfig &config);

// Fills empty toolchain paths from well-known locations and PATH.
void detect_toolchain(SimdeckConfig &config);

json config_to_json(const SimdeckConfig &config);

} // namespace config

#endif // SIMDECK_CONFIG_HPP
