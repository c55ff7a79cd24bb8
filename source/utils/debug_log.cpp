#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <mutex>
#include <string>

namespace debug_log {

// Adapter threads log concurrently during an aggregated listing.
static std::mutex output_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool is_debug_enabled() {
    const char *value = std::getenv("SIMDECK_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[simdeck] " << message << std::endl;
}

void warn(const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[simdeck] warning: " << message << std::endl;
}

} // namespace debug_log
