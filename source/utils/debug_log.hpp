#ifndef SIMDECK_DEBUG_LOG_HPP
#define SIMDECK_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if SIMDECK_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [simdeck] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes a warning to stderr regardless of SIMDECK_DEBUG.
void warn(const std::string &message);

} // namespace debug_log

#endif // SIMDECK_DEBUG_LOG_HPP
