#ifndef SIMDECK_DEVICE_ERROR_HPP
#define SIMDECK_DEVICE_ERROR_HPP

// Shared error taxonomy for device operations. Adapters map low-level
// execution failures into these kinds; the aggregator and repository pass
// them through unchanged.

#include <string>

namespace devices {

enum class ErrorKind {
    None,
    ConfigurationError, // required tool missing or misconfigured
    DeviceNotFound,
    DeviceUnavailable,  // wrong state for the requested operation
    CommandFailed,      // operation + underlying tool output
    TimedOut,
    UnsupportedFeature,
    InvalidInput,
    FileNotFound,
    Cancelled,          // a poll wait was aborted through its CancellationToken
    Unknown
};

struct DeviceError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string operation;  // e.g. "boot", "simctl list devices"
    std::string underlying; // raw tool output (stderr) when available
};

DeviceError make_error(ErrorKind kind,
                       const std::string &message,
                       const std::string &operation = "",
                       const std::string &underlying = "");

// Stable identifier, e.g. "device_not_found".
std::string kind_name(ErrorKind kind);

// Human-readable description including operation context and tool output.
std::string describe(const DeviceError &error);

// Suggested remedy for the user, e.g. "Check the device connection".
std::string recovery_suggestion(ErrorKind kind);

} // namespace devices

#endif // SIMDECK_DEVICE_ERROR_HPP
