#include "devices/device_error.hpp"

namespace devices {

DeviceError make_error(ErrorKind kind,
                       const std::string &message,
                       const std::string &operation,
                       const std::string &underlying) {
    DeviceError error;
    error.kind = kind;
    error.message = message;
    error.operation = operation;
    error.underlying = underlying;
    return error;
}

std::string kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::ConfigurationError:
        return "configuration_error";
    case ErrorKind::DeviceNotFound:
        return "device_not_found";
    case ErrorKind::DeviceUnavailable:
        return "device_unavailable";
    case ErrorKind::CommandFailed:
        return "command_failed";
    case ErrorKind::TimedOut:
        return "timed_out";
    case ErrorKind::UnsupportedFeature:
        return "unsupported_feature";
    case ErrorKind::InvalidInput:
        return "invalid_input";
    case ErrorKind::FileNotFound:
        return "file_not_found";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

std::string describe(const DeviceError &error) {
    std::string description;
    switch (error.kind) {
    case ErrorKind::None:
        return "No error.";
    case ErrorKind::ConfigurationError:
        description = "Toolchain configuration error: " + error.message;
        break;
    case ErrorKind::DeviceNotFound:
        description = "Device not found: " + error.message;
        break;
    case ErrorKind::DeviceUnavailable:
        description = "Device unavailable: " + error.message;
        break;
    case ErrorKind::CommandFailed:
        description = "Command '" + error.operation + "' failed";
        if (!error.message.empty()) {
            description += ": " + error.message;
        }
        break;
    case ErrorKind::TimedOut:
        description = "Timed out: " + error.message;
        break;
    case ErrorKind::UnsupportedFeature:
        description = "Unsupported feature: " + error.message;
        break;
    case ErrorKind::InvalidInput:
        description = "Invalid input: " + error.message;
        break;
    case ErrorKind::FileNotFound:
        description = "File not found: " + error.message;
        break;
    case ErrorKind::Cancelled:
        description = "Cancelled: " + error.message;
        break;
    case ErrorKind::Unknown:
        description = "Unexpected error: " + error.message;
        break;
    }
    if (!error.underlying.empty() && error.underlying != error.message) {
        description += " (" + error.underlying + ")";
    }
    return description;
}

std::string recovery_suggestion(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConfigurationError:
        return "Check the toolchain paths in the simdeck configuration file or environment.";
    case ErrorKind::DeviceNotFound:
        return "Check that the device still exists and refresh the device list.";
    case ErrorKind::DeviceUnavailable:
        return "Boot the device first, or wait until it finishes its current transition.";
    case ErrorKind::TimedOut:
        return "The device may still be starting. Check its status and try again.";
    case ErrorKind::FileNotFound:
        return "Check the artifact path and permissions.";
    case ErrorKind::UnsupportedFeature:
        return "This operation is not available on this platform.";
    case ErrorKind::InvalidInput:
        return "Check the request arguments.";
    case ErrorKind::None:
    case ErrorKind::CommandFailed:
    case ErrorKind::Cancelled:
    case ErrorKind::Unknown:
        break;
    }
    return "Try the operation again.";
}

} // namespace devices
