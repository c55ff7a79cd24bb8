#include "devices/error_mapper.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

namespace devices {

namespace error_mapper {

using command_runner::ExecutionFailure;
using command_runner::FailureKind;

namespace {

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

DeviceError map_common(const ExecutionFailure &failure, const std::string &operation,
                       const std::string &tool_label) {
    switch (failure.kind) {
    case FailureKind::InvalidPath:
        return make_error(ErrorKind::ConfigurationError,
                          tool_label + " is not executable at '" + failure.detail + "'",
                          operation);
    case FailureKind::FailedToStart:
        return make_error(ErrorKind::CommandFailed, "could not start " + tool_label,
                          operation, failure.detail);
    case FailureKind::TimedOut:
        return make_error(ErrorKind::TimedOut,
                          tool_label + " did not finish in time", operation);
    case FailureKind::NonZeroExit:
        return make_error(ErrorKind::CommandFailed,
                          tool_label + " exited with code " + std::to_string(failure.exit_code),
                          operation, failure.detail);
    case FailureKind::None:
        break;
    }
    return make_error(ErrorKind::Unknown, "unexpected " + tool_label + " failure", operation);
}

} // namespace

DeviceError map_simulator_failure(const ExecutionFailure &failure, const std::string &operation) {
    DeviceError error = map_common(failure, operation, "xcrun simctl");
    if (failure.kind != FailureKind::NonZeroExit) {
        return error;
    }

    std::string lowered = text_utils::to_lower(failure.detail);
    if (contains(lowered, "invalid device") || contains(lowered, "no devices are booted") ||
        contains(lowered, "device not found")) {
        error.kind = ErrorKind::DeviceNotFound;
        error.message = "simulator is not known to simctl";
    } else if (contains(lowered, "current state")) {
        error.kind = ErrorKind::DeviceUnavailable;
        error.message = "simulator is not in a state that allows '" + operation + "'";
    } else if (contains(lowered, "no such file") || contains(lowered, "does not exist")) {
        error.kind = ErrorKind::FileNotFound;
        error.message = "simctl could not read the artifact";
    }
    debug_log::log("simctl failure mapped to " + kind_name(error.kind) + ": " + failure.detail);
    return error;
}

DeviceError map_emulator_failure(const ExecutionFailure &failure, const std::string &operation) {
    DeviceError error = map_common(failure, operation, "adb/emulator");
    if (failure.kind != FailureKind::NonZeroExit) {
        return error;
    }

    std::string lowered = text_utils::to_lower(failure.detail);
    if ((contains(lowered, "device '") && contains(lowered, "not found")) ||
        contains(lowered, "no devices/emulators found")) {
        error.kind = ErrorKind::DeviceNotFound;
        error.message = "emulator instance is not connected to adb";
    } else if (contains(lowered, "device offline") || contains(lowered, "device still authorizing")) {
        error.kind = ErrorKind::DeviceUnavailable;
        error.message = "emulator instance is not ready";
    } else if (contains(lowered, "install_failed")) {
        error.message = "package manager rejected the install";
    }
    debug_log::log("adb failure mapped to " + kind_name(error.kind) + ": " + failure.detail);
    return error;
}

DeviceError map_failure(DevicePlatform platform, const ExecutionFailure &failure,
                        const std::string &operation) {
    switch (platform) {
    case DevicePlatform::Simulator:
        return map_simulator_failure(failure, operation);
    case DevicePlatform::Emulator:
        return map_emulator_failure(failure, operation);
    }
    return map_common(failure, operation, "tool");
}

} // namespace error_mapper

} // namespace devices
