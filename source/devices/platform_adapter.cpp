#include "devices/platform_adapter.hpp"
#include "utils/debug_log.hpp"

namespace devices {

namespace adapter_support {

DeviceError unsupported_error(const std::string &feature, DevicePlatform platform) {
    return make_error(ErrorKind::UnsupportedFeature,
                      feature + " is not supported on platform '" + platform_name(platform) + "'.",
                      feature);
}

OperationResult unsupported(const std::string &feature, DevicePlatform platform) {
    return operation_failed(unsupported_error(feature, platform));
}

OperationResult restart_by_cycle(PlatformAdapter &adapter, const Device &device,
                                 int delay_milliseconds, CancellationToken &token) {
    debug_log::log("restart: shutting down '" + device.name + "'");
    OperationResult shutdown_result = adapter.shutdown(device, token);
    if (!shutdown_result.success) {
        return shutdown_result;
    }

    if (!token.sleep_for(std::chrono::milliseconds(delay_milliseconds))) {
        return operation_failed(make_error(ErrorKind::Cancelled,
                                           "restart of '" + device.name + "' was cancelled",
                                           "restart"));
    }

    debug_log::log("restart: booting '" + device.name + "'");
    return adapter.boot(device, token);
}

DeviceError poll_failure(const PollResult &poll_result, const std::string &operation,
                         const std::string &what) {
    switch (poll_result.outcome) {
    case PollOutcome::Failed:
        return poll_result.error;
    case PollOutcome::Cancelled:
        return make_error(ErrorKind::Cancelled, "wait for " + what + " was cancelled", operation);
    case PollOutcome::Exhausted:
    case PollOutcome::Satisfied:
        break;
    }
    return make_error(ErrorKind::TimedOut,
                      what + " did not happen after " + std::to_string(poll_result.attempts) +
                          " attempts",
                      operation);
}

} // namespace adapter_support

} // namespace devices
