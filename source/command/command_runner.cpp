#include "command/command_runner.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_utils.hpp"

namespace command_runner {

std::string CommandResult::trimmed_output() const {
    return text_utils::trim(stdout_text);
}

CommandResult ProcessRunner::execute(const std::string &executable_path,
                                     const std::vector<std::string> &arguments,
                                     int timeout_milliseconds) {
    CommandResult result;

    if (!is_executable(executable_path)) {
        result.failure.kind = FailureKind::InvalidPath;
        result.failure.detail = executable_path;
        return result;
    }

    debug_log::log("exec: " + format_command_line(executable_path, arguments));
    platform::CaptureResult capture = platform::run_and_capture(executable_path, arguments,
                                                                timeout_milliseconds);

    if (!capture.started) {
        result.failure.kind = FailureKind::FailedToStart;
        result.failure.detail = capture.error_message;
        return result;
    }

    if (capture.timed_out) {
        debug_log::log("exec timed out after " + std::to_string(timeout_milliseconds) +
                       " ms: " + executable_path);
        result.failure.kind = FailureKind::TimedOut;
        result.failure.detail = executable_path;
        return result;
    }

    result.success = true;
    result.exit_code = capture.exit_code;
    result.stdout_text = std::move(capture.stdout_text);
    result.stderr_text = std::move(capture.stderr_text);
    text_utils::sanitize_utf8(result.stdout_text);
    text_utils::sanitize_utf8(result.stderr_text);
    return result;
}

SpawnOutcome ProcessRunner::spawn(const std::string &executable_path,
                                  const std::vector<std::string> &arguments) {
    SpawnOutcome outcome;

    if (!is_executable(executable_path)) {
        outcome.failure.kind = FailureKind::InvalidPath;
        outcome.failure.detail = executable_path;
        return outcome;
    }

    debug_log::log("spawn: " + format_command_line(executable_path, arguments));
    platform::SpawnResult spawn_result = platform::spawn_detached(executable_path, arguments);
    if (!spawn_result.success) {
        outcome.failure.kind = FailureKind::FailedToStart;
        outcome.failure.detail = spawn_result.error_message;
        return outcome;
    }

    outcome.success = true;
    outcome.process_id = spawn_result.process_id;
    return outcome;
}

bool ProcessRunner::is_executable(const std::string &executable_path) const {
    return platform::is_executable_file(executable_path);
}

CheckedResult run_checked(Runner &runner,
                          const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          int timeout_milliseconds) {
    CheckedResult checked;
    CommandResult result = runner.execute(executable_path, arguments, timeout_milliseconds);

    if (!result.success) {
        checked.failure = result.failure;
        return checked;
    }

    if (result.exit_code != 0) {
        checked.failure.kind = FailureKind::NonZeroExit;
        checked.failure.exit_code = result.exit_code;
        checked.failure.detail = text_utils::trim(result.stderr_text);
        if (checked.failure.detail.empty()) {
            // adb reports some failures (e.g. "Failure [INSTALL_FAILED_...]") on stdout.
            checked.failure.detail = result.trimmed_output();
        }
        return checked;
    }

    checked.success = true;
    checked.output = result.trimmed_output();
    return checked;
}

std::string describe_failure(const ExecutionFailure &failure) {
    switch (failure.kind) {
    case FailureKind::None:
        return "no failure";
    case FailureKind::InvalidPath:
        return "invalid executable path: " + failure.detail;
    case FailureKind::FailedToStart:
        return "failed to start command: " + failure.detail;
    case FailureKind::NonZeroExit:
        if (failure.detail.empty()) {
            return "exit code " + std::to_string(failure.exit_code);
        }
        return "exit code " + std::to_string(failure.exit_code) + ": " + failure.detail;
    case FailureKind::TimedOut:
        return "command timed out: " + failure.detail;
    }
    return "unknown failure";
}

std::string format_command_line(const std::string &executable_path,
                                const std::vector<std::string> &arguments) {
    std::string line = executable_path;
    for (const auto &argument : arguments) {
        line += " ";
        line += argument;
    }
    return line;
}

} // namespace command_runner
