// Tests for the process-backed command executor. Uses /bin/sh as the child.

#include <chrono>
#include <string>

#include "command/command_runner.hpp"
#include "test_support.hpp"

using test_support::expect;
using command_runner::FailureKind;

namespace test_command_runner {

static const char SHELL[] = "/bin/sh";

static bool test_captures_stdout() {
    command_runner::ProcessRunner runner;
    command_runner::CommandResult result = runner.execute(SHELL, {"-c", "echo hello; echo world"}, 5000);
    return expect(result.success && result.exit_code == 0 &&
                      result.stdout_text == "hello\nworld\n" &&
                      result.trimmed_output() == "hello\nworld",
                  "execute() captures stdout of a successful command");
}

static bool test_non_zero_exit_is_not_a_failure() {
    command_runner::ProcessRunner runner;
    command_runner::CommandResult result = runner.execute(SHELL, {"-c", "echo oops >&2; exit 3"}, 5000);
    return expect(result.success && result.exit_code == 3 && result.stderr_text == "oops\n",
                  "execute() reports non-zero exits as completed runs with stderr");
}

static bool test_run_checked_non_zero() {
    command_runner::ProcessRunner runner;
    command_runner::CheckedResult stderr_result =
        command_runner::run_checked(runner, SHELL, {"-c", "echo '  bad thing  ' >&2; exit 2"}, 5000);
    command_runner::CheckedResult stdout_result =
        command_runner::run_checked(runner, SHELL, {"-c", "echo 'Failure [INSTALL_FAILED]'; exit 1"}, 5000);
    bool success = !stderr_result.success &&
                   stderr_result.failure.kind == FailureKind::NonZeroExit &&
                   stderr_result.failure.exit_code == 2 &&
                   stderr_result.failure.detail == "bad thing" &&
                   stdout_result.failure.detail == "Failure [INSTALL_FAILED]";
    return expect(success, "run_checked() fails with exit code and trimmed stderr, else stdout");
}

static bool test_run_checked_success_trims() {
    command_runner::ProcessRunner runner;
    command_runner::CheckedResult result =
        command_runner::run_checked(runner, SHELL, {"-c", "printf '\\n  1  \\n'"}, 5000);
    return expect(result.success && result.output == "1", "run_checked() returns trimmed stdout");
}

static bool test_timeout_kills_child() {
    command_runner::ProcessRunner runner;
    auto started = std::chrono::steady_clock::now();
    command_runner::CommandResult result = runner.execute(SHELL, {"-c", "echo partial; sleep 10"}, 300);
    auto elapsed = std::chrono::steady_clock::now() - started;
    bool success = !result.success && result.failure.kind == FailureKind::TimedOut &&
                   result.stdout_text.empty() && elapsed < std::chrono::seconds(5);
    return expect(success, "A command past its timeout is killed and returns no partial output");
}

static bool test_invalid_path() {
    command_runner::ProcessRunner runner;
    command_runner::CommandResult missing = runner.execute("/nonexistent/simdeck-tool", {}, 1000);
    command_runner::CommandResult directory = runner.execute("/tmp", {}, 1000);
    command_runner::SpawnOutcome spawned = runner.spawn("/nonexistent/simdeck-tool", {});
    bool success = missing.failure.kind == FailureKind::InvalidPath &&
                   missing.failure.detail == "/nonexistent/simdeck-tool" &&
                   directory.failure.kind == FailureKind::InvalidPath &&
                   !spawned.success && spawned.failure.kind == FailureKind::InvalidPath;
    return expect(success, "Missing or non-executable paths fail before spawning");
}

static bool test_spawn_detached() {
    command_runner::ProcessRunner runner;
    command_runner::SpawnOutcome outcome = runner.spawn(SHELL, {"-c", "exit 0"});
    return expect(outcome.success && outcome.process_id > 0, "spawn() starts a detached process");
}

static bool test_invalid_utf8_is_sanitized() {
    command_runner::ProcessRunner runner;
    command_runner::CommandResult result = runner.execute(SHELL, {"-c", "printf 'a\\377b'"}, 5000);
    bool success = result.success && result.stdout_text == "a\xEF\xBF\xBD" "b";
    return expect(success, "Invalid UTF-8 in tool output is replaced");
}

static bool test_describe_failure() {
    command_runner::ExecutionFailure failure;
    failure.kind = FailureKind::NonZeroExit;
    failure.exit_code = 1;
    failure.detail = "Invalid device: ABC";
    return expect(command_runner::describe_failure(failure) == "exit code 1: Invalid device: ABC" &&
                      command_runner::format_command_line("/usr/bin/xcrun", {"simctl", "boot", "ABC"}) ==
                          "/usr/bin/xcrun simctl boot ABC",
                  "Failures and command lines format for logs");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_captures_stdout();
    all_passed &= test_non_zero_exit_is_not_a_failure();
    all_passed &= test_run_checked_non_zero();
    all_passed &= test_run_checked_success_trims();
    all_passed &= test_timeout_kills_child();
    all_passed &= test_invalid_path();
    all_passed &= test_spawn_detached();
    all_passed &= test_invalid_utf8_is_sanitized();
    all_passed &= test_describe_failure();
    return all_passed;
}

} // namespace test_command_runner
