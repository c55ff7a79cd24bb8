#ifndef SIMDECK_COMMAND_RUNNER_HPP
#define SIMDECK_COMMAND_RUNNER_HPP

// Command executor: runs external toolchain programs (xcrun, adb, emulator)
// with captured output and a timeout, or launches them detached.
//
// The Runner interface is the seam between the platform adapters and the OS.
// ProcessRunner is the real implementation; tests substitute a scripted fake.

#include <string>
#include <vector>

namespace command_runner {

// Default timeout for a single toolchain invocation.
constexpr int kDefaultTimeoutMilliseconds = 30000;

// Low-level execution failures. Nothing above the adapters sees these directly.
enum class FailureKind {
    None,
    InvalidPath,   // executable missing or not executable (checked before spawning)
    FailedToStart, // the OS refused to spawn the process
    NonZeroExit,   // only reported by run_checked
    TimedOut       // child killed after the timeout; no partial output
};

struct ExecutionFailure {
    FailureKind kind = FailureKind::None;
    int exit_code = 0;
    std::string detail; // stderr for NonZeroExit, path or OS message otherwise
};

// Result of execute(): the process ran to completion (any exit code) when success is true.
struct CommandResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    ExecutionFailure failure;

    // stdout with surrounding whitespace removed.
    std::string trimmed_output() const;
};

// Result of run_checked(): trimmed stdout on exit code 0.
struct CheckedResult {
    bool success = false;
    std::string output;
    ExecutionFailure failure;
};

// Result of spawn(): the process was started; nothing is known about its exit.
struct SpawnOutcome {
    bool success = false;
    int process_id = -1;
    ExecutionFailure failure;
};

class Runner {
public:
    virtual ~Runner() = default;

    virtual CommandResult execute(const std::string &executable_path,
                                  const std::vector<std::string> &arguments,
                                  int timeout_milliseconds) = 0;

    // Fire-and-forget launch of a long-running process; stdio is discarded.
    virtual SpawnOutcome spawn(const std::string &executable_path,
                               const std::vector<std::string> &arguments) = 0;

    virtual bool is_executable(const std::string &executable_path) const = 0;
};

// Runs real child processes through the platform layer.
class ProcessRunner : public Runner {
public:
    CommandResult execute(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          int timeout_milliseconds) override;

    SpawnOutcome spawn(const std::string &executable_path,
                       const std::vector<std::string> &arguments) override;

    bool is_executable(const std::string &executable_path) const override;
};

// The call adapters use for toolchain queries: returns trimmed stdout, or
// fails with NonZeroExit(code, stderr) when the exit code is not 0. An empty
// stderr is replaced by stdout.
CheckedResult run_checked(Runner &runner,
                          const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          int timeout_milliseconds = kDefaultTimeoutMilliseconds);

// Human-readable one-liner, e.g. "exit code 1: Invalid device: ABC".
std::string describe_failure(const ExecutionFailure &failure);

// Joins path and arguments for log lines.
std::string format_command_line(const std::string &executable_path,
                                const std::vector<std::string> &arguments);

} // namespace command_runner

#endif // SIMDECK_COMMAND_RUNNER_HPP
