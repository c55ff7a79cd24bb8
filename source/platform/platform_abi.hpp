#ifndef SIMDECK_PLATFORM_ABI_HPP
#define SIMDECK_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a detached child process.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Result of running a child process to completion with captured output.
struct CaptureResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message; // set when started is false
};

// Spawn a child process in its own session with stdin/stdout/stderr on /dev/null.
// The process runs detached; its exit status is collected in the background.
SpawnResult spawn_detached(const std::string &executable_path,
                           const std::vector<std::string> &arguments);

// Run a child process, capturing stdout and stderr, and wait for it to exit.
// If it is still running after timeout_milliseconds it is killed (SIGKILL),
// reaped, and the result has timed_out set.
CaptureResult run_and_capture(const std::string &executable_path,
                              const std::vector<std::string> &arguments,
                              int timeout_milliseconds);

// True if path names a regular file the current user may execute.
bool is_executable_file(const std::string &path);

// Search PATH for an executable with the given bare name. Returns "" if not found.
std::string locate_executable(const std::string &name);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

} // namespace platform

#endif // SIMDECK_PLATFORM_ABI_HPP
