#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

namespace {

// Build argv array: [executable, arg1, arg2, ..., nullptr].
// argv_strings must outlive the returned pointers.
std::vector<char *> build_argv(std::vector<std::string> &argv_strings) {
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);
    return argv_pointers;
}

void close_if_open(int &descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
        descriptor = -1;
    }
}

// Drain whatever is currently readable without blocking. Returns false on EOF.
bool drain_descriptor(int descriptor, std::string &output) {
    char buffer[4096];
    while (true) {
        ssize_t count = read(descriptor, buffer, sizeof(buffer));
        if (count > 0) {
            output.append(buffer, static_cast<size_t>(count));
            continue;
        }
        if (count == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more right now. Any other error is treated as EOF.
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

// Children start with an empty signal mask and default SIGPIPE/SIGINT/SIGTERM
// handling, whatever the server has blocked or ignored.
void init_child_attributes(posix_spawnattr_t &attributes, short extra_flags) {
    posix_spawnattr_init(&attributes);

    sigset_t empty_set;
    sigemptyset(&empty_set);
    posix_spawnattr_setsigmask(&attributes, &empty_set);

    sigset_t default_set;
    sigemptyset(&default_set);
    sigaddset(&default_set, SIGPIPE);
    sigaddset(&default_set, SIGINT);
    sigaddset(&default_set, SIGTERM);
    posix_spawnattr_setsigdefault(&attributes, &default_set);

    posix_spawnattr_setflags(&attributes, static_cast<short>(POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF | extra_flags));
}

int decode_exit_status(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

} // namespace

SpawnResult spawn_detached(const std::string &executable_path,
                           const std::vector<std::string> &arguments) {
    SpawnResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers = build_argv(argv_strings);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    posix_spawnattr_t attributes;
    init_child_attributes(attributes, POSIX_SPAWN_SETSID);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, &attributes,
                                   argv_pointers.data(), environ);

    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    // Reap in the background so the detached child never lingers as a zombie.
    std::thread([child_pid]() {
        int wait_status = 0;
        while (waitpid(child_pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
    }).detach();

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
}

CaptureResult run_and_capture(const std::string &executable_path,
                              const std::vector<std::string> &arguments,
                              int timeout_milliseconds) {
    CaptureResult result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_if_open(stdout_pipe[0]);
        close_if_open(stdout_pipe[1]);
        return result;
    }

    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers = build_argv(argv_strings);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);

    posix_spawnattr_t attributes;
    init_child_attributes(attributes, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, &attributes,
                                   argv_pointers.data(), environ);
    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&file_actions);

    close_if_open(stdout_pipe[1]);
    close_if_open(stderr_pipe[1]);

    if (spawn_status != 0) {
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        close_if_open(stdout_pipe[0]);
        close_if_open(stderr_pipe[0]);
        return result;
    }
    result.started = true;

    fcntl(stdout_pipe[0], F_SETFL, fcntl(stdout_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, fcntl(stderr_pipe[0], F_GETFL) | O_NONBLOCK);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    bool child_exited = false;
    int wait_status = 0;

    while (true) {
        pid_t waited = waitpid(child_pid, &wait_status, WNOHANG);
        if (waited == child_pid) {
            child_exited = true;
        }

        if (child_exited) {
            // Final drain; a grandchild may still hold the pipes open, so do not wait for EOF.
            if (stdout_pipe[0] >= 0) {
                drain_descriptor(stdout_pipe[0], result.stdout_text);
            }
            if (stderr_pipe[0] >= 0) {
                drain_descriptor(stderr_pipe[0], result.stderr_text);
            }
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill(child_pid, SIGKILL);
            while (waitpid(child_pid, &wait_status, 0) < 0 && errno == EINTR) {
            }
            result.timed_out = true;
            break;
        }

        long remaining_milliseconds = static_cast<long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
        int poll_timeout = static_cast<int>(remaining_milliseconds < 50 ? remaining_milliseconds : 50);

        struct pollfd descriptors[2];
        nfds_t descriptor_count = 0;
        if (stdout_pipe[0] >= 0) {
            descriptors[descriptor_count].fd = stdout_pipe[0];
            descriptors[descriptor_count].events = POLLIN;
            descriptors[descriptor_count].revents = 0;
            descriptor_count++;
        }
        if (stderr_pipe[0] >= 0) {
            descriptors[descriptor_count].fd = stderr_pipe[0];
            descriptors[descriptor_count].events = POLLIN;
            descriptors[descriptor_count].revents = 0;
            descriptor_count++;
        }

        if (descriptor_count == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(poll_timeout > 0 ? poll_timeout : 1));
            continue;
        }

        int ready = poll(descriptors, descriptor_count, poll_timeout);
        if (ready < 0) {
            // EINTR or a transient failure; waitpid and the deadline still decide the outcome.
            continue;
        }
        for (nfds_t index = 0; index < descriptor_count; index++) {
            if (descriptors[index].revents == 0) {
                continue;
            }
            if (descriptors[index].fd == stdout_pipe[0]) {
                if (!drain_descriptor(stdout_pipe[0], result.stdout_text)) {
                    close_if_open(stdout_pipe[0]);
                }
            } else if (descriptors[index].fd == stderr_pipe[0]) {
                if (!drain_descriptor(stderr_pipe[0], result.stderr_text)) {
                    close_if_open(stderr_pipe[0]);
                }
            }
        }
    }

    close_if_open(stdout_pipe[0]);
    close_if_open(stderr_pipe[0]);

    if (result.timed_out) {
        result.stdout_text.clear();
        result.stderr_text.clear();
        return result;
    }

    result.exit_code = decode_exit_status(wait_status);
    return result;
}

bool is_executable_file(const std::string &path) {
    if (path.empty()) {
        return false;
    }
    struct stat file_status;
    if (stat(path.c_str(), &file_status) != 0) {
        return false;
    }
    if (!S_ISREG(file_status.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::string locate_executable(const std::string &name) {
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? name : "";
    }
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + name;
        if (is_executable_file(full_path)) {
            return full_path;
        }
    }
    return "";
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

} // namespace platform
