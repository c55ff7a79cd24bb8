#include "mcp/mcp_stdio.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <iostream>

// MCP stdio transport.
// Uses brace-counting with string/escape awareness for framing,
// so it works both with newline-delimited and streamed JSON.

namespace mcp_stdio {

InterruptibleReader::InterruptibleReader(int descriptor) : descriptor_(descriptor) {
    if (pipe2(wake_pipe_, O_CLOEXEC) != 0) {
        wake_pipe_[0] = -1;
        wake_pipe_[1] = -1;
    }
    setg(buffer_, buffer_, buffer_);
}

InterruptibleReader::~InterruptibleReader() {
    for (int &descriptor : wake_pipe_) {
        if (descriptor >= 0) {
            close(descriptor);
            descriptor = -1;
        }
    }
}

bool InterruptibleReader::can_interrupt() const {
    return wake_pipe_[1] >= 0;
}

void InterruptibleReader::interrupt() {
    if (interrupted_.exchange(true) || wake_pipe_[1] < 0) {
        return;
    }
    const char wake = 1;
    while (write(wake_pipe_[1], &wake, 1) < 0 && errno == EINTR) {
    }
}

bool InterruptibleReader::interrupted() const {
    return interrupted_;
}

InterruptibleReader::int_type InterruptibleReader::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    while (!interrupted_) {
        struct pollfd descriptors[2];
        descriptors[0].fd = descriptor_;
        descriptors[0].events = POLLIN;
        descriptors[0].revents = 0;
        // A negative fd is ignored by poll().
        descriptors[1].fd = wake_pipe_[0];
        descriptors[1].events = POLLIN;
        descriptors[1].revents = 0;

        int ready = poll(descriptors, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return traits_type::eof();
        }
        if (descriptors[1].revents != 0) {
            return traits_type::eof();
        }
        if (descriptors[0].revents == 0) {
            continue;
        }

        ssize_t count = read(descriptor_, buffer_, sizeof(buffer_));
        if (count > 0) {
            setg(buffer_, buffer_, buffer_ + count);
            return traits_type::to_int_type(*gptr());
        }
        if (count < 0 && errno == EINTR) {
            continue;
        }
        // EOF, or a read error the caller treats as a disconnect.
        return traits_type::eof();
    }
    return traits_type::eof();
}

// Tracks { } depth, respecting strings and escapes.
std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        // Skip whitespace before the opening brace.
        if (!started) {
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
            }
            // Ignore anything before the first '{' (whitespace, newlines, etc.)
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                // Complete JSON object received.
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[simdeck] " << message << std::endl;
}

} // namespace mcp_stdio
