#ifndef SIMDECK_MCP_STDIO_HPP
#define SIMDECK_MCP_STDIO_HPP

// MCP stdio transport: reading JSON messages from an input stream and writing
// them to an output stream.

#include <atomic>
#include <iosfwd>
#include <streambuf>
#include <string>

namespace mcp_stdio {

// Input buffer over a file descriptor whose blocking read can be ended from
// another thread. Reads poll() the descriptor together with a wake pipe;
// after interrupt() the buffer reports EOF.
class InterruptibleReader : public std::streambuf {
public:
    explicit InterruptibleReader(int descriptor);
    ~InterruptibleReader() override;

    InterruptibleReader(const InterruptibleReader &) = delete;
    InterruptibleReader &operator=(const InterruptibleReader &) = delete;

    // False when the wake pipe could not be created; interrupt() is then a no-op.
    bool can_interrupt() const;

    // Safe to call from any thread, more than once.
    void interrupt();
    bool interrupted() const;

protected:
    int_type underflow() override;

private:
    int descriptor_;
    int wake_pipe_[2] = {-1, -1};
    std::atomic<bool> interrupted_{false};
    char buffer_[4096];
};

// Read a single complete JSON object. Returns "" on EOF / error.
std::string read_message(std::istream &input);

// Write a JSON message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);

// Write a log message to stderr (MCP spec allows this for logging).
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // SIMDECK_MCP_STDIO_HPP
