#ifndef MCPLINK_MCP_STDIO_HPP
#define MCPLINK_MCP_STDIO_HPP

// MCP stdio transport framing.
// Uses brace-counting with string/escape awareness for framing,
// so it works both with newline-delimited and streamed JSON.

#include <deque>
#include <iosfwd>
#include <string>

namespace mcp_stdio {

// Incremental JSON object framer. Bytes are pushed in as they arrive (from stdin
// or from a pipe); complete top-level objects are queued in arrival order.
class MessageFramer {
public:
    // Feed one character. Returns true when it completed a message.
    bool push(char character);

    // Feed a block of bytes. Returns the number of messages completed by it.
    int push(const char *data, size_t length);

    bool has_message() const { return !completed_messages.empty(); }

    // Pop the oldest complete message. Returns empty string when none is queued.
    std::string take_message();

    // Drop any partial message and all queued ones.
    void reset();

private:
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;
    std::deque<std::string> completed_messages;
};

// Read a single complete JSON object from the given stream.
// Returns the raw JSON string, or empty string on EOF / error.
std::string read_message(std::istream &input);

// Read a single complete JSON object from stdin.
std::string read_message();

// Write a JSON message to stdout, followed by a newline (for compatibility).
void write_message(const std::string &json_string);

// Write a log message to stderr, the only channel MCP stdio servers may log on.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // MCPLINK_MCP_STDIO_HPP
