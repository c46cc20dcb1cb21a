#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <string>

namespace mcp_stdio {

bool MessageFramer::push(char character) {
    // Skip anything before the opening brace (whitespace, newlines, stray bytes).
    if (!started) {
        if (character == '{') {
            started = true;
            brace_depth = 1;
            buffer += character;
        }
        return false;
    }

    buffer += character;

    if (escape_next) {
        escape_next = false;
        return false;
    }

    if (character == '\\' && inside_string) {
        escape_next = true;
        return false;
    }

    if (character == '"') {
        inside_string = !inside_string;
        return false;
    }

    if (inside_string) {
        return false;
    }

    if (character == '{') {
        brace_depth++;
    } else if (character == '}') {
        brace_depth--;
        if (brace_depth == 0) {
            completed_messages.push_back(std::move(buffer));
            buffer.clear();
            started = false;
            return true;
        }
    }
    return false;
}

int MessageFramer::push(const char *data, size_t length) {
    int completed_count = 0;
    for (size_t index = 0; index < length; index++) {
        if (push(data[index])) {
            completed_count++;
        }
    }
    return completed_count;
}

std::string MessageFramer::take_message() {
    if (completed_messages.empty()) {
        return "";
    }
    std::string message = std::move(completed_messages.front());
    completed_messages.pop_front();
    return message;
}

void MessageFramer::reset() {
    buffer.clear();
    brace_depth = 0;
    inside_string = false;
    escape_next = false;
    started = false;
    completed_messages.clear();
}

std::string read_message(std::istream &input) {
    MessageFramer framer;
    char character;
    while (input.get(character)) {
        if (framer.push(character)) {
            return framer.take_message();
        }
    }

    // EOF reached without a complete message.
    return "";
}

std::string read_message() {
    return read_message(std::cin);
}

void write_message(const std::string &json_string) {
    std::cout << json_string << "\n";
    std::cout.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[mcplink-server] " << message << std::endl;
}

} // namespace mcp_stdio
