#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"

#include <iostream>
#include <mutex>

// Uses brace-counting with string/escape awareness for framing,
// so it works both with newline-delimited and streamed JSON.

namespace mcp_stdio {

static std::mutex stdout_mutex;

std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;

    char character;
    while (input.get(character)) {
        // Ignore anything before the first '{' (whitespace, newlines, etc.)
        if (!started) {
            if (character == '{') {
                started = true;
                brace_depth = 1;
                buffer += character;
            }
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
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(const json &message) {
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(stdout_mutex);
    std::cout << serialized << "\n";
    std::cout.flush();
}

void write_notification(const std::string &method, const json &params) {
    write_message(json_rpc::build_notification(method, params));
}

} // namespace mcp_stdio
