#ifndef WEBMCPS_MCP_STDIO_HPP
#define WEBMCPS_MCP_STDIO_HPP

// MCP stdio transport: reading JSON messages from stdin and writing to stdout.

#include <nlohmann/json.hpp>
#include <istream>
#include <string>

namespace mcp_stdio {

using json = nlohmann::json;

// Read a single complete JSON object from input (brace counting, string and
// escape aware). Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input);

// Serialise message (invalid UTF-8 replaced) and write it to stdout as one
// line. Safe to call from engine event callbacks.
void write_message(const json &message);

// Write a JSON-RPC notification.
void write_notification(const std::string &method, const json &params);

} // namespace mcp_stdio

#endif // WEBMCPS_MCP_STDIO_HPP
