#ifndef WEBMCPS_MCP_DISPATCH_HPP
#define WEBMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <nlohmann/json.hpp>

#include "mcp/server_context.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// URI of the console log resource.
extern const char CONSOLE_LOGS_URI[15];

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(mcp_server::ServerContext &context, const json &message);

} // namespace mcp_dispatch

#endif // WEBMCPS_MCP_DISPATCH_HPP
