#ifndef WEBMCPS_SERVER_CONTEXT_HPP
#define WEBMCPS_SERVER_CONTEXT_HPP

// Everything a request handler may touch. Owned by main() and passed by
// reference down the dispatch path.

#include "capture/artifact_store.hpp"
#include "capture/event_capture.hpp"
#include "session/session_manager.hpp"
#include "utils/server_config.hpp"

namespace mcp_server {

struct ServerContext {
    session::SessionManager &session_manager;
    capture::EventCapture &event_capture;
    capture::ArtifactStore &artifacts;
    const server_config::ServerConfig &config;
};

} // namespace mcp_server

#endif // WEBMCPS_SERVER_CONTEXT_HPP
