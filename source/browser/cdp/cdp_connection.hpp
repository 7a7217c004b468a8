#ifndef WEBMCPS_CDP_CONNECTION_HPP
#define WEBMCPS_CDP_CONNECTION_HPP

// CDP (Chrome DevTools Protocol) WebSocket connection.
// One connection per browser. Commands are sent and their responses awaited
// by servicing the socket on the calling thread; events that arrive in the
// meantime are dispatched to listeners registered per CDP session id
// ("" = browser-level events).

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct lws_context;
struct lws;

namespace cdp_connection {

using json = nlohmann::json;

// Result of a CDP command round-trip.
struct CommandResult {
    bool success = false;
    json result;              // the "result" member of the response
    std::string error_detail; // transport error, timeout, or the CDP error message
};

// host, port and path of a ws:// or http:// address.
struct EndpointAddress {
    bool secure = false;
    std::string host;
    int port = 0;
    std::string path = "/";
};

// Parse "ws://host:port/path", "http://host:port" (and wss/https).
// Returns false if the scheme or port is missing or malformed.
bool parse_endpoint_address(const std::string &url, EndpointAddress &output_address, std::string &error_detail);

// Resolve an http:// remote-debugging address to the browser WebSocket URL via
// GET /json/version. A ws:// or wss:// endpoint is returned unchanged.
bool resolve_browser_websocket_url(const std::string &endpoint, int timeout_milliseconds,
                                   std::string &output_websocket_url, std::string &error_detail);

class CdpConnection {
public:
    using EventListener = std::function<void(const std::string &method, const json &params)>;

    explicit CdpConnection(int command_timeout_milliseconds);
    ~CdpConnection();

    CdpConnection(const CdpConnection &) = delete;
    CdpConnection &operator=(const CdpConnection &) = delete;

    bool connect(const std::string &websocket_url, std::string &error_detail);
    void disconnect();
    bool is_connected() const { return connected_; }
    int command_timeout_milliseconds() const { return command_timeout_milliseconds_; }

    // Send a command and wait for its response. A timeout of 0 uses the
    // connection default.
    CommandResult send_command(const std::string &method, const json &params,
                               const std::string &session_id = "", int timeout_milliseconds = 0);

    // Run the WebSocket event loop for up to timeout_milliseconds.
    void service(int timeout_milliseconds);

    int add_event_listener(const std::string &session_id, EventListener listener);
    void remove_event_listener(int listener_id);

    // Handle one complete text frame: a response to an awaited command is
    // kept for send_command, a response nobody waits for any more (the
    // command timed out) is dropped, and an event goes to its listeners.
    void handle_message(const std::string &text);

    // Responses received but not yet taken by send_command.
    size_t pending_response_count();

private:
    struct ListenerEntry {
        int id = 0;
        std::string session_id;
        EventListener listener;
    };

    // Bridges the libwebsockets C callback to the instance (defined in the .cpp).
    friend struct CallbackBridge;

    void dispatch_event(const std::string &session_id, const std::string &method, const json &params);

    int command_timeout_milliseconds_;
    bool connected_ = false;
    bool connection_failed_ = false;
    std::string connection_error_;
    struct lws_context *websocket_context_ = nullptr;
    struct lws *websocket_connection_ = nullptr;

    int next_message_id_ = 1;
    std::map<int, json> pending_responses_;
    std::set<int> awaited_message_ids_;
    std::mutex pending_mutex_;

    std::string receive_buffer_;

    std::vector<ListenerEntry> listeners_;
    std::mutex listener_mutex_;
    int next_listener_id_ = 1;
};

} // namespace cdp_connection

#endif // WEBMCPS_CDP_CONNECTION_HPP
