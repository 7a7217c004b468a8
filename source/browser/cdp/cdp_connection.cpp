#include "browser/cdp/cdp_connection.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>

#include <chrono>
#include <cstring>
#include <exception>
#include <stdexcept>

namespace cdp_connection {

bool parse_endpoint_address(const std::string &url, EndpointAddress &output_address, std::string &error_detail) {
    EndpointAddress address;
    std::string remainder;
    int default_port = 0;

    if (url.rfind("ws://", 0) == 0) {
        remainder = url.substr(5);
        default_port = 80;
    } else if (url.rfind("wss://", 0) == 0) {
        remainder = url.substr(6);
        address.secure = true;
        default_port = 443;
    } else if (url.rfind("http://", 0) == 0) {
        remainder = url.substr(7);
        default_port = 80;
    } else if (url.rfind("https://", 0) == 0) {
        remainder = url.substr(8);
        address.secure = true;
        default_port = 443;
    } else {
        error_detail = "Unsupported endpoint scheme (expected ws://, wss://, http:// or https://): " + url;
        return false;
    }

    // Split host:port from path.
    std::string host_and_port = remainder;
    auto slash_position = remainder.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = remainder.substr(0, slash_position);
        address.path = remainder.substr(slash_position);
    }

    address.port = default_port;
    auto colon_position = host_and_port.rfind(':');
    if (colon_position != std::string::npos && host_and_port.find(']') == std::string::npos) {
        address.host = host_and_port.substr(0, colon_position);
        std::string port_text = host_and_port.substr(colon_position + 1);
        try {
            size_t consumed = 0;
            address.port = std::stoi(port_text, &consumed);
            if (consumed != port_text.size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::exception &) {
            error_detail = "Invalid port in endpoint: " + url;
            return false;
        }
        if (address.port < 1 || address.port > 65535) {
            error_detail = "Invalid port in endpoint: " + url;
            return false;
        }
    } else {
        address.host = host_and_port;
    }

    if (address.host.empty()) {
        error_detail = "Missing host in endpoint: " + url;
        return false;
    }

    output_address = address;
    return true;
}

// --- libwebsockets callbacks ---

namespace {

// State of a one-shot HTTP GET (context user data of its own lws context).
struct HttpFetchState {
    std::string body;
    int status = 0;
    bool done = false;
    bool failed = false;
    std::string error_detail;
};

HttpFetchState *fetch_state_of(struct lws *websocket_instance) {
    if (websocket_instance == nullptr) {
        return nullptr;
    }
    return static_cast<HttpFetchState *>(lws_context_user(lws_get_context(websocket_instance)));
}

int http_fetch_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                        void *user_data, void *incoming_data, size_t incoming_length) {
    HttpFetchState *state = fetch_state_of(websocket_instance);

    switch (reason) {
    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        if (state != nullptr) {
            state->failed = true;
            state->done = true;
            state->error_detail = incoming_data ? static_cast<const char *>(incoming_data) : "connection error";
        }
        return 0;

    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP:
        if (state != nullptr) {
            state->status = static_cast<int>(lws_http_client_http_response(websocket_instance));
        }
        return 0;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ:
        if (state != nullptr) {
            state->body.append(static_cast<const char *>(incoming_data), incoming_length);
        }
        return 0;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        char buffer[LWS_PRE + 4096];
        char *buffer_pointer = buffer + LWS_PRE;
        int buffer_length = static_cast<int>(sizeof(buffer) - LWS_PRE);
        if (lws_http_client_read(websocket_instance, &buffer_pointer, &buffer_length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP:
        if (state != nullptr) {
            state->done = true;
        }
        return 0;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        if (state != nullptr && !state->done) {
            state->failed = true;
            state->done = true;
            state->error_detail = "connection closed before the response completed";
        }
        return 0;

    default:
        break;
    }

    return lws_callback_http_dummy(websocket_instance, reason, user_data, incoming_data, incoming_length);
}

const struct lws_protocols http_fetch_protocols[] = {
    {"cdp-http-fetch", http_fetch_callback, 0, 0},
    {nullptr, nullptr, 0, 0} // sentinel
};

} // namespace

struct CallbackBridge {
    static CdpConnection *connection_of(struct lws *websocket_instance) {
        if (websocket_instance == nullptr) {
            return nullptr;
        }
        return static_cast<CdpConnection *>(lws_context_user(lws_get_context(websocket_instance)));
    }

    static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                                  void *user_data, void *incoming_data, size_t incoming_length) {
        (void)user_data;
        CdpConnection *connection = connection_of(websocket_instance);
        if (connection == nullptr) {
            return 0;
        }

        switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED:
            connection->connected_ = true;
            debug_log::log("CDP WebSocket connected.");
            break;

        case LWS_CALLBACK_CLIENT_RECEIVE: {
            connection->receive_buffer_.append(static_cast<const char *>(incoming_data), incoming_length);
            // Large messages (screenshots) arrive in several chunks.
            if (lws_is_final_fragment(websocket_instance) && lws_remaining_packet_payload(websocket_instance) == 0) {
                std::string message_text;
                message_text.swap(connection->receive_buffer_);
                connection->handle_message(message_text);
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
            debug_log::warn("CDP WebSocket connection error: " + std::string(error_message));
            connection->connected_ = false;
            connection->connection_failed_ = true;
            connection->connection_error_ = error_message;
            connection->websocket_connection_ = nullptr;
            break;
        }

        case LWS_CALLBACK_CLIENT_CLOSED:
            debug_log::log("CDP WebSocket closed.");
            connection->connected_ = false;
            connection->websocket_connection_ = nullptr;
            break;

        default:
            break;
        }

        return 0;
    }
};

namespace {

const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        CallbackBridge::websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

} // namespace

bool resolve_browser_websocket_url(const std::string &endpoint, int timeout_milliseconds,
                                   std::string &output_websocket_url, std::string &error_detail) {
    if (endpoint.rfind("ws://", 0) == 0 || endpoint.rfind("wss://", 0) == 0) {
        output_websocket_url = endpoint;
        return true;
    }

    EndpointAddress address;
    if (!parse_endpoint_address(endpoint, address, error_detail)) {
        return false;
    }

    HttpFetchState state;

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN;
    context_info.protocols = http_fetch_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = &state;
    if (address.secure) {
        context_info.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    }

    struct lws_context *fetch_context = lws_create_context(&context_info);
    if (fetch_context == nullptr) {
        error_detail = "Failed to create libwebsockets context.";
        return false;
    }

    std::string version_path = "/json/version";
    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = fetch_context;
    connect_info.address = address.host.c_str();
    connect_info.port = address.port;
    connect_info.path = version_path.c_str();
    connect_info.host = address.host.c_str();
    connect_info.origin = address.host.c_str();
    connect_info.method = "GET";
    connect_info.protocol = http_fetch_protocols[0].name;
    connect_info.ssl_connection = address.secure ? LCCSCF_USE_SSL : 0;

    debug_log::log("Fetching http://" + address.host + ":" + std::to_string(address.port) + version_path);
    if (lws_client_connect_via_info(&connect_info) == nullptr) {
        lws_context_destroy(fetch_context);
        error_detail = "Could not connect to " + endpoint;
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!state.done) {
        lws_service(fetch_context, 50);
        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            state.failed = true;
            state.error_detail = "timed out";
            break;
        }
    }
    lws_context_destroy(fetch_context);

    if (state.failed) {
        error_detail = "Could not read " + endpoint + version_path + ": " + state.error_detail;
        return false;
    }
    if (state.status != 200) {
        error_detail = endpoint + version_path + " returned HTTP " + std::to_string(state.status);
        return false;
    }

    try {
        json version = json::parse(state.body);
        if (!version.contains("webSocketDebuggerUrl") || !version["webSocketDebuggerUrl"].is_string()) {
            error_detail = endpoint + version_path + " has no webSocketDebuggerUrl.";
            return false;
        }
        output_websocket_url = version["webSocketDebuggerUrl"].get<std::string>();
    } catch (const json::exception &parse_error) {
        error_detail = "Malformed " + version_path + " response: " + std::string(parse_error.what());
        return false;
    }
    return true;
}

// --- CdpConnection ---

CdpConnection::CdpConnection(int command_timeout_milliseconds)
    : command_timeout_milliseconds_(command_timeout_milliseconds) {
}

CdpConnection::~CdpConnection() {
    disconnect();
}

bool CdpConnection::connect(const std::string &websocket_url, std::string &error_detail) {
    debug_log::log("connect() URL=" + websocket_url);

    EndpointAddress address;
    if (!parse_endpoint_address(websocket_url, address, error_detail)) {
        return false;
    }

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;
    if (address.secure) {
        context_info.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    }

    websocket_context_ = lws_create_context(&context_info);
    if (websocket_context_ == nullptr) {
        error_detail = "Failed to create libwebsockets context.";
        return false;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context_;
    connect_info.address = address.host.c_str();
    connect_info.port = address.port;
    connect_info.path = address.path.c_str();
    connect_info.host = address.host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;
    connect_info.ssl_connection = address.secure ? LCCSCF_USE_SSL : 0;

    debug_log::log("connect() host=" + address.host + " port=" + std::to_string(address.port) +
                   " path=" + address.path);
    connected_ = false;
    connection_failed_ = false;
    connection_error_.clear();
    websocket_connection_ = lws_client_connect_via_info(&connect_info);
    if (websocket_connection_ == nullptr) {
        error_detail = "Could not initiate WebSocket connection to: " + websocket_url;
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    int connection_timeout_milliseconds = 20000;

    while (!connected_) {
        lws_service(websocket_context_, 50);

        if (connection_failed_) {
            error_detail = "WebSocket connection to " + websocket_url + " failed: " + connection_error_;
            lws_context_destroy(websocket_context_);
            websocket_context_ = nullptr;
            websocket_connection_ = nullptr;
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > connection_timeout_milliseconds) {
            error_detail = "Timed out connecting to " + websocket_url + " (after " +
                           std::to_string(connection_timeout_milliseconds / 1000) + " s).";
            lws_context_destroy(websocket_context_);
            websocket_context_ = nullptr;
            websocket_connection_ = nullptr;
            return false;
        }
    }

    return true;
}

void CdpConnection::disconnect() {
    if (websocket_context_ != nullptr) {
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
        debug_log::log("disconnect(): WebSocket context destroyed.");
    }
    websocket_connection_ = nullptr;
    connected_ = false;
    receive_buffer_.clear();
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_responses_.clear();
    awaited_message_ids_.clear();
}

void CdpConnection::service(int timeout_milliseconds) {
    if (websocket_context_ != nullptr) {
        lws_service(websocket_context_, timeout_milliseconds);
    }
}

CommandResult CdpConnection::send_command(const std::string &method, const json &params,
                                          const std::string &session_id, int timeout_milliseconds) {
    CommandResult command_result;
    if (timeout_milliseconds <= 0) {
        timeout_milliseconds = command_timeout_milliseconds_;
    }

    if (!connected_ || websocket_connection_ == nullptr) {
        command_result.error_detail = "Not connected to CDP";
        return command_result;
    }

    int message_id = next_message_id_++;
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }

    std::string serialized_command = command.dump(-1, ' ', false, json::error_handler_t::replace);

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + serialized_command.size());
    memcpy(send_buffer.data() + LWS_PRE, serialized_command.data(), serialized_command.size());

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        awaited_message_ids_.insert(message_id);
    }
    auto stop_awaiting = [this, message_id]() {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        awaited_message_ids_.erase(message_id);
        pending_responses_.erase(message_id);
    };

    int bytes_written = lws_write(websocket_connection_, send_buffer.data() + LWS_PRE,
                                  serialized_command.size(), LWS_WRITE_TEXT);
    if (bytes_written < 0) {
        stop_awaiting();
        command_result.error_detail = "Failed to send CDP command " + method;
        return command_result;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (true) {
        service(10);

        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto response_iterator = pending_responses_.find(message_id);
            if (response_iterator != pending_responses_.end()) {
                json response = std::move(response_iterator->second);
                pending_responses_.erase(response_iterator);
                awaited_message_ids_.erase(message_id);
                if (response.contains("error")) {
                    const json &error = response["error"];
                    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                        command_result.error_detail = error["message"].get<std::string>();
                    } else {
                        command_result.error_detail = error.dump();
                    }
                    return command_result;
                }
                command_result.success = true;
                command_result.result = response.contains("result") ? response["result"] : json::object();
                return command_result;
            }
        }

        if (!connected_) {
            stop_awaiting();
            command_result.error_detail = "Browser connection closed while waiting for " + method;
            return command_result;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            stop_awaiting();
            command_result.error_detail = "Timed out waiting for CDP response to method: " + method;
            return command_result;
        }
    }
}

int CdpConnection::add_event_listener(const std::string &session_id, EventListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    ListenerEntry entry;
    entry.id = next_listener_id_++;
    entry.session_id = session_id;
    entry.listener = std::move(listener);
    listeners_.push_back(std::move(entry));
    return listeners_.back().id;
}

void CdpConnection::remove_event_listener(int listener_id) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for (auto iterator = listeners_.begin(); iterator != listeners_.end(); ++iterator) {
        if (iterator->id == listener_id) {
            listeners_.erase(iterator);
            return;
        }
    }
}

void CdpConnection::handle_message(const std::string &text) {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error &parse_error) {
        debug_log::warn("Failed to parse CDP message: " + std::string(parse_error.what()) +
                        ", buffer content: " + text.substr(0, 200));
        return;
    }

    // A response has an "id"; an event has a "method" and no "id".
    if (message.contains("id") && message["id"].is_number_integer()) {
        int message_id = message["id"].get<int>();
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (awaited_message_ids_.count(message_id) == 0) {
            debug_log::log("Dropping late CDP response id=" + std::to_string(message_id));
            return;
        }
        pending_responses_[message_id] = std::move(message);
        return;
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        return;
    }
    std::string session_id;
    if (message.contains("sessionId") && message["sessionId"].is_string()) {
        session_id = message["sessionId"].get<std::string>();
    }
    json params = message.contains("params") ? message["params"] : json::object();
    dispatch_event(session_id, message["method"].get<std::string>(), params);
}

size_t CdpConnection::pending_response_count() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_responses_.size();
}

void CdpConnection::dispatch_event(const std::string &session_id, const std::string &method, const json &params) {
    std::vector<EventListener> matching;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        for (const auto &entry : listeners_) {
            if (entry.session_id == session_id) {
                matching.push_back(entry.listener);
            }
        }
    }
    for (const auto &listener : matching) {
        try {
            listener(method, params);
        } catch (const std::exception &error) {
            debug_log::warn("CDP event handler for " + method + " failed: " + std::string(error.what()));
        }
    }
}

} // namespace cdp_connection
