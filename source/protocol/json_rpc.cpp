#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    response["error"]["data"] = error_data;
    return response;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

bool is_valid_request(const json &message, std::string &error_detail) {
    if (!message.is_object()) {
        error_detail = "Request must be a JSON object";
        return false;
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        error_detail = "Missing or invalid 'jsonrpc' (expected \"2.0\")";
        return false;
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        error_detail = "Missing or invalid 'method'";
        return false;
    }
    if (message.contains("id")) {
        const json &id = message["id"];
        if (!id.is_string() && !id.is_number() && !id.is_null()) {
            error_detail = "Invalid 'id' (expected string, number or null)";
            return false;
        }
    }
    return true;
}

} // namespace json_rpc
