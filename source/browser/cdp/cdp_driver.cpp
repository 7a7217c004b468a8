#include "browser/cdp/cdp_driver.hpp"
#include "browser/cdp/cdp_chrome_launch.hpp"
#include "browser/cdp/cdp_page_scripts.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <utility>

namespace cdp_driver {

using browser_driver::CaptureScreenshotResult;
using browser_driver::DriverResult;
using browser_driver::ElementHandle;
using cdp_connection::CdpConnection;
using cdp_connection::CommandResult;

static constexpr int kTerminateGraceMilliseconds = 3000;

// --- Free helpers ---

std::string format_console_arguments(const json &arguments) {
    std::string text_parts;
    if (!arguments.is_array()) {
        return text_parts;
    }
    for (const auto &argument : arguments) {
        std::string piece;
        if (argument.contains("value")) {
            const auto &value = argument["value"];
            if (value.is_string()) {
                piece = value.get<std::string>();
            } else {
                piece = value.dump(-1, ' ', false, json::error_handler_t::replace);
            }
        } else if (argument.contains("unserializableValue") && argument["unserializableValue"].is_string()) {
            piece = argument["unserializableValue"].get<std::string>();
        } else if (argument.contains("description") && argument["description"].is_string()) {
            piece = argument["description"].get<std::string>();
        } else if (argument.contains("type") && argument["type"] == "undefined") {
            piece = "undefined";
        }
        if (!text_parts.empty()) {
            text_parts += " ";
        }
        text_parts += piece;
    }
    return text_parts;
}

std::vector<std::string> split_code_points(const std::string &text) {
    std::vector<std::string> code_points;
    size_t index = 0;
    while (index < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[index]);
        size_t length = 1;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
        }
        length = std::min(length, text.size() - index);
        code_points.push_back(text.substr(index, length));
        index += length;
    }
    return code_points;
}

KeyDefinition key_definition_for(const std::string &character) {
    KeyDefinition definition;
    definition.key = character;
    definition.text = character;
    if (character == "\n" || character == "\r") {
        definition.key = "Enter";
        definition.code = "Enter";
        definition.windows_virtual_key_code = 13;
        definition.text = "\r";
        return definition;
    }
    if (character.size() != 1) {
        return definition;
    }
    char ascii = character[0];
    if (ascii >= 'a' && ascii <= 'z') {
        ascii = static_cast<char>(ascii - 'a' + 'A');
    }
    if (ascii >= 'A' && ascii <= 'Z') {
        definition.code = std::string("Key") + ascii;
        definition.windows_virtual_key_code = ascii;
    } else if (ascii >= '0' && ascii <= '9') {
        definition.code = std::string("Digit") + ascii;
        definition.windows_virtual_key_code = ascii;
    } else if (ascii == ' ') {
        definition.code = "Space";
        definition.windows_virtual_key_code = 32;
    }
    return definition;
}

std::string normalise_resource_type(const json &params) {
    if (!params.contains("type") || !params["type"].is_string()) {
        return "other";
    }
    std::string type = params["type"].get<std::string>();
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return type;
}

namespace {

std::string string_field(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

// Message of a Runtime exceptionDetails object.
std::string exception_message(const json &exception_details) {
    if (exception_details.contains("exception")) {
        std::string description = string_field(exception_details["exception"], "description");
        if (!description.empty()) {
            // First line only; the rest is the stack.
            auto newline_position = description.find('\n');
            if (newline_position != std::string::npos) {
                description = description.substr(0, newline_position);
            }
            // "Error: message" -> "message"
            const std::string error_prefix = "Error: ";
            if (description.rfind(error_prefix, 0) == 0) {
                description = description.substr(error_prefix.size());
            }
            return description;
        }
        std::string value = string_field(exception_details["exception"], "value");
        if (!value.empty()) {
            return value;
        }
    }
    std::string text = string_field(exception_details, "text");
    return text.empty() ? "script threw an exception" : text;
}

DriverResult failed_driver_result(const std::string &error_detail) {
    DriverResult result;
    result.success = false;
    result.error_detail = error_detail;
    return result;
}

DriverResult succeeded_driver_result(const std::string &message) {
    DriverResult result;
    result.success = true;
    result.message = message;
    return result;
}

} // namespace

// --- CdpPage ---

CdpPage::CdpPage(std::shared_ptr<CdpConnection> connection, std::string target_id, std::string session_id)
    : connection_(std::move(connection)), target_id_(std::move(target_id)), session_id_(std::move(session_id)) {
    session_listener_id_ = connection_->add_event_listener(
        session_id_, [this](const std::string &method, const json &params) { handle_session_event(method, params); });
    browser_listener_id_ = connection_->add_event_listener(
        "", [this](const std::string &method, const json &params) { handle_browser_event(method, params); });
}

CdpPage::~CdpPage() {
    connection_->remove_event_listener(session_listener_id_);
    connection_->remove_event_listener(browser_listener_id_);
}

DriverResult CdpPage::initialize(const std::optional<browser_driver::Viewport> &viewport) {
    for (const char *domain_enable : {"Page.enable", "Runtime.enable", "Network.enable"}) {
        CommandResult enable_result = connection_->send_command(domain_enable, json::object(), session_id_);
        if (!enable_result.success) {
            return failed_driver_result(std::string(domain_enable) + " failed: " + enable_result.error_detail);
        }
    }

    if (viewport.has_value()) {
        json metrics_params;
        metrics_params["width"] = viewport->width;
        metrics_params["height"] = viewport->height;
        metrics_params["deviceScaleFactor"] = 0;
        metrics_params["mobile"] = false;
        CommandResult metrics_result =
            connection_->send_command("Emulation.setDeviceMetricsOverride", metrics_params, session_id_);
        if (!metrics_result.success) {
            return failed_driver_result("Emulation.setDeviceMetricsOverride failed: " + metrics_result.error_detail);
        }
    }
    return succeeded_driver_result("Page ready.");
}

void CdpPage::handle_session_event(const std::string &method, const json &params) {
    if (method == "Page.loadEventFired") {
        load_event_fired_ = true;
        return;
    }
    if (method == "Inspector.detached" || method == "Inspector.targetCrashed") {
        closed_ = true;
        return;
    }

    if (method == "Network.loadingFinished") {
        requests_by_id_.erase(string_field(params, "requestId"));
        return;
    }

    if (method == "Runtime.consoleAPICalled") {
        if (event_sink_ == nullptr) {
            return;
        }
        browser_driver::ConsoleMessage message;
        message.type = string_field(params, "type");
        if (message.type.empty()) {
            message.type = "log";
        }
        message.text = format_console_arguments(params.contains("args") ? params["args"] : json::array());
        event_sink_->on_console_message(message);
        return;
    }

    if (method == "Network.requestWillBeSent") {
        std::string request_id = string_field(params, "requestId");
        if (!params.contains("request")) {
            return;
        }
        const json &request = params["request"];

        // A redirect reuses the request id: the previous hop ends with the redirect response.
        if (params.contains("redirectResponse") && params["redirectResponse"].is_object()) {
            auto previous = requests_by_id_.find(request_id);
            if (previous != requests_by_id_.end() && event_sink_ != nullptr) {
                const json &redirect_response = params["redirectResponse"];
                browser_driver::ResponseInfo response;
                response.request = previous->second;
                if (redirect_response.contains("status") && redirect_response["status"].is_number()) {
                    response.status = redirect_response["status"].get<int>();
                }
                response.status_text = string_field(redirect_response, "statusText");
                event_sink_->on_response_received(response);
            }
        }

        browser_driver::RequestInfo info;
        info.url = string_field(request, "url");
        info.method = string_field(request, "method");
        info.resource_type = normalise_resource_type(params);
        requests_by_id_[request_id] = info;
        if (event_sink_ != nullptr) {
            event_sink_->on_request_started(info);
        }
        return;
    }

    if (method == "Network.responseReceived") {
        std::string request_id = string_field(params, "requestId");
        if (!params.contains("response") || event_sink_ == nullptr) {
            return;
        }
        const json &response_json = params["response"];
        browser_driver::ResponseInfo response;
        auto known = requests_by_id_.find(request_id);
        if (known != requests_by_id_.end()) {
            response.request = known->second;
        } else {
            response.request.url = string_field(response_json, "url");
            response.request.method = "GET";
            response.request.resource_type = normalise_resource_type(params);
        }
        if (response_json.contains("status") && response_json["status"].is_number()) {
            response.status = response_json["status"].get<int>();
        }
        response.status_text = string_field(response_json, "statusText");
        event_sink_->on_response_received(response);
        return;
    }

    if (method == "Network.loadingFailed") {
        std::string request_id = string_field(params, "requestId");
        auto known = requests_by_id_.find(request_id);
        if (known == requests_by_id_.end()) {
            return;
        }
        browser_driver::RequestFailure failure;
        failure.request = known->second;
        failure.error_text = string_field(params, "errorText");
        requests_by_id_.erase(known);
        if (event_sink_ != nullptr) {
            event_sink_->on_request_failed(failure);
        }
        return;
    }
}

void CdpPage::handle_browser_event(const std::string &method, const json &params) {
    if (method == "Target.detachedFromTarget" && string_field(params, "sessionId") == session_id_) {
        debug_log::log("Page session detached: " + session_id_);
        closed_ = true;
    } else if ((method == "Target.targetDestroyed" || method == "Target.targetCrashed") &&
               string_field(params, "targetId") == target_id_) {
        debug_log::log("Page target gone: " + target_id_);
        closed_ = true;
    }
}

void CdpPage::wait_milliseconds(int timeout_milliseconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return;
        }
        connection_->service(static_cast<int>(std::min<long long>(remaining, 50)));
    }
}

CdpPage::ScriptOutcome CdpPage::run_script(const std::string &expression, bool await_promise) {
    ScriptOutcome outcome;
    json eval_params;
    eval_params["expression"] = expression;
    eval_params["returnByValue"] = true;
    eval_params["awaitPromise"] = await_promise;
    eval_params["userGesture"] = true;

    CommandResult eval_result = connection_->send_command("Runtime.evaluate", eval_params, session_id_);
    if (!eval_result.success) {
        outcome.error_detail = eval_result.error_detail;
        return outcome;
    }
    if (eval_result.result.contains("exceptionDetails")) {
        outcome.error_detail = exception_message(eval_result.result["exceptionDetails"]);
        return outcome;
    }
    outcome.success = true;
    if (eval_result.result.contains("result")) {
        const json &remote_object = eval_result.result["result"];
        if (remote_object.contains("value")) {
            outcome.has_value = true;
            outcome.value = remote_object["value"];
        }
    }
    return outcome;
}

browser_driver::NavigateResult CdpPage::navigate(const std::string &url) {
    browser_driver::NavigateResult result;
    load_event_fired_ = false;

    json navigate_params;
    navigate_params["url"] = url;
    CommandResult navigate_response = connection_->send_command("Page.navigate", navigate_params, session_id_);
    if (!navigate_response.success) {
        result.error_text = navigate_response.error_detail;
        return result;
    }

    result.frame_id = string_field(navigate_response.result, "frameId");
    std::string error_text = string_field(navigate_response.result, "errorText");
    if (!error_text.empty()) {
        result.error_text = error_text;
        return result;
    }

    // Same-document navigations carry no loaderId and fire no load event.
    if (navigate_response.result.contains("loaderId")) {
        auto start_time = std::chrono::steady_clock::now();
        int timeout_milliseconds = connection_->command_timeout_milliseconds();
        while (!load_event_fired_) {
            connection_->service(50);
            if (closed_ || !connection_->is_connected()) {
                result.error_text = "Page closed during navigation";
                return result;
            }
            auto elapsed = std::chrono::steady_clock::now() - start_time;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
                result.error_text = "Timeout " + std::to_string(timeout_milliseconds) +
                                    "ms exceeded waiting for the load event";
                return result;
            }
        }
    }

    result.success = true;
    return result;
}

browser_driver::LocatorResolution CdpPage::resolve(const browser_driver::Locator &locator) {
    browser_driver::LocatorResolution resolution;
    ScriptOutcome outcome = run_script(cdp_page_scripts::count_matches_script(locator));
    if (!outcome.success) {
        resolution.success = false;
        resolution.error_detail = outcome.error_detail;
        return resolution;
    }
    if (!outcome.has_value || !outcome.value.is_number_integer()) {
        resolution.success = false;
        resolution.error_detail = "Unexpected locator count result";
        return resolution;
    }
    return browser_driver::resolution_from_count(locator, outcome.value.get<int>());
}

bool CdpPage::element_geometry(const ElementHandle &element, ElementGeometry &output_geometry,
                               std::string &error_detail) {
    ScriptOutcome outcome = run_script(cdp_page_scripts::element_geometry_script(element));
    if (!outcome.success) {
        error_detail = outcome.error_detail;
        return false;
    }
    const json &box = outcome.value;
    if (!outcome.has_value || !box.is_object() || !box.contains("x") || !box.contains("y") ||
        !box.contains("width") || !box.contains("height")) {
        error_detail = "Could not compute the element box";
        return false;
    }
    output_geometry.x = box["x"].get<double>();
    output_geometry.y = box["y"].get<double>();
    output_geometry.width = box["width"].get<double>();
    output_geometry.height = box["height"].get<double>();
    output_geometry.scroll_x = box.value("scrollX", 0.0);
    output_geometry.scroll_y = box.value("scrollY", 0.0);
    return true;
}

bool CdpPage::dispatch_mouse_event(const std::string &type, double x, double y, std::string &error_detail) {
    json mouse_params;
    mouse_params["type"] = type;
    mouse_params["x"] = x;
    mouse_params["y"] = y;
    if (type != "mouseMoved") {
        mouse_params["button"] = "left";
        mouse_params["clickCount"] = 1;
    }
    CommandResult mouse_result = connection_->send_command("Input.dispatchMouseEvent", mouse_params, session_id_);
    if (!mouse_result.success) {
        error_detail = mouse_result.error_detail;
        return false;
    }
    return true;
}

DriverResult CdpPage::click(const ElementHandle &element) {
    ElementGeometry geometry;
    std::string error_detail;
    if (!element_geometry(element, geometry, error_detail)) {
        return failed_driver_result(error_detail);
    }
    double center_x = geometry.x + geometry.width / 2;
    double center_y = geometry.y + geometry.height / 2;

    for (const char *event_type : {"mouseMoved", "mousePressed", "mouseReleased"}) {
        if (!dispatch_mouse_event(event_type, center_x, center_y, error_detail)) {
            return failed_driver_result(error_detail);
        }
    }
    return succeeded_driver_result("Clicked.");
}

DriverResult CdpPage::hover(const ElementHandle &element) {
    ElementGeometry geometry;
    std::string error_detail;
    if (!element_geometry(element, geometry, error_detail)) {
        return failed_driver_result(error_detail);
    }
    if (!dispatch_mouse_event("mouseMoved", geometry.x + geometry.width / 2, geometry.y + geometry.height / 2,
                              error_detail)) {
        return failed_driver_result(error_detail);
    }
    return succeeded_driver_result("Hovered.");
}

DriverResult CdpPage::type_text(const ElementHandle &element, const std::string &text,
                                int per_character_delay_milliseconds) {
    ScriptOutcome focus_outcome = run_script(cdp_page_scripts::focus_editable_script(element));
    if (!focus_outcome.success) {
        return failed_driver_result(focus_outcome.error_detail);
    }

    std::vector<std::string> code_points = split_code_points(text);
    for (size_t index = 0; index < code_points.size(); ++index) {
        KeyDefinition definition = key_definition_for(code_points[index]);

        json key_down;
        key_down["type"] = "keyDown";
        key_down["key"] = definition.key;
        key_down["text"] = definition.text;
        key_down["unmodifiedText"] = definition.text;
        if (!definition.code.empty()) {
            key_down["code"] = definition.code;
            key_down["windowsVirtualKeyCode"] = definition.windows_virtual_key_code;
        }
        CommandResult down_result = connection_->send_command("Input.dispatchKeyEvent", key_down, session_id_);
        if (!down_result.success) {
            return failed_driver_result(down_result.error_detail);
        }

        json key_up;
        key_up["type"] = "keyUp";
        key_up["key"] = definition.key;
        if (!definition.code.empty()) {
            key_up["code"] = definition.code;
            key_up["windowsVirtualKeyCode"] = definition.windows_virtual_key_code;
        }
        CommandResult up_result = connection_->send_command("Input.dispatchKeyEvent", key_up, session_id_);
        if (!up_result.success) {
            return failed_driver_result(up_result.error_detail);
        }

        if (per_character_delay_milliseconds > 0 && index + 1 < code_points.size()) {
            wait_milliseconds(per_character_delay_milliseconds);
        }
    }
    return succeeded_driver_result("Typed.");
}

DriverResult CdpPage::select_option(const ElementHandle &element, const std::string &value) {
    ScriptOutcome outcome = run_script(cdp_page_scripts::select_option_script(element, value));
    if (!outcome.success) {
        return failed_driver_result(outcome.error_detail);
    }
    return succeeded_driver_result("Selected.");
}

CaptureScreenshotResult CdpPage::capture_with_params(const json &params) {
    CaptureScreenshotResult result;
    CommandResult capture_response = connection_->send_command("Page.captureScreenshot", params, session_id_);
    if (!capture_response.success) {
        result.error_detail = capture_response.error_detail;
        return result;
    }
    std::string data = string_field(capture_response.result, "data");
    if (data.empty()) {
        result.error_detail = "Page.captureScreenshot did not return image data.";
        return result;
    }
    result.success = true;
    result.image_base64 = std::move(data);
    result.mime_type = "image/png";
    return result;
}

CaptureScreenshotResult CdpPage::capture_screenshot(bool full_page) {
    json capture_params;
    capture_params["format"] = "png";

    if (full_page) {
        CommandResult metrics = connection_->send_command("Page.getLayoutMetrics", json::object(), session_id_);
        if (!metrics.success) {
            CaptureScreenshotResult result;
            result.error_detail = "Page.getLayoutMetrics failed: " + metrics.error_detail;
            return result;
        }
        const char *size_key = metrics.result.contains("cssContentSize") ? "cssContentSize" : "contentSize";
        if (metrics.result.contains(size_key)) {
            const json &content_size = metrics.result[size_key];
            json clip;
            clip["x"] = 0;
            clip["y"] = 0;
            clip["width"] = std::ceil(content_size.value("width", 0.0));
            clip["height"] = std::ceil(content_size.value("height", 0.0));
            clip["scale"] = 1;
            capture_params["clip"] = clip;
            capture_params["captureBeyondViewport"] = true;
        }
    }
    return capture_with_params(capture_params);
}

CaptureScreenshotResult CdpPage::capture_element_screenshot(const ElementHandle &element) {
    ElementGeometry geometry;
    std::string error_detail;
    if (!element_geometry(element, geometry, error_detail)) {
        CaptureScreenshotResult result;
        result.error_detail = error_detail;
        return result;
    }

    json clip;
    clip["x"] = geometry.x + geometry.scroll_x;
    clip["y"] = geometry.y + geometry.scroll_y;
    clip["width"] = geometry.width;
    clip["height"] = geometry.height;
    clip["scale"] = 1;

    json capture_params;
    capture_params["format"] = "png";
    capture_params["clip"] = clip;
    capture_params["captureBeyondViewport"] = true;
    return capture_with_params(capture_params);
}

browser_driver::EvaluateResult CdpPage::evaluate(const std::string &script) {
    browser_driver::EvaluateResult result;
    ScriptOutcome outcome = run_script(cdp_page_scripts::evaluate_with_console_capture_script(script), true);
    if (!outcome.success) {
        result.error_detail = outcome.error_detail;
        return result;
    }
    if (!outcome.has_value || !outcome.value.is_object()) {
        result.error_detail = "Evaluation returned no result";
        return result;
    }

    const json &payload = outcome.value;
    result.success = true;
    result.result_is_undefined = !payload.value("hasResult", false);
    if (!result.result_is_undefined && payload.contains("result")) {
        result.result_value = payload["result"];
    }
    if (payload.contains("logs") && payload["logs"].is_array()) {
        for (const auto &line : payload["logs"]) {
            if (line.is_string()) {
                result.console_lines.push_back(line.get<std::string>());
            }
        }
    }
    return result;
}

void CdpPage::set_event_sink(browser_driver::PageEventSink *sink) {
    event_sink_ = sink;
}

void CdpPage::pump_events(int timeout_milliseconds) {
    wait_milliseconds(timeout_milliseconds);
}

bool CdpPage::is_closed() const {
    return closed_ || !connection_->is_connected();
}

DriverResult CdpPage::close() {
    if (closed_) {
        return succeeded_driver_result("Page already closed.");
    }
    json close_params;
    close_params["targetId"] = target_id_;
    CommandResult close_response = connection_->send_command("Target.closeTarget", close_params);
    closed_ = true;
    if (!close_response.success) {
        return failed_driver_result("Target.closeTarget failed: " + close_response.error_detail);
    }
    return succeeded_driver_result("Page closed.");
}

// --- CdpBrowserContext ---

CdpBrowserContext::CdpBrowserContext(std::shared_ptr<CdpConnection> connection, std::string browser_context_id,
                                     std::optional<browser_driver::Viewport> viewport, bool owns_context)
    : connection_(std::move(connection)), browser_context_id_(std::move(browser_context_id)),
      viewport_(viewport), owns_context_(owns_context) {
}

browser_driver::PageCreateResult CdpBrowserContext::new_page() {
    browser_driver::PageCreateResult result;

    json create_params;
    create_params["url"] = "about:blank";
    if (!browser_context_id_.empty()) {
        create_params["browserContextId"] = browser_context_id_;
    }
    CommandResult create_response = connection_->send_command("Target.createTarget", create_params);
    std::string target_id = string_field(create_response.result, "targetId");
    if (!create_response.success || target_id.empty()) {
        result.error_detail = "Target.createTarget failed: " + create_response.error_detail;
        return result;
    }
    debug_log::log("new_page: created targetId=" + target_id);

    json attach_params;
    attach_params["targetId"] = target_id;
    attach_params["flatten"] = true;
    CommandResult attach_response = connection_->send_command("Target.attachToTarget", attach_params);
    std::string session_id = string_field(attach_response.result, "sessionId");
    if (!attach_response.success || session_id.empty()) {
        result.error_detail = "Target.attachToTarget failed: " + attach_response.error_detail;
        json close_params;
        close_params["targetId"] = target_id;
        CommandResult close_response = connection_->send_command("Target.closeTarget", close_params);
        if (!close_response.success) {
            debug_log::log("new_page: Target.closeTarget failed: " + close_response.error_detail);
        }
        return result;
    }

    auto page = std::make_unique<CdpPage>(connection_, target_id, session_id);
    DriverResult init_result = page->initialize(viewport_);
    if (!init_result.success) {
        result.error_detail = init_result.error_detail;
        DriverResult close_result = page->close();
        if (!close_result.success) {
            debug_log::log("new_page: " + close_result.error_detail);
        }
        return result;
    }

    debug_log::log("new_page: attached sessionId=" + session_id);
    result.success = true;
    result.page = std::move(page);
    return result;
}

DriverResult CdpBrowserContext::close() {
    if (closed_ || !owns_context_) {
        closed_ = true;
        return succeeded_driver_result("Context released.");
    }
    closed_ = true;
    json dispose_params;
    dispose_params["browserContextId"] = browser_context_id_;
    CommandResult dispose_response = connection_->send_command("Target.disposeBrowserContext", dispose_params);
    if (!dispose_response.success) {
        return failed_driver_result("Target.disposeBrowserContext failed: " + dispose_response.error_detail);
    }
    return succeeded_driver_result("Context disposed.");
}

// --- CdpBrowser ---

CdpBrowser::CdpBrowser(std::shared_ptr<CdpConnection> connection, int process_id, std::string user_data_directory)
    : connection_(std::move(connection)), launched_(process_id > 0), process_id_(process_id),
      user_data_directory_(std::move(user_data_directory)) {
}

CdpBrowser::~CdpBrowser() {
    if (!closed_) {
        close();
    }
}

std::unique_ptr<browser_driver::BrowserContext> CdpBrowser::first_existing_context() {
    // Every Chromium has a default context.
    return std::make_unique<CdpBrowserContext>(connection_, "", std::nullopt, false);
}

browser_driver::ContextCreateResult CdpBrowser::new_context(const browser_driver::ContextOptions &options) {
    browser_driver::ContextCreateResult result;
    json create_params;
    create_params["disposeOnDetach"] = true;
    CommandResult create_response = connection_->send_command("Target.createBrowserContext", create_params);
    std::string browser_context_id = string_field(create_response.result, "browserContextId");
    if (!create_response.success || browser_context_id.empty()) {
        result.error_detail = "Target.createBrowserContext failed: " + create_response.error_detail;
        return result;
    }
    result.success = true;
    result.context = std::make_unique<CdpBrowserContext>(connection_, browser_context_id, options.viewport, true);
    return result;
}

bool CdpBrowser::is_connected() const {
    if (closed_) {
        return false;
    }
    // Let libwebsockets notice a closed socket.
    connection_->service(0);
    if (process_id_ > 0 && !platform::is_process_running(process_id_)) {
        // Reaped: the pid may be reused, never signal it again.
        debug_log::log("Chrome process id=" + std::to_string(process_id_) + " has exited");
        process_id_ = -1;
        return false;
    }
    if (launched_ && process_id_ <= 0) {
        return false;
    }
    return connection_->is_connected();
}

DriverResult CdpBrowser::close() {
    if (closed_) {
        return succeeded_driver_result("Browser already closed.");
    }
    closed_ = true;

    DriverResult result = succeeded_driver_result("Browser closed.");
    if (launched_) {
        if (connection_->is_connected()) {
            CommandResult close_response = connection_->send_command("Browser.close", json::object(), "", 5000);
            if (!close_response.success) {
                debug_log::log("Browser.close failed: " + close_response.error_detail);
            }
        }
        connection_->disconnect();
        if (process_id_ > 0) {
            debug_log::log("Terminating Chrome process id=" + std::to_string(process_id_));
            platform::terminate_process(process_id_, kTerminateGraceMilliseconds);
            process_id_ = -1;
        }

        std::error_code remove_error;
        std::filesystem::remove_all(user_data_directory_, remove_error);
        if (remove_error) {
            result = failed_driver_result("Could not remove profile directory " + user_data_directory_ + ": " +
                                          remove_error.message());
        }
    } else {
        connection_->disconnect();
    }
    return result;
}

// --- CdpLauncher ---

CdpLauncher::CdpLauncher(const server_config::ServerConfig &config) : config_(config) {
}

std::shared_ptr<CdpConnection> CdpLauncher::open_connection(const std::string &websocket_url,
                                                            std::string &error_detail) {
    auto connection = std::make_shared<CdpConnection>(config_.command_timeout_milliseconds);
    if (!connection->connect(websocket_url, error_detail)) {
        return nullptr;
    }

    json discover_params;
    discover_params["discover"] = true;
    CommandResult discover_response = connection->send_command("Target.setDiscoverTargets", discover_params);
    if (!discover_response.success) {
        debug_log::warn("Target.setDiscoverTargets failed: " + discover_response.error_detail);
    }
    return connection;
}

browser_driver::BrowserLaunchResult CdpLauncher::launch(const browser_driver::LaunchOptions &options) {
    browser_driver::BrowserLaunchResult result;

    if (options.engine != browser_driver::EngineKind::Chromium) {
        result.error_detail = "the CDP driver only supports chromium (requested " +
                              browser_driver::engine_kind_name(options.engine) + ")";
        return result;
    }

    cdp_chrome_launch::ChromeLaunchResult launch_result =
        cdp_chrome_launch::launch_chrome(options, config_.chrome_executable_path);
    if (!launch_result.success) {
        result.error_detail = launch_result.error_message;
        return result;
    }

    std::string error_detail;
    std::shared_ptr<CdpConnection> connection = open_connection(launch_result.websocket_debugger_url, error_detail);
    if (!connection) {
        debug_log::log("launch: WebSocket connect failed, terminating Chrome pid=" +
                       std::to_string(launch_result.process_id));
        platform::terminate_process(launch_result.process_id, kTerminateGraceMilliseconds);
        std::error_code remove_error;
        std::filesystem::remove_all(launch_result.user_data_directory, remove_error);
        result.error_detail = error_detail;
        return result;
    }

    result.success = true;
    result.browser = std::make_unique<CdpBrowser>(connection, launch_result.process_id,
                                                  launch_result.user_data_directory);
    return result;
}

browser_driver::BrowserLaunchResult CdpLauncher::connect_over_cdp(const std::string &endpoint) {
    browser_driver::BrowserLaunchResult result;

    std::string websocket_url;
    std::string error_detail;
    if (!cdp_connection::resolve_browser_websocket_url(endpoint, config_.command_timeout_milliseconds,
                                                       websocket_url, error_detail)) {
        result.error_detail = error_detail;
        return result;
    }

    std::shared_ptr<CdpConnection> connection = open_connection(websocket_url, error_detail);
    if (!connection) {
        result.error_detail = error_detail;
        return result;
    }

    result.success = true;
    result.browser = std::make_unique<CdpBrowser>(connection, -1, "");
    return result;
}

} // namespace cdp_driver
