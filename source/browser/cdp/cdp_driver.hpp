#ifndef WEBMCPS_CDP_DRIVER_HPP
#define WEBMCPS_CDP_DRIVER_HPP

// CDP (Chrome DevTools Protocol) driver.
// Implements the browser_driver abstraction on top of a CdpConnection:
// Target/session routing, page event translation, and the element, screenshot
// and evaluation primitives used by the action executor. Chromium only.

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "browser/cdp/cdp_connection.hpp"
#include "utils/server_config.hpp"

namespace cdp_driver {

using json = nlohmann::json;

// A tab attached through a flattened CDP session.
class CdpPage : public browser_driver::Page {
public:
    CdpPage(std::shared_ptr<cdp_connection::CdpConnection> connection, std::string target_id,
            std::string session_id);
    ~CdpPage() override;

    CdpPage(const CdpPage &) = delete;
    CdpPage &operator=(const CdpPage &) = delete;

    // Enable the Page, Runtime and Network domains and apply the viewport.
    browser_driver::DriverResult initialize(const std::optional<browser_driver::Viewport> &viewport);

    browser_driver::NavigateResult navigate(const std::string &url) override;

    browser_driver::LocatorResolution resolve(const browser_driver::Locator &locator) override;
    browser_driver::DriverResult click(const browser_driver::ElementHandle &element) override;
    browser_driver::DriverResult type_text(const browser_driver::ElementHandle &element, const std::string &text,
                                           int per_character_delay_milliseconds) override;
    browser_driver::DriverResult select_option(const browser_driver::ElementHandle &element,
                                               const std::string &value) override;
    browser_driver::DriverResult hover(const browser_driver::ElementHandle &element) override;

    browser_driver::CaptureScreenshotResult capture_screenshot(bool full_page) override;
    browser_driver::CaptureScreenshotResult capture_element_screenshot(
        const browser_driver::ElementHandle &element) override;

    browser_driver::EvaluateResult evaluate(const std::string &script) override;

    void set_event_sink(browser_driver::PageEventSink *sink) override;
    void pump_events(int timeout_milliseconds) override;

    bool is_closed() const override;
    browser_driver::DriverResult close() override;

    const std::string &target_id() const { return target_id_; }

private:
    // Outcome of a Runtime.evaluate with returnByValue.
    struct ScriptOutcome {
        bool success = false;
        bool has_value = false;
        json value;
        std::string error_detail; // page exception message or transport error
    };

    struct ElementGeometry {
        double x = 0;
        double y = 0;
        double width = 0;
        double height = 0;
        double scroll_x = 0;
        double scroll_y = 0;
    };

    ScriptOutcome run_script(const std::string &expression, bool await_promise = false);
    bool element_geometry(const browser_driver::ElementHandle &element, ElementGeometry &output_geometry,
                          std::string &error_detail);
    bool dispatch_mouse_event(const std::string &type, double x, double y, std::string &error_detail);
    // Service the connection until timeout_milliseconds have elapsed.
    void wait_milliseconds(int timeout_milliseconds);
    browser_driver::CaptureScreenshotResult capture_with_params(const json &params);

    void handle_session_event(const std::string &method, const json &params);
    void handle_browser_event(const std::string &method, const json &params);

    std::shared_ptr<cdp_connection::CdpConnection> connection_;
    std::string target_id_;
    std::string session_id_;
    int session_listener_id_ = 0;
    int browser_listener_id_ = 0;

    browser_driver::PageEventSink *event_sink_ = nullptr;
    // In-flight requests by CDP requestId, used to describe responses and failures.
    std::map<std::string, browser_driver::RequestInfo> requests_by_id_;
    bool load_event_fired_ = false;
    bool closed_ = false;
};

// A browser context. The default context of an attached browser is not owned
// and therefore never disposed.
class CdpBrowserContext : public browser_driver::BrowserContext {
public:
    CdpBrowserContext(std::shared_ptr<cdp_connection::CdpConnection> connection, std::string browser_context_id,
                      std::optional<browser_driver::Viewport> viewport, bool owns_context);

    browser_driver::PageCreateResult new_page() override;
    browser_driver::DriverResult close() override;

private:
    std::shared_ptr<cdp_connection::CdpConnection> connection_;
    std::string browser_context_id_; // empty = default context
    std::optional<browser_driver::Viewport> viewport_;
    bool owns_context_ = false;
    bool closed_ = false;
};

// A launched or attached Chromium.
class CdpBrowser : public browser_driver::Browser {
public:
    // process_id <= 0 means attached (not ours to terminate).
    CdpBrowser(std::shared_ptr<cdp_connection::CdpConnection> connection, int process_id,
               std::string user_data_directory);
    ~CdpBrowser() override;

    CdpBrowser(const CdpBrowser &) = delete;
    CdpBrowser &operator=(const CdpBrowser &) = delete;

    std::unique_ptr<browser_driver::BrowserContext> first_existing_context() override;
    browser_driver::ContextCreateResult new_context(const browser_driver::ContextOptions &options) override;

    bool is_connected() const override;
    browser_driver::DriverResult close() override;

    // Pid of the Chrome we launched; -1 when attached or once the process
    // has exited and been reaped.
    int process_id() const { return process_id_; }

private:
    std::shared_ptr<cdp_connection::CdpConnection> connection_;
    bool launched_ = false;
    mutable int process_id_ = -1;
    std::string user_data_directory_;
    bool closed_ = false;
};

// Launches Chromium or attaches to a running one over CDP.
class CdpLauncher : public browser_driver::BrowserLauncher {
public:
    explicit CdpLauncher(const server_config::ServerConfig &config);

    browser_driver::BrowserLaunchResult launch(const browser_driver::LaunchOptions &options) override;
    browser_driver::BrowserLaunchResult connect_over_cdp(const std::string &endpoint) override;

private:
    // Connect to websocket_url and enable target discovery.
    std::shared_ptr<cdp_connection::CdpConnection> open_connection(const std::string &websocket_url,
                                                                   std::string &error_detail);

    const server_config::ServerConfig &config_;
};

// Join console arguments (Runtime.RemoteObject) the way the console prints them.
std::string format_console_arguments(const json &arguments);

// Split UTF-8 text into one string per code point.
std::vector<std::string> split_code_points(const std::string &text);

// What Input.dispatchKeyEvent needs to type one character like a keystroke.
// code and windows_virtual_key_code are set for ASCII letters, digits, space
// and newline (Enter); other characters only carry key and text.
struct KeyDefinition {
    std::string key;
    std::string code;
    int windows_virtual_key_code = 0;
    std::string text;
};

KeyDefinition key_definition_for(const std::string &character);

// Lower-case CDP resource type ("Document" -> "document"); "other" when absent.
std::string normalise_resource_type(const json &params);

} // namespace cdp_driver

#endif // WEBMCPS_CDP_DRIVER_HPP
