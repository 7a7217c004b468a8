#ifndef WEBMCPS_BROWSER_DRIVER_ABI_HPP
#define WEBMCPS_BROWSER_DRIVER_ABI_HPP

// Browser driver abstraction interface.
// The session, capture and action layers only talk to a browser through the
// abstract classes declared here. The CDP driver (browser/cdp/) is the
// production implementation; tests provide in-memory fakes.

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace browser_driver {

using json = nlohmann::json;

// Engine family requested by the caller.
enum class EngineKind {
    Chromium,
    Firefox,
    Webkit
};

// Parse "chromium" | "firefox" | "webkit". Returns false for anything else.
bool parse_engine_kind(const std::string &name, EngineKind &output_kind);

// Lower-case name used in tool arguments and messages.
std::string engine_kind_name(EngineKind kind);

struct Viewport {
    int width = 0;
    int height = 0;
};

struct WindowPosition {
    int x = 0;
    int y = 0;
};

// Options for launching a fresh engine process.
struct LaunchOptions {
    EngineKind engine = EngineKind::Chromium;
    bool headless = false;
    std::optional<int> debug_port;               // fixed remote-debugging port, chromium only
    std::optional<WindowPosition> window_position; // ignored when headless
};

// Options for a new browser context (session-context).
struct ContextOptions {
    std::optional<Viewport> viewport;
};

// Result of a browser driver operation.
struct DriverResult {
    bool success = false;
    std::string message;
    std::string error_detail;
};

// Result of navigation.
struct NavigateResult {
    bool success = false;
    std::string frame_id;
    std::string error_text; // engine errorText if navigation failed
};

// Result of capturing a screenshot.
struct CaptureScreenshotResult {
    bool success = false;
    std::string image_base64;
    std::string mime_type;   // e.g. "image/png"
    std::string error_detail;
};

// Result of evaluating a script with console capture.
struct EvaluateResult {
    bool success = false;
    bool result_is_undefined = false;
    json result_value;                    // structurally serialised return value
    std::vector<std::string> console_lines; // "[log] text" lines produced during evaluation
    std::string error_detail;
};

// --- Element location ---

enum class LocatorKind {
    Selector, // CSS selector
    Text      // case-insensitive, whitespace-normalised substring of the element text
};

struct Locator {
    LocatorKind kind = LocatorKind::Selector;
    std::string value;
};

Locator selector_locator(const std::string &selector);
Locator text_locator(const std::string &text);

// One concrete match of a locator: the locator plus the position of the
// element within the match list at resolution time.
struct ElementHandle {
    Locator locator;
    int match_index = 0;
};

enum class ResolutionKind {
    NotFound,
    SingleMatch,
    MultipleMatches
};

// Typed result of resolving a locator. When success is false the resolution
// itself failed (invalid selector, page gone) and error_detail says why.
struct LocatorResolution {
    bool success = false;
    ResolutionKind kind = ResolutionKind::NotFound;
    std::vector<ElementHandle> handles;
    std::string error_detail;
};

// Build a resolution from a match count (success = true).
LocatorResolution resolution_from_count(const Locator &locator, int match_count);

// --- Page events ---

struct ConsoleMessage {
    std::string type; // engine message type: log, info, warning, error, debug, ...
    std::string text;
};

struct RequestInfo {
    std::string url;
    std::string method;
    std::string resource_type; // lower-case: document, script, xhr, fetch, image, ...
};

struct ResponseInfo {
    RequestInfo request;
    int status = 0;
    std::string status_text;
};

struct RequestFailure {
    RequestInfo request;
    std::string error_text;
};

// Receiver for asynchronous page events. Implementations must tolerate calls
// from the engine's event delivery path while a query runs on the same data.
class PageEventSink {
public:
    virtual ~PageEventSink() = default;

    virtual void on_console_message(const ConsoleMessage &message) = 0;
    virtual void on_request_started(const RequestInfo &request) = 0;
    virtual void on_response_received(const ResponseInfo &response) = 0;
    virtual void on_request_failed(const RequestFailure &failure) = 0;
};

// --- Handles ---

// A single tab.
class Page {
public:
    virtual ~Page() = default;

    virtual NavigateResult navigate(const std::string &url) = 0;

    virtual LocatorResolution resolve(const Locator &locator) = 0;
    virtual DriverResult click(const ElementHandle &element) = 0;
    // Focus the element and type text one character at a time.
    virtual DriverResult type_text(const ElementHandle &element, const std::string &text,
                                   int per_character_delay_milliseconds) = 0;
    virtual DriverResult select_option(const ElementHandle &element, const std::string &value) = 0;
    virtual DriverResult hover(const ElementHandle &element) = 0;

    virtual CaptureScreenshotResult capture_screenshot(bool full_page) = 0;
    virtual CaptureScreenshotResult capture_element_screenshot(const ElementHandle &element) = 0;

    virtual EvaluateResult evaluate(const std::string &script) = 0;

    // Install the receiver for console/network events. nullptr detaches.
    virtual void set_event_sink(PageEventSink *sink) = 0;
    // Give the engine up to timeout_milliseconds to deliver queued events.
    virtual void pump_events(int timeout_milliseconds) = 0;

    virtual bool is_closed() const = 0;
    virtual DriverResult close() = 0;
};

struct PageCreateResult {
    bool success = false;
    std::unique_ptr<Page> page;
    std::string error_detail;
};

// An isolated session-context (cookie jar, storage) holding pages.
class BrowserContext {
public:
    virtual ~BrowserContext() = default;

    virtual PageCreateResult new_page() = 0;
    virtual DriverResult close() = 0;
};

struct ContextCreateResult {
    bool success = false;
    std::unique_ptr<BrowserContext> context;
    std::string error_detail;
};

// A connected engine.
class Browser {
public:
    virtual ~Browser() = default;

    // First context that already exists in the engine, or nullptr if none.
    virtual std::unique_ptr<BrowserContext> first_existing_context() = 0;
    virtual ContextCreateResult new_context(const ContextOptions &options) = 0;

    virtual bool is_connected() const = 0;
    // Launched engines are terminated; attached engines are only disconnected.
    virtual DriverResult close() = 0;
};

struct BrowserLaunchResult {
    bool success = false;
    std::unique_ptr<Browser> browser;
    std::string error_detail;
};

// Factory for Browser handles.
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;

    virtual BrowserLaunchResult launch(const LaunchOptions &options) = 0;
    // endpoint is a ws:// browser URL or an http:// remote-debugging address.
    virtual BrowserLaunchResult connect_over_cdp(const std::string &endpoint) = 0;
};

} // namespace browser_driver

#endif // WEBMCPS_BROWSER_DRIVER_ABI_HPP
