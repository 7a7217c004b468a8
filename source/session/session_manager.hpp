#ifndef WEBMCPS_SESSION_MANAGER_HPP
#define WEBMCPS_SESSION_MANAGER_HPP

// Owner of the single browser / context / page triple.
//
// States: Absent -> Active -> Absent. A launch or connect first validates its
// arguments (no state change on failure), then tears down any existing
// session, then builds the new one. close() is idempotent and always runs
// every teardown step. ensure_active() starts a default session on demand and
// replaces a page that was closed behind our back.
//
// Not thread-safe: the dispatcher calls it from a single thread.

#include <memory>
#include <optional>
#include <string>

#include "browser/browser_driver_abi.hpp"
#include "capture/event_capture.hpp"

namespace session {

enum class SessionState {
    Absent,
    Active
};

enum class ConnectionMode {
    Launched,
    Attached
};

enum class SessionErrorKind {
    None,
    Validation, // bad argument combination, nothing was touched
    Lifecycle   // launch/connect failed, state is Absent
};

struct LaunchRequest {
    browser_driver::EngineKind engine = browser_driver::EngineKind::Chromium;
    bool headless = false;
    std::optional<std::string> remote_debug_url;
    std::optional<int> debug_port;
    std::optional<browser_driver::Viewport> viewport;
    std::optional<browser_driver::WindowPosition> window_position;
};

struct SessionResult {
    bool success = false;
    SessionErrorKind error_kind = SessionErrorKind::None;
    std::string message;
    std::string error_detail;
};

struct CloseResult {
    bool was_active = false;
    int failed_steps = 0; // teardown steps that reported a failure (all were still attempted)
};

struct PageAccess {
    bool success = false;
    browser_driver::Page *page = nullptr; // owned by the session manager
    bool page_recreated = false;
    std::string error_detail;
};

// Returns an empty string when the request is acceptable, otherwise the reason.
std::string validate_launch_request(const LaunchRequest &request);

class SessionManager {
public:
    SessionManager(browser_driver::BrowserLauncher &launcher, capture::EventCapture &capture);
    ~SessionManager();

    SessionManager(const SessionManager &) = delete;
    SessionManager &operator=(const SessionManager &) = delete;

    SessionResult launch_or_connect(const LaunchRequest &request);
    CloseResult close();
    PageAccess ensure_active();

    SessionState state() const;
    // Engine kind and mode of the active session; meaningless when Absent.
    browser_driver::EngineKind engine() const { return engine_; }
    ConnectionMode connection_mode() const { return connection_mode_; }

private:
    SessionResult attach(const LaunchRequest &request);
    SessionResult launch(const LaunchRequest &request);
    // Open a page in context_ and install capture on it.
    bool open_page(std::string &error_detail);
    // Release partially built handles after a failed launch/connect.
    void abandon_partial_session();

    browser_driver::BrowserLauncher &launcher_;
    capture::EventCapture &capture_;

    std::unique_ptr<browser_driver::Browser> browser_;
    std::unique_ptr<browser_driver::BrowserContext> context_;
    std::unique_ptr<browser_driver::Page> page_;
    browser_driver::EngineKind engine_ = browser_driver::EngineKind::Chromium;
    ConnectionMode connection_mode_ = ConnectionMode::Launched;
};

} // namespace session

#endif // WEBMCPS_SESSION_MANAGER_HPP
