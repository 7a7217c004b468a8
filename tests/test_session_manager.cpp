// Tests for the session lifecycle against the in-memory browser.

#include "session/session_manager.hpp"
#include "fake_browser.hpp"

#include <iostream>
#include <string>

namespace test_session_manager {

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static bool test_close_is_idempotent() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::CloseResult first = manager.close();
    bool absent_after_first = manager.state() == session::SessionState::Absent;
    session::CloseResult second = manager.close();

    return expect(!first.was_active && !second.was_active && first.failed_steps == 0 &&
                      second.failed_steps == 0 && absent_after_first &&
                      manager.state() == session::SessionState::Absent,
                  "close() twice in a row is harmless and leaves the state Absent");
}

static bool test_close_after_launch_then_again() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::SessionResult launched = manager.launch_or_connect(session::LaunchRequest());
    session::CloseResult first = manager.close();
    session::CloseResult second = manager.close();

    return expect(launched.success && first.was_active && !second.was_active && world.browser_close_count == 1 &&
                      manager.state() == session::SessionState::Absent,
                  "close() after a launch tears down once; a second close() is a no-op");
}

static bool test_cdp_with_firefox_is_rejected() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    manager.launch_or_connect(session::LaunchRequest());
    browser_driver::ConsoleMessage message;
    message.type = "log";
    message.text = "survives";
    world.sink->on_console_message(message);

    session::LaunchRequest request;
    request.engine = browser_driver::EngineKind::Firefox;
    request.remote_debug_url = std::string("ws://127.0.0.1:9222/devtools/browser/x");
    session::SessionResult result = manager.launch_or_connect(request);

    return expect(!result.success && result.error_kind == session::SessionErrorKind::Validation &&
                      result.message == "CDP connection only works with chromium" &&
                      manager.state() == session::SessionState::Active && world.launch_count == 1 &&
                      world.connect_count == 0 && world.browser_close_count == 0 &&
                      event_capture.console_snapshot().size() == 1,
                  "cdpEndpoint with firefox is a validation error and the active session is untouched");
}

static bool test_validation_rules() {
    session::LaunchRequest both;
    both.remote_debug_url = std::string("http://127.0.0.1:9222");
    both.debug_port = 9333;

    session::LaunchRequest port_on_webkit;
    port_on_webkit.engine = browser_driver::EngineKind::Webkit;
    port_on_webkit.debug_port = 9333;

    session::LaunchRequest bad_port;
    bad_port.debug_port = 70000;

    session::LaunchRequest bad_viewport;
    bad_viewport.viewport = browser_driver::Viewport{0, 600};

    session::LaunchRequest fine;
    fine.debug_port = 9333;
    fine.viewport = browser_driver::Viewport{1280, 720};

    return expect(session::validate_launch_request(both) == "debugPort and cdpEndpoint are mutually exclusive" &&
                      session::validate_launch_request(port_on_webkit) == "debugPort only works with chromium" &&
                      session::validate_launch_request(bad_port) == "debugPort must be between 1 and 65535" &&
                      session::validate_launch_request(bad_viewport) ==
                          "viewport width and height must be positive" &&
                      session::validate_launch_request(fine).empty(),
                  "Launch argument combinations are validated");
}

static bool test_relaunch_replaces_session() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    manager.launch_or_connect(session::LaunchRequest());
    browser_driver::ConsoleMessage message;
    message.type = "error";
    message.text = "old session";
    world.sink->on_console_message(message);
    browser_driver::RequestInfo request;
    request.url = "https://old.test/pending";
    request.method = "GET";
    world.sink->on_request_started(request);

    session::LaunchRequest second_request;
    second_request.headless = true;
    session::SessionResult relaunched = manager.launch_or_connect(second_request);

    capture::LogQueryResult logs = event_capture.query(capture::LogQuery());

    return expect(relaunched.success && relaunched.message == "Launched chromium (headless: true)" &&
                      world.launch_count == 2 && world.browser_close_count == 1 && world.page_create_count == 2 &&
                      logs.console->total == 0 && logs.network->total == 0 &&
                      event_capture.pending_correlation_count() == 0 && world.sink == &event_capture,
                  "Re-launching replaces the session with empty buffers and no pending correlations");
}

static bool test_failed_launch_leaves_absent() {
    fake_browser::FakeWorld world;
    world.launch_fails = true;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::SessionResult result = manager.launch_or_connect(session::LaunchRequest());
    return expect(!result.success && result.error_kind == session::SessionErrorKind::Lifecycle &&
                      result.message == "Failed to launch browser: no browser executable found" &&
                      manager.state() == session::SessionState::Absent,
                  "A failed launch reports a lifecycle error and leaves the manager Absent");
}

static bool test_failed_page_open_releases_browser() {
    fake_browser::FakeWorld world;
    world.page_create_fails = true;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::SessionResult result = manager.launch_or_connect(session::LaunchRequest());
    return expect(!result.success && manager.state() == session::SessionState::Absent &&
                      world.context_close_count == 1 && world.browser_close_count == 1,
                  "A launch that cannot open a page releases the context and browser");
}

static bool test_teardown_continues_after_failures() {
    fake_browser::FakeWorld world;
    world.page_close_fails = true;
    world.context_close_fails = true;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    manager.launch_or_connect(session::LaunchRequest());
    session::CloseResult result = manager.close();

    return expect(result.was_active && result.failed_steps == 2 && world.page_close_count == 1 &&
                      world.context_close_count == 1 && world.browser_close_count == 1 &&
                      manager.state() == session::SessionState::Absent,
                  "Teardown still closes the browser after page and context close fail");
}

static bool test_ensure_active_launches_default() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::PageAccess access = manager.ensure_active();
    return expect(access.success && access.page != nullptr && world.launch_count == 1 &&
                      world.last_launch_options.engine == browser_driver::EngineKind::Chromium &&
                      !world.last_launch_options.headless && world.sink == &event_capture,
                  "ensure_active() with no session launches a headed chromium with capture installed");
}

static bool test_ensure_active_replaces_closed_page() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    manager.ensure_active();
    world.page_closed = true; // closed by the user, behind our back
    world.sink = nullptr;

    session::PageAccess access = manager.ensure_active();
    bool replaced = access.success && access.page_recreated && world.page_create_count == 2 &&
                    world.launch_count == 1;

    browser_driver::ConsoleMessage message;
    message.type = "log";
    message.text = "from the new page";
    bool sink_installed = world.sink == &event_capture;
    if (sink_installed) {
        world.sink->on_console_message(message);
    }

    return expect(replaced && sink_installed && event_capture.console_snapshot().size() == 1,
                  "A page closed externally is replaced and capture works on the new page");
}

static bool test_ensure_active_relaunches_disconnected_browser() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    manager.ensure_active();
    world.browser_connected = false;
    session::PageAccess access = manager.ensure_active();

    return expect(access.success && world.launch_count == 2 && world.browser_close_count == 1,
                  "A disconnected browser is released and a new session is started");
}

static bool test_attach_uses_existing_context() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::LaunchRequest request;
    request.remote_debug_url = std::string("http://127.0.0.1:9222");
    session::SessionResult result = manager.launch_or_connect(request);

    return expect(result.success && result.message == "Connected to browser via CDP at http://127.0.0.1:9222" &&
                      world.connect_count == 1 && world.launch_count == 0 && world.context_create_count == 0 &&
                      world.last_endpoint == "http://127.0.0.1:9222" &&
                      manager.connection_mode() == session::ConnectionMode::Attached,
                  "Attaching over CDP reuses the first existing context");
}

static bool test_attach_creates_context_when_none() {
    fake_browser::FakeWorld world;
    world.has_existing_context = false;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::LaunchRequest request;
    request.remote_debug_url = std::string("ws://127.0.0.1:9222/devtools/browser/abc");
    request.viewport = browser_driver::Viewport{800, 600};
    session::SessionResult result = manager.launch_or_connect(request);

    return expect(result.success && world.context_create_count == 1 &&
                      world.last_context_options.viewport.has_value() &&
                      world.last_context_options.viewport->width == 800,
                  "Attaching creates a context when the browser has none");
}

static bool test_launch_passes_options() {
    fake_browser::FakeWorld world;
    fake_browser::FakeLauncher launcher(world);
    capture::EventCapture event_capture(10, 10);
    session::SessionManager manager(launcher, event_capture);

    session::LaunchRequest request;
    request.debug_port = 9333;
    request.viewport = browser_driver::Viewport{1024, 768};
    request.window_position = browser_driver::WindowPosition{10, 20};
    session::SessionResult result = manager.launch_or_connect(request);

    return expect(result.success && result.message == "Launched chromium (headless: false)" &&
                      world.last_launch_options.debug_port.value_or(0) == 9333 &&
                      world.last_launch_options.window_position.has_value() &&
                      world.last_launch_options.window_position->y == 20 &&
                      world.last_context_options.viewport.has_value() &&
                      world.last_context_options.viewport->height == 768 &&
                      manager.connection_mode() == session::ConnectionMode::Launched,
                  "Launch forwards debug port, window position and viewport");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_close_is_idempotent();
    all_passed &= test_close_after_launch_then_again();
    all_passed &= test_cdp_with_firefox_is_rejected();
    all_passed &= test_validation_rules();
    all_passed &= test_relaunch_replaces_session();
    all_passed &= test_failed_launch_leaves_absent();
    all_passed &= test_failed_page_open_releases_browser();
    all_passed &= test_teardown_continues_after_failures();
    all_passed &= test_ensure_active_launches_default();
    all_passed &= test_ensure_active_replaces_closed_page();
    all_passed &= test_ensure_active_relaunches_disconnected_browser();
    all_passed &= test_attach_uses_existing_context();
    all_passed &= test_attach_creates_context_when_none();
    all_passed &= test_launch_passes_options();
    return all_passed;
}

} // namespace test_session_manager
