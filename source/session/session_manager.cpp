#include "session/session_manager.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <functional>
#include <utility>

namespace session {

std::string validate_launch_request(const LaunchRequest &request) {
    bool is_chromium = (request.engine == browser_driver::EngineKind::Chromium);

    if (request.remote_debug_url.has_value()) {
        if (!is_chromium) {
            return "CDP connection only works with chromium";
        }
        if (request.remote_debug_url->empty()) {
            return "cdpEndpoint must not be empty";
        }
    }
    if (request.debug_port.has_value()) {
        if (request.remote_debug_url.has_value()) {
            return "debugPort and cdpEndpoint are mutually exclusive";
        }
        if (!is_chromium) {
            return "debugPort only works with chromium";
        }
        if (*request.debug_port < 1 || *request.debug_port > 65535) {
            return "debugPort must be between 1 and 65535";
        }
    }
    if (request.viewport.has_value() && (request.viewport->width <= 0 || request.viewport->height <= 0)) {
        return "viewport width and height must be positive";
    }
    return "";
}

namespace {

// Run one teardown step; any failure is logged and counted, never propagated.
void run_teardown_step(const std::string &step_name, const std::function<browser_driver::DriverResult()> &step,
                       int &failed_steps) {
    try {
        browser_driver::DriverResult result = step();
        if (!result.success) {
            ++failed_steps;
            debug_log::warn("close: " + step_name + " failed: " + result.error_detail);
        }
    } catch (const std::exception &error) {
        ++failed_steps;
        debug_log::warn("close: " + step_name + " threw: " + std::string(error.what()));
    }
}

SessionResult lifecycle_error(const std::string &detail) {
    SessionResult result;
    result.success = false;
    result.error_kind = SessionErrorKind::Lifecycle;
    result.message = "Failed to launch browser: " + detail;
    result.error_detail = detail;
    return result;
}

} // namespace

SessionManager::SessionManager(browser_driver::BrowserLauncher &launcher, capture::EventCapture &capture)
    : launcher_(launcher), capture_(capture) {
}

SessionManager::~SessionManager() {
    close();
}

SessionState SessionManager::state() const {
    return browser_ ? SessionState::Active : SessionState::Absent;
}

SessionResult SessionManager::launch_or_connect(const LaunchRequest &request) {
    std::string validation_error = validate_launch_request(request);
    if (!validation_error.empty()) {
        SessionResult result;
        result.success = false;
        result.error_kind = SessionErrorKind::Validation;
        result.message = validation_error;
        result.error_detail = validation_error;
        return result;
    }

    close();

    if (request.remote_debug_url.has_value()) {
        return attach(request);
    }
    return launch(request);
}

SessionResult SessionManager::attach(const LaunchRequest &request) {
    const std::string &endpoint = *request.remote_debug_url;
    debug_log::log("session: connecting over CDP to " + endpoint);

    browser_driver::BrowserLaunchResult connect_result = launcher_.connect_over_cdp(endpoint);
    if (!connect_result.success || !connect_result.browser) {
        return lifecycle_error(connect_result.error_detail);
    }
    browser_ = std::move(connect_result.browser);
    engine_ = browser_driver::EngineKind::Chromium;
    connection_mode_ = ConnectionMode::Attached;

    context_ = browser_->first_existing_context();
    if (!context_) {
        browser_driver::ContextOptions context_options;
        context_options.viewport = request.viewport;
        browser_driver::ContextCreateResult context_result = browser_->new_context(context_options);
        if (!context_result.success || !context_result.context) {
            abandon_partial_session();
            return lifecycle_error("could not create a browser context: " + context_result.error_detail);
        }
        context_ = std::move(context_result.context);
    }

    std::string page_error;
    if (!open_page(page_error)) {
        abandon_partial_session();
        return lifecycle_error(page_error);
    }

    SessionResult result;
    result.success = true;
    result.message = "Connected to browser via CDP at " + endpoint;
    return result;
}

SessionResult SessionManager::launch(const LaunchRequest &request) {
    browser_driver::LaunchOptions launch_options;
    launch_options.engine = request.engine;
    launch_options.headless = request.headless;
    launch_options.debug_port = request.debug_port;
    if (!request.headless) {
        launch_options.window_position = request.window_position;
    }

    std::string engine_name = browser_driver::engine_kind_name(request.engine);
    debug_log::log("session: launching " + engine_name + (request.headless ? " (headless)" : ""));

    browser_driver::BrowserLaunchResult launch_result = launcher_.launch(launch_options);
    if (!launch_result.success || !launch_result.browser) {
        return lifecycle_error(launch_result.error_detail);
    }
    browser_ = std::move(launch_result.browser);
    engine_ = request.engine;
    connection_mode_ = ConnectionMode::Launched;

    browser_driver::ContextOptions context_options;
    context_options.viewport = request.viewport;
    browser_driver::ContextCreateResult context_result = browser_->new_context(context_options);
    if (!context_result.success || !context_result.context) {
        abandon_partial_session();
        return lifecycle_error("could not create a browser context: " + context_result.error_detail);
    }
    context_ = std::move(context_result.context);

    std::string page_error;
    if (!open_page(page_error)) {
        abandon_partial_session();
        return lifecycle_error(page_error);
    }

    SessionResult result;
    result.success = true;
    result.message = "Launched " + engine_name + " (headless: " + (request.headless ? "true" : "false") + ")";
    return result;
}

bool SessionManager::open_page(std::string &error_detail) {
    browser_driver::PageCreateResult page_result = context_->new_page();
    if (!page_result.success || !page_result.page) {
        error_detail = "could not open a page: " + page_result.error_detail;
        return false;
    }
    page_ = std::move(page_result.page);
    page_->set_event_sink(&capture_);
    return true;
}

void SessionManager::abandon_partial_session() {
    CloseResult close_result = close();
    debug_log::log("session: abandoned partial session (" + std::to_string(close_result.failed_steps) +
                   " teardown step(s) failed)");
}

CloseResult SessionManager::close() {
    CloseResult result;
    result.was_active = (browser_ != nullptr);

    if (page_) {
        page_->set_event_sink(nullptr);
        browser_driver::Page *page = page_.get();
        if (!page->is_closed()) {
            run_teardown_step("page close", [page]() { return page->close(); }, result.failed_steps);
        }
        page_.reset();
    }
    if (context_) {
        browser_driver::BrowserContext *context = context_.get();
        run_teardown_step("context close", [context]() { return context->close(); }, result.failed_steps);
        context_.reset();
    }
    if (browser_) {
        browser_driver::Browser *browser = browser_.get();
        run_teardown_step("browser close", [browser]() { return browser->close(); }, result.failed_steps);
        browser_.reset();
    }

    capture_.clear_all();

    if (result.was_active) {
        debug_log::log("session: closed (" + std::to_string(result.failed_steps) + " step(s) failed)");
    }
    return result;
}

PageAccess SessionManager::ensure_active() {
    PageAccess access;

    if (browser_ && !browser_->is_connected()) {
        debug_log::warn("session: browser disconnected, starting a new session.");
        close();
    }

    if (!browser_) {
        LaunchRequest default_request;
        default_request.engine = browser_driver::EngineKind::Chromium;
        default_request.headless = false;
        SessionResult launch_result = launch_or_connect(default_request);
        if (!launch_result.success) {
            access.success = false;
            access.error_detail = launch_result.error_detail;
            return access;
        }
    } else if (!page_ || page_->is_closed()) {
        debug_log::log("session: page was closed, opening a new one.");
        if (page_) {
            page_->set_event_sink(nullptr);
            page_.reset();
        }
        std::string page_error;
        if (!open_page(page_error)) {
            access.success = false;
            access.error_detail = page_error;
            return access;
        }
        access.page_recreated = true;
    }

    access.success = true;
    access.page = page_.get();
    return access;
}

} // namespace session
