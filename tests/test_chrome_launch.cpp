// Tests for the Chrome launch command-line building logic.
// Verifies that the generated argv contains the expected flags and binary name,
// WITHOUT actually spawning a process.

#include "browser/cdp/cdp_chrome_launch.hpp"

#include <iostream>
#include <string>
#include <algorithm>
#include <vector>

namespace test_chrome_launch {

static bool check_argument_present(const std::vector<std::string> &arguments,
                                    const std::string &expected_prefix,
                                    const std::string &test_description) {
    bool found = false;
    for (const auto &argument : arguments) {
        if (argument.find(expected_prefix) == 0) {
            found = true;
            break;
        }
    }
    if (!found) {
        std::cout << "  FAIL: " << test_description << " (expected prefix '"
                  << expected_prefix << "' not found in arguments)" << std::endl;
    } else {
        std::cout << "  OK: " << test_description << std::endl;
    }
    return found;
}

static bool check_argument_absent(const std::vector<std::string> &arguments,
                                   const std::string &unexpected_prefix,
                                   const std::string &test_description) {
    for (const auto &argument : arguments) {
        if (argument.find(unexpected_prefix) == 0) {
            std::cout << "  FAIL: " << test_description << " (found '" << argument << "')" << std::endl;
            return false;
        }
    }
    std::cout << "  OK: " << test_description << std::endl;
    return true;
}

static cdp_chrome_launch::ChromeCommandLine default_command_line() {
    browser_driver::LaunchOptions options;
    return cdp_chrome_launch::build_chrome_command_line("/usr/bin/google-chrome", "/tmp/test_profile",
                                                        options, false);
}

// Test: without a fixed port Chrome is asked to pick one (port 0).
static bool test_command_line_uses_ephemeral_port() {
    auto command_line = default_command_line();
    return check_argument_present(command_line.arguments,
                                   "--remote-debugging-port=0",
                                   "Command line asks Chrome for a free debugging port");
}

static bool test_command_line_uses_fixed_port() {
    browser_driver::LaunchOptions options;
    options.debug_port = 9333;
    auto command_line = cdp_chrome_launch::build_chrome_command_line("/usr/bin/chromium", "/tmp/p", options, false);
    return check_argument_present(command_line.arguments,
                                   "--remote-debugging-port=9333",
                                   "Command line uses the requested debugging port");
}

// Test: Chrome command line contains --user-data-dir with the given path.
static bool test_command_line_has_user_data_directory() {
    browser_driver::LaunchOptions options;
    std::string test_directory = "/tmp/test_profile_xyz";
    auto command_line = cdp_chrome_launch::build_chrome_command_line("/usr/bin/chromium", test_directory,
                                                                     options, false);
    return check_argument_present(command_line.arguments,
                                   "--user-data-dir=" + test_directory,
                                   "Command line contains --user-data-dir with correct path");
}

static bool test_command_line_headless() {
    browser_driver::LaunchOptions options;
    options.headless = true;
    options.window_position = browser_driver::WindowPosition{100, 200};
    auto command_line = cdp_chrome_launch::build_chrome_command_line("/usr/bin/chromium", "/tmp/p", options, false);
    bool passed = check_argument_present(command_line.arguments, "--headless=new",
                                         "Headless launch adds --headless=new");
    passed &= check_argument_absent(command_line.arguments, "--window-position",
                                    "Headless launch ignores the window position");
    return passed;
}

static bool test_command_line_window_position() {
    browser_driver::LaunchOptions options;
    options.window_position = browser_driver::WindowPosition{100, 200};
    auto command_line = cdp_chrome_launch::build_chrome_command_line("/usr/bin/chromium", "/tmp/p", options, false);
    bool passed = check_argument_present(command_line.arguments, "--window-position=100,200",
                                         "Headed launch places the window");
    passed &= check_argument_absent(command_line.arguments, "--headless",
                                    "Headed launch has no --headless flag");
    return passed;
}

static bool test_command_line_root_sandbox() {
    browser_driver::LaunchOptions options;
    auto as_root = cdp_chrome_launch::build_chrome_command_line("/usr/bin/chromium", "/tmp/p", options, true);
    bool passed = check_argument_present(as_root.arguments, "--no-sandbox", "Running as root adds --no-sandbox");
    passed &= check_argument_absent(default_command_line().arguments, "--no-sandbox",
                                    "Running as a normal user keeps the sandbox");
    return passed;
}

// Test: Chrome command line contains --no-first-run and opens about:blank.
static bool test_command_line_has_no_first_run() {
    auto command_line = default_command_line();
    bool passed = check_argument_present(command_line.arguments,
                                          "--no-first-run",
                                          "Command line contains --no-first-run");
    bool ends_blank = !command_line.arguments.empty() && command_line.arguments.back() == "about:blank";
    if (ends_blank) {
        std::cout << "  OK: Command line opens about:blank" << std::endl;
    } else {
        std::cout << "  FAIL: Command line does not end with about:blank" << std::endl;
    }
    return passed && ends_blank && command_line.executable_path == "/usr/bin/google-chrome";
}

// Test: Chrome executable path is non-empty (Chrome must be installed for this).
static bool test_chrome_executable_found() {
    std::string executable = cdp_chrome_launch::find_chrome_executable();
    if (!executable.empty()) {
        std::cout << "  OK: Chrome executable found at: " << executable << std::endl;
    } else {
        std::cout << "  WARN: Chrome executable not found (not installed?). "
                  << "This test is informational only." << std::endl;
    }
    return true;
}

// Test: DevToolsActivePort parser with synthetic content.
static bool test_parse_devtools_active_port() {
    int parsed_port = 0;
    std::string browser_path;
    bool parsed = cdp_chrome_launch::parse_devtools_active_port("9333\n/devtools/browser/abc-123-def\n",
                                                                parsed_port, browser_path);
    bool success = parsed && parsed_port == 9333 && browser_path == "/devtools/browser/abc-123-def";

    if (success) {
        std::cout << "  OK: DevToolsActivePort parsed correctly (port=" << parsed_port << ")" << std::endl;
    } else {
        std::cout << "  FAIL: DevToolsActivePort parse returned " << parsed_port
                  << " path '" << browser_path << "'" << std::endl;
    }
    return success;
}

static bool test_parse_devtools_active_port_rejects_garbage() {
    int parsed_port = 0;
    std::string browser_path;
    bool rejected = !cdp_chrome_launch::parse_devtools_active_port("", parsed_port, browser_path) &&
                    !cdp_chrome_launch::parse_devtools_active_port("port\n/x\n", parsed_port, browser_path) &&
                    !cdp_chrome_launch::parse_devtools_active_port("70000\n/x\n", parsed_port, browser_path);
    if (rejected) {
        std::cout << "  OK: Malformed DevToolsActivePort contents are rejected" << std::endl;
    } else {
        std::cout << "  FAIL: Malformed DevToolsActivePort contents were accepted" << std::endl;
    }
    return rejected;
}

// Test: WebSocket URL building (path already with single leading slash).
static bool test_build_websocket_url() {
    std::string url = cdp_chrome_launch::build_websocket_url(9333, "/devtools/browser/abc-123");
    bool success = (url == "ws://127.0.0.1:9333/devtools/browser/abc-123");

    if (success) {
        std::cout << "  OK: WebSocket URL built correctly: " << url << std::endl;
    } else {
        std::cout << "  FAIL: WebSocket URL was: " << url << std::endl;
    }
    return success;
}

// Test: WebSocket URL when path has multiple leading slashes (normalized to single).
static bool test_build_websocket_url_path_with_leading_slash() {
    std::string url = cdp_chrome_launch::build_websocket_url(9333, "//devtools/browser/xyz");
    bool success = (url == "ws://127.0.0.1:9333/devtools/browser/xyz");
    if (success) {
        std::cout << "  OK: WebSocket URL with double slash path normalized to single: " << url << std::endl;
    } else {
        std::cout << "  FAIL: WebSocket URL with // path was: " << url << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_command_line_uses_ephemeral_port();
    all_passed &= test_command_line_uses_fixed_port();
    all_passed &= test_command_line_has_user_data_directory();
    all_passed &= test_command_line_headless();
    all_passed &= test_command_line_window_position();
    all_passed &= test_command_line_root_sandbox();
    all_passed &= test_command_line_has_no_first_run();
    all_passed &= test_chrome_executable_found();
    all_passed &= test_parse_devtools_active_port();
    all_passed &= test_parse_devtools_active_port_rejects_garbage();
    all_passed &= test_build_websocket_url();
    all_passed &= test_build_websocket_url_path_with_leading_slash();
    return all_passed;
}

} // namespace test_chrome_launch
