#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace cdp_chrome_launch {

// Well-known Chrome executable paths on Linux.
static const std::vector<std::string> LINUX_CHROME_PATHS = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/usr/bin/chromium-browser",
    "/usr/bin/chromium",
    "/snap/bin/chromium",
};

// Grace period given to Chrome to exit after SIGTERM before SIGKILL.
static constexpr int kTerminateGraceMilliseconds = 3000;

std::string find_chrome_executable() {
    for (const auto &candidate : LINUX_CHROME_PATHS) {
        if (candidate.find('/') != std::string::npos) {
            if (std::filesystem::exists(candidate)) {
                return candidate;
            }
            continue;
        }
        // Bare name: search PATH.
        const char *path_environment = std::getenv("PATH");
        if (path_environment == nullptr) {
            continue;
        }
        std::istringstream path_stream(path_environment);
        std::string directory;
        while (std::getline(path_stream, directory, ':')) {
            std::string full_path = directory + "/" + candidate;
            if (std::filesystem::exists(full_path)) {
                return full_path;
            }
        }
    }
    return "";
}

ChromeCommandLine build_chrome_command_line(const std::string &executable_path,
                                            const std::string &user_data_directory,
                                            const browser_driver::LaunchOptions &options,
                                            bool running_as_root) {
    ChromeCommandLine command_line;
    command_line.executable_path = executable_path;

    int port = options.debug_port.has_value() ? *options.debug_port : 0;
    command_line.arguments = {
        "--remote-debugging-port=" + std::to_string(port),
        "--remote-allow-origins=*",
        "--user-data-dir=" + user_data_directory,
    };
    if (options.headless) {
        command_line.arguments.push_back("--headless=new");
    } else if (options.window_position.has_value()) {
        command_line.arguments.push_back("--window-position=" + std::to_string(options.window_position->x) +
                                         "," + std::to_string(options.window_position->y));
    }
    if (running_as_root) {
        command_line.arguments.push_back("--no-sandbox");
    }
    std::vector<std::string> rest = {
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-client-side-phishing-detection",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-hang-monitor",
        "--disable-popup-blocking",
        "--disable-prompt-on-repost",
        "--disable-sync",
        "--disable-translate",
        "--metrics-recording-only",
        "--safebrowsing-disable-auto-update",
        "about:blank",
    };
    command_line.arguments.insert(command_line.arguments.end(), rest.begin(), rest.end());
    return command_line;
}

bool parse_devtools_active_port(const std::string &contents, int &output_port, std::string &output_browser_path) {
    std::istringstream line_stream(contents);
    std::string first_line;
    std::string second_line;
    if (!std::getline(line_stream, first_line) || first_line.empty()) {
        return false;
    }
    std::getline(line_stream, second_line);

    int port = 0;
    try {
        port = std::stoi(first_line);
    } catch (const std::exception &) {
        return false;
    }
    if (port <= 0 || port > 65535) {
        return false;
    }

    // Normalise to exactly one leading slash (Chrome may write with or without).
    while (!second_line.empty() && (second_line.back() == '\r' || second_line.back() == ' ')) {
        second_line.pop_back();
    }
    while (!second_line.empty() && second_line[0] == '/') {
        second_line.erase(0, 1);
    }

    output_port = port;
    output_browser_path = second_line.empty() ? "" : "/" + second_line;
    return true;
}

std::string build_websocket_url(int port, const std::string &browser_path) {
    if (browser_path.empty()) {
        return "ws://127.0.0.1:" + std::to_string(port) + "/devtools/browser";
    }
    std::string path = browser_path;
    while (!path.empty() && path[0] == '/') {
        path.erase(0, 1);
    }
    if (path.empty()) {
        return "ws://127.0.0.1:" + std::to_string(port) + "/devtools/browser";
    }
    return "ws://127.0.0.1:" + std::to_string(port) + "/" + path;
}

namespace {

std::string next_profile_directory() {
    static std::atomic<int> launch_counter{0};
    int launch_number = ++launch_counter;
    return "/tmp/webmcps_chrome_profile_" + std::to_string(getpid()) + "_" + std::to_string(launch_number);
}

void abandon_launch(ChromeLaunchResult &result) {
    platform::terminate_process(result.process_id, kTerminateGraceMilliseconds);
    std::error_code remove_error;
    std::filesystem::remove_all(result.user_data_directory, remove_error);
    result.process_id = -1;
}

} // namespace

ChromeLaunchResult launch_chrome(const browser_driver::LaunchOptions &options,
                                 const std::string &executable_override) {
    ChromeLaunchResult result;

    debug_log::log("Chrome launch starting...");

    std::string executable_path = executable_override.empty() ? find_chrome_executable() : executable_override;
    if (executable_path.empty()) {
        result.error_message = "Could not find Chrome executable on this system. "
                               "Install google-chrome or chromium, ensure it is on PATH, "
                               "or set WEBMCPS_CHROME_PATH.";
        return result;
    }

    std::string profile_directory = next_profile_directory();
    std::error_code create_error;
    std::filesystem::create_directories(profile_directory, create_error);
    if (create_error) {
        result.error_message = "Could not create profile directory " + profile_directory + ": " +
                               create_error.message();
        return result;
    }
    result.user_data_directory = profile_directory;

    ChromeCommandLine command_line =
        build_chrome_command_line(executable_path, profile_directory, options, platform::is_running_as_root());

    platform::SpawnResult spawn_result = platform::spawn_process(command_line.executable_path,
                                                                 command_line.arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn Chrome (" + executable_path + "): " + spawn_result.error_message;
        std::error_code remove_error;
        std::filesystem::remove_all(profile_directory, remove_error);
        return result;
    }
    result.process_id = spawn_result.process_id;

    std::string active_port_file = profile_directory + "/DevToolsActivePort";
    if (!platform::wait_for_file(active_port_file, 15000)) {
        debug_log::log("launch_chrome: Timed out waiting for DevToolsActivePort, killing Chrome pid=" +
                       std::to_string(result.process_id));
        result.error_message = "Timed out waiting for DevToolsActivePort file at: " + active_port_file;
        abandon_launch(result);
        return result;
    }

    std::string file_contents;
    std::string browser_path;
    if (!platform::read_file_contents(active_port_file, file_contents) ||
        !parse_devtools_active_port(file_contents, result.debug_port, browser_path)) {
        debug_log::log("launch_chrome: Failed to parse DevToolsActivePort, killing Chrome pid=" +
                       std::to_string(result.process_id));
        result.error_message = "Failed to parse debug port from DevToolsActivePort file.";
        abandon_launch(result);
        return result;
    }

    result.websocket_debugger_url = build_websocket_url(result.debug_port, browser_path);
    debug_log::log("DevToolsActivePort read, port=" + std::to_string(result.debug_port) +
                   ", WebSocket URL: " + result.websocket_debugger_url);

    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    result.success = true;
    debug_log::warn("Chrome launched (pid=" + std::to_string(result.process_id) +
                    ", port=" + std::to_string(result.debug_port) + ")");
    return result;
}

} // namespace cdp_chrome_launch
