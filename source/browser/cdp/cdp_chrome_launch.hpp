#ifndef WEBMCPS_CDP_CHROME_LAUNCH_HPP
#define WEBMCPS_CDP_CHROME_LAUNCH_HPP

// Chrome browser launch and port discovery via DevToolsActivePort file.

#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"

namespace cdp_chrome_launch {

// Result of launching Chrome and discovering the debug port.
struct ChromeLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string websocket_debugger_url;
    std::string user_data_directory; // per-launch profile, removed by the caller on close
    std::string error_message;
};

// Launch Chrome with remote debugging. Uses options.debug_port when set,
// otherwise lets Chrome pick a free port (reported in DevToolsActivePort).
// executable_override, when non-empty, replaces the executable search.
ChromeLaunchResult launch_chrome(const browser_driver::LaunchOptions &options,
                                 const std::string &executable_override);

// Build the command-line arguments for launching Chrome.
struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};
ChromeCommandLine build_chrome_command_line(const std::string &executable_path,
                                            const std::string &user_data_directory,
                                            const browser_driver::LaunchOptions &options,
                                            bool running_as_root);

// Find the Chrome executable on the system (platform-specific search).
// Returns an empty string if none was found.
std::string find_chrome_executable();

// Parse the DevToolsActivePort file contents: the port on the first line and
// the browser WebSocket path on the second. Returns false when malformed.
bool parse_devtools_active_port(const std::string &contents, int &output_port, std::string &output_browser_path);

// Build the WebSocket debugger URL from the port and browser path.
std::string build_websocket_url(int port, const std::string &browser_path);

} // namespace cdp_chrome_launch

#endif // WEBMCPS_CDP_CHROME_LAUNCH_HPP
