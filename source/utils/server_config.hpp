#ifndef WEBMCPS_SERVER_CONFIG_HPP
#define WEBMCPS_SERVER_CONFIG_HPP

// Server configuration, read once from the environment at startup.
// Every field has a default so the server runs without any variable set.

#include <cstddef>
#include <string>

namespace server_config {

struct ServerConfig {
    // Capacity of the console message ring buffer (WEBMCPS_CONSOLE_CAPACITY).
    size_t console_capacity = 500;
    // Capacity of the network event ring buffer (WEBMCPS_NETWORK_CAPACITY).
    size_t network_capacity = 1000;
    // Delay between typed characters for browser_fill (WEBMCPS_FILL_DELAY_MS).
    int fill_delay_milliseconds = 100;
    // Round-trip timeout for a single CDP command (WEBMCPS_COMMAND_TIMEOUT_MS).
    int command_timeout_milliseconds = 30000;
    // How long pending engine events are drained before a log query (WEBMCPS_EVENT_DRAIN_MS).
    int event_drain_milliseconds = 200;
    // Explicit browser executable; empty = search well-known locations (WEBMCPS_CHROME_PATH).
    std::string chrome_executable_path;
};

// Build a configuration from the process environment.
// Malformed or out-of-range values keep the default and emit a warning.
ServerConfig load_from_environment();

// Parse a strictly positive integer. Returns false for empty, malformed,
// trailing-garbage, zero, negative, or out-of-range input.
bool parse_positive_integer(const std::string &text, long long &output_value);

} // namespace server_config

#endif // WEBMCPS_SERVER_CONFIG_HPP
