#include "utils/server_config.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <climits>
#include <stdexcept>

namespace server_config {

bool parse_positive_integer(const std::string &text, long long &output_value) {
    if (text.empty()) {
        return false;
    }
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(text, &consumed);
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
    if (consumed != text.size() || parsed <= 0) {
        return false;
    }
    output_value = parsed;
    return true;
}

static void read_size(const char *variable_name, size_t &target) {
    const char *value = std::getenv(variable_name);
    if (value == nullptr || value[0] == '\0') {
        return;
    }
    long long parsed = 0;
    if (!parse_positive_integer(value, parsed)) {
        debug_log::warn(std::string("Ignoring invalid ") + variable_name + "='" + value +
                        "', using default " + std::to_string(target) + ".");
        return;
    }
    target = static_cast<size_t>(parsed);
}

static void read_milliseconds(const char *variable_name, int &target) {
    const char *value = std::getenv(variable_name);
    if (value == nullptr || value[0] == '\0') {
        return;
    }
    long long parsed = 0;
    if (!parse_positive_integer(value, parsed) || parsed > INT_MAX) {
        debug_log::warn(std::string("Ignoring invalid ") + variable_name + "='" + value +
                        "', using default " + std::to_string(target) + " ms.");
        return;
    }
    target = static_cast<int>(parsed);
}

ServerConfig load_from_environment() {
    ServerConfig config;
    read_size("WEBMCPS_CONSOLE_CAPACITY", config.console_capacity);
    read_size("WEBMCPS_NETWORK_CAPACITY", config.network_capacity);
    read_milliseconds("WEBMCPS_FILL_DELAY_MS", config.fill_delay_milliseconds);
    read_milliseconds("WEBMCPS_COMMAND_TIMEOUT_MS", config.command_timeout_milliseconds);
    read_milliseconds("WEBMCPS_EVENT_DRAIN_MS", config.event_drain_milliseconds);

    const char *chrome_path = std::getenv("WEBMCPS_CHROME_PATH");
    if (chrome_path != nullptr) {
        config.chrome_executable_path = chrome_path;
    }

    debug_log::log("config: console_capacity=" + std::to_string(config.console_capacity) +
                   " network_capacity=" + std::to_string(config.network_capacity) +
                   " fill_delay_ms=" + std::to_string(config.fill_delay_milliseconds) +
                   " command_timeout_ms=" + std::to_string(config.command_timeout_milliseconds));
    return config;
}

} // namespace server_config
