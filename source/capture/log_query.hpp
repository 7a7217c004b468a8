#ifndef WEBMCPS_LOG_QUERY_HPP
#define WEBMCPS_LOG_QUERY_HPP

// Captured log records and the filter/pagination rules of browser_get_logs.
// Everything here is pure: it works on snapshots copied out of the buffers.

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace capture {

using json = nlohmann::json;

// One console message (text is engine-provided, never altered).
struct ConsoleEntry {
    int64_t timestamp_ms = 0;
    std::string type;
    std::string text;
};

enum class NetworkPhase {
    Request,  // request started
    Response, // response received
    Failed    // request failed
};

std::string network_phase_name(NetworkPhase phase);

struct NetworkEvent {
    std::string id; // correlation id shared by the events of one exchange
    int64_t timestamp_ms = 0;
    NetworkPhase phase = NetworkPhase::Request;
    std::string url;
    std::string method;
    std::string resource_type;
    std::optional<int> status;
    std::optional<std::string> status_text;
    std::optional<int64_t> duration_ms;
    std::optional<std::string> error_text;
};

struct StatusRange {
    int min = 0;
    int max = 0;
};

struct ConsoleFilter {
    std::vector<std::string> types;  // exact match; empty = any
    std::optional<std::string> search; // case-insensitive substring of text
};

struct NetworkFilter {
    std::vector<std::string> methods;        // case-insensitive; empty = any
    std::vector<int> status_codes;           // empty = any
    std::optional<StatusRange> status_range; // inclusive
    std::optional<std::string> url_pattern;  // ECMAScript regex, searched anywhere in the URL
    std::vector<std::string> resource_types; // case-insensitive; empty = any
    bool failed_only = false;
};

static constexpr size_t kDefaultLogLimit = 100;

struct LogQuery {
    bool include_console = true;
    bool include_network = true;
    ConsoleFilter console_filter;
    NetworkFilter network_filter;
    size_t limit = kDefaultLogLimit;
    bool clear = false;
};

template <typename T>
struct LogSection {
    size_t total = 0;    // unfiltered buffer size
    size_t filtered = 0; // entries passing the filter
    std::vector<T> entries; // newest first, at most limit
};

struct LogQueryResult {
    bool success = false;
    std::string error_detail;
    bool cleared = false;
    std::optional<LogSection<ConsoleEntry>> console;
    std::optional<LogSection<NetworkEvent>> network;
};

// Lower-case ASCII copy.
std::string to_lower_ascii(const std::string &text);

bool console_entry_matches(const ConsoleEntry &entry, const ConsoleFilter &filter);

// url_regex must be non-null iff filter.url_pattern is set.
bool network_event_matches(const NetworkEvent &event, const NetworkFilter &filter,
                           const std::regex *url_regex);

// Compile the URL pattern of a filter. Returns false (with error_detail) for an invalid pattern.
bool compile_url_pattern(const std::string &pattern, std::regex &output_regex, std::string &error_detail);

// Apply filter + limit to a snapshot in arrival order.
LogSection<ConsoleEntry> select_console_entries(const std::vector<ConsoleEntry> &arrival_order,
                                                const ConsoleFilter &filter, size_t limit);
LogSection<NetworkEvent> select_network_events(const std::vector<NetworkEvent> &arrival_order,
                                               const NetworkFilter &filter,
                                               const std::regex *url_regex, size_t limit);

// Parse the browser_get_logs arguments. Returns false with error_detail on invalid input.
bool parse_log_query(const json &arguments, LogQuery &output_query, std::string &error_detail);

json console_entry_to_json(const ConsoleEntry &entry);
json network_event_to_json(const NetworkEvent &event);
json log_query_result_to_json(const LogQueryResult &result);

} // namespace capture

#endif // WEBMCPS_LOG_QUERY_HPP
