#include "capture/log_query.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace capture {

std::string network_phase_name(NetworkPhase phase) {
    switch (phase) {
    case NetworkPhase::Request:
        return "request";
    case NetworkPhase::Response:
        return "response";
    case NetworkPhase::Failed:
        return "failed";
    }
    return "request";
}

std::string to_lower_ascii(const std::string &text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

namespace {

bool contains_exact(const std::vector<std::string> &allowed, const std::string &value) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

bool contains_ignoring_case(const std::vector<std::string> &allowed, const std::string &value) {
    std::string lowered = to_lower_ascii(value);
    for (const auto &candidate : allowed) {
        if (to_lower_ascii(candidate) == lowered) {
            return true;
        }
    }
    return false;
}

// Newest `limit` of the filtered entries, newest first.
template <typename T>
std::vector<T> newest_first(const std::vector<T> &filtered, size_t limit) {
    size_t take = std::min(filtered.size(), limit);
    std::vector<T> tail(filtered.end() - static_cast<std::ptrdiff_t>(take), filtered.end());
    std::reverse(tail.begin(), tail.end());
    return tail;
}

bool read_string_array(const json &object, const char *key, std::vector<std::string> &output,
                       std::string &error_detail) {
    if (!object.contains(key)) {
        return true;
    }
    const json &value = object[key];
    if (!value.is_array()) {
        error_detail = std::string("filter.") + key + " must be an array of strings.";
        return false;
    }
    for (const auto &item : value) {
        if (!item.is_string()) {
            error_detail = std::string("filter.") + key + " must be an array of strings.";
            return false;
        }
        output.push_back(item.get<std::string>());
    }
    return true;
}

} // namespace

bool console_entry_matches(const ConsoleEntry &entry, const ConsoleFilter &filter) {
    if (!filter.types.empty() && !contains_exact(filter.types, entry.type)) {
        return false;
    }
    if (filter.search.has_value() && !filter.search->empty()) {
        std::string haystack = to_lower_ascii(entry.text);
        std::string needle = to_lower_ascii(*filter.search);
        if (haystack.find(needle) == std::string::npos) {
            return false;
        }
    }
    return true;
}

bool network_event_matches(const NetworkEvent &event, const NetworkFilter &filter,
                           const std::regex *url_regex) {
    if (!filter.methods.empty() && !contains_ignoring_case(filter.methods, event.method)) {
        return false;
    }
    if (!filter.status_codes.empty()) {
        if (!event.status.has_value() ||
            std::find(filter.status_codes.begin(), filter.status_codes.end(), *event.status) ==
                filter.status_codes.end()) {
            return false;
        }
    }
    if (filter.status_range.has_value()) {
        if (!event.status.has_value() || *event.status < filter.status_range->min ||
            *event.status > filter.status_range->max) {
            return false;
        }
    }
    if (url_regex != nullptr && !std::regex_search(event.url, *url_regex)) {
        return false;
    }
    if (!filter.resource_types.empty() && !contains_ignoring_case(filter.resource_types, event.resource_type)) {
        return false;
    }
    if (filter.failed_only && event.phase != NetworkPhase::Failed) {
        return false;
    }
    return true;
}

bool compile_url_pattern(const std::string &pattern, std::regex &output_regex, std::string &error_detail) {
    try {
        output_regex = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error &error) {
        error_detail = "Invalid urlPattern '" + pattern + "': " + error.what();
        return false;
    }
    return true;
}

LogSection<ConsoleEntry> select_console_entries(const std::vector<ConsoleEntry> &arrival_order,
                                                const ConsoleFilter &filter, size_t limit) {
    LogSection<ConsoleEntry> section;
    section.total = arrival_order.size();
    std::vector<ConsoleEntry> filtered;
    for (const auto &entry : arrival_order) {
        if (console_entry_matches(entry, filter)) {
            filtered.push_back(entry);
        }
    }
    section.filtered = filtered.size();
    section.entries = newest_first(filtered, limit);
    return section;
}

LogSection<NetworkEvent> select_network_events(const std::vector<NetworkEvent> &arrival_order,
                                               const NetworkFilter &filter,
                                               const std::regex *url_regex, size_t limit) {
    LogSection<NetworkEvent> section;
    section.total = arrival_order.size();
    std::vector<NetworkEvent> filtered;
    for (const auto &event : arrival_order) {
        if (network_event_matches(event, filter, url_regex)) {
            filtered.push_back(event);
        }
    }
    section.filtered = filtered.size();
    section.entries = newest_first(filtered, limit);
    return section;
}

bool parse_log_query(const json &arguments, LogQuery &output_query, std::string &error_detail) {
    LogQuery query;

    if (arguments.contains("logTypes") && !arguments["logTypes"].is_null()) {
        const json &log_types = arguments["logTypes"];
        if (!log_types.is_array()) {
            error_detail = "logTypes must be an array containing \"console\" and/or \"network\".";
            return false;
        }
        if (!log_types.empty()) {
            query.include_console = false;
            query.include_network = false;
            for (const auto &item : log_types) {
                std::string name = item.is_string() ? item.get<std::string>() : item.dump();
                if (name == "console") {
                    query.include_console = true;
                } else if (name == "network") {
                    query.include_network = true;
                } else {
                    error_detail = "Unknown log type '" + name + "' (expected console or network).";
                    return false;
                }
            }
        }
    }

    if (arguments.contains("clear") && !arguments["clear"].is_null()) {
        if (!arguments["clear"].is_boolean()) {
            error_detail = "clear must be a boolean.";
            return false;
        }
        query.clear = arguments["clear"].get<bool>();
    }

    if (arguments.contains("limit") && !arguments["limit"].is_null()) {
        const json &limit = arguments["limit"];
        if (!limit.is_number_integer() || limit.get<long long>() < 1) {
            error_detail = "limit must be a positive integer.";
            return false;
        }
        query.limit = static_cast<size_t>(limit.get<long long>());
    }

    if (arguments.contains("filter") && !arguments["filter"].is_null()) {
        const json &filter = arguments["filter"];
        if (!filter.is_object()) {
            error_detail = "filter must be an object.";
            return false;
        }

        if (!read_string_array(filter, "types", query.console_filter.types, error_detail)) {
            return false;
        }
        if (filter.contains("search")) {
            if (!filter["search"].is_string()) {
                error_detail = "filter.search must be a string.";
                return false;
            }
            query.console_filter.search = filter["search"].get<std::string>();
        }

        if (!read_string_array(filter, "methods", query.network_filter.methods, error_detail)) {
            return false;
        }
        if (filter.contains("statusCodes")) {
            const json &codes = filter["statusCodes"];
            if (!codes.is_array()) {
                error_detail = "filter.statusCodes must be an array of integers.";
                return false;
            }
            for (const auto &code : codes) {
                if (!code.is_number_integer()) {
                    error_detail = "filter.statusCodes must be an array of integers.";
                    return false;
                }
                query.network_filter.status_codes.push_back(code.get<int>());
            }
        }
        if (filter.contains("statusRange")) {
            const json &range = filter["statusRange"];
            if (!range.is_object() || !range.contains("min") || !range.contains("max") ||
                !range["min"].is_number_integer() || !range["max"].is_number_integer()) {
                error_detail = "filter.statusRange must be an object with integer min and max.";
                return false;
            }
            StatusRange status_range;
            status_range.min = range["min"].get<int>();
            status_range.max = range["max"].get<int>();
            if (status_range.min > status_range.max) {
                error_detail = "filter.statusRange.min must not exceed max.";
                return false;
            }
            query.network_filter.status_range = status_range;
        }
        if (filter.contains("urlPattern")) {
            if (!filter["urlPattern"].is_string()) {
                error_detail = "filter.urlPattern must be a string.";
                return false;
            }
            std::string pattern = filter["urlPattern"].get<std::string>();
            std::regex compiled;
            if (!compile_url_pattern(pattern, compiled, error_detail)) {
                return false;
            }
            query.network_filter.url_pattern = pattern;
        }
        if (!read_string_array(filter, "resourceTypes", query.network_filter.resource_types, error_detail)) {
            return false;
        }
        if (filter.contains("failedOnly")) {
            if (!filter["failedOnly"].is_boolean()) {
                error_detail = "filter.failedOnly must be a boolean.";
                return false;
            }
            query.network_filter.failed_only = filter["failedOnly"].get<bool>();
        }
    }

    output_query = query;
    return true;
}

json console_entry_to_json(const ConsoleEntry &entry) {
    json item;
    item["timestamp"] = entry.timestamp_ms;
    item["type"] = entry.type;
    item["text"] = entry.text;
    return item;
}

json network_event_to_json(const NetworkEvent &event) {
    json item;
    item["id"] = event.id;
    item["timestamp"] = event.timestamp_ms;
    item["phase"] = network_phase_name(event.phase);
    item["url"] = event.url;
    item["method"] = event.method;
    item["resourceType"] = event.resource_type;
    if (event.status.has_value()) {
        item["status"] = *event.status;
    }
    if (event.status_text.has_value()) {
        item["statusText"] = *event.status_text;
    }
    if (event.duration_ms.has_value()) {
        item["durationMs"] = *event.duration_ms;
    }
    if (event.error_text.has_value()) {
        item["errorText"] = *event.error_text;
    }
    return item;
}

json log_query_result_to_json(const LogQueryResult &result) {
    json document = json::object();
    if (result.console.has_value()) {
        json section;
        section["total"] = result.console->total;
        section["filtered"] = result.console->filtered;
        section["returned"] = result.console->entries.size();
        section["entries"] = json::array();
        for (const auto &entry : result.console->entries) {
            section["entries"].push_back(console_entry_to_json(entry));
        }
        document["console"] = section;
    }
    if (result.network.has_value()) {
        json section;
        section["total"] = result.network->total;
        section["filtered"] = result.network->filtered;
        section["returned"] = result.network->entries.size();
        section["entries"] = json::array();
        for (const auto &event : result.network->entries) {
            section["entries"].push_back(network_event_to_json(event));
        }
        document["network"] = section;
    }
    if (result.cleared) {
        document["cleared"] = true;
    }
    return document;
}

} // namespace capture
