// Tests for log filtering, pagination and browser_get_logs argument parsing.

#include "capture/log_query.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_log_query {

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static capture::ConsoleEntry console_entry(const std::string &type, const std::string &text) {
    capture::ConsoleEntry entry;
    entry.type = type;
    entry.text = text;
    return entry;
}

static capture::NetworkEvent network_event(capture::NetworkPhase phase, const std::string &method,
                                           const std::string &url, int status) {
    capture::NetworkEvent event;
    event.phase = phase;
    event.method = method;
    event.url = url;
    event.resource_type = "fetch";
    if (status > 0) {
        event.status = status;
    }
    return event;
}

static bool test_console_type_filter() {
    std::vector<capture::ConsoleEntry> entries = {
        console_entry("info", "a"), console_entry("error", "b"), console_entry("info", "c")};
    capture::ConsoleFilter filter;
    filter.types = {"error"};

    capture::LogSection<capture::ConsoleEntry> section = capture::select_console_entries(entries, filter, 100);
    return expect(section.total == 3 && section.filtered == 1 && section.entries.size() == 1 &&
                      section.entries[0].text == "b",
                  "types filter [error] selects exactly the 'b' entry");
}

static bool test_console_search_ignores_case() {
    capture::ConsoleFilter filter;
    filter.search = std::string("TIMEOUT");
    bool matches = capture::console_entry_matches(console_entry("warning", "Request timeout after 3s"), filter);
    bool rejects = !capture::console_entry_matches(console_entry("warning", "all good"), filter);
    return expect(matches && rejects, "search is a case-insensitive substring match");
}

static bool test_newest_first_with_limit() {
    std::vector<capture::ConsoleEntry> entries;
    for (int index = 0; index < 5; ++index) {
        entries.push_back(console_entry("log", "m" + std::to_string(index)));
    }
    capture::LogSection<capture::ConsoleEntry> section =
        capture::select_console_entries(entries, capture::ConsoleFilter(), 2);
    return expect(section.filtered == 5 && section.entries.size() == 2 && section.entries[0].text == "m4" &&
                      section.entries[1].text == "m3",
                  "limit keeps the newest entries, newest first");
}

static bool test_network_filters_compose() {
    std::vector<capture::NetworkEvent> events = {
        network_event(capture::NetworkPhase::Request, "GET", "https://api.test/users", 0),
        network_event(capture::NetworkPhase::Response, "GET", "https://api.test/users", 200),
        network_event(capture::NetworkPhase::Response, "POST", "https://api.test/users", 500),
        network_event(capture::NetworkPhase::Response, "GET", "https://cdn.test/app.js", 404),
        network_event(capture::NetworkPhase::Failed, "GET", "https://api.test/broken", 0),
    };

    capture::NetworkFilter filter;
    filter.methods = {"get"};
    filter.url_pattern = std::string("api\\.test");
    filter.status_range = capture::StatusRange{200, 299};

    std::regex url_regex;
    std::string error_detail;
    bool compiled = capture::compile_url_pattern(*filter.url_pattern, url_regex, error_detail);
    capture::LogSection<capture::NetworkEvent> section =
        capture::select_network_events(events, filter, &url_regex, 100);

    bool range_and_method = compiled && section.filtered == 1 && section.entries[0].status == 200;

    capture::NetworkFilter failed_filter;
    failed_filter.failed_only = true;
    failed_filter.methods = {"GET"};
    capture::LogSection<capture::NetworkEvent> failed_section =
        capture::select_network_events(events, failed_filter, nullptr, 100);
    bool failed_only = failed_section.filtered == 1 &&
                       failed_section.entries[0].url == "https://api.test/broken";

    capture::NetworkFilter codes_filter;
    codes_filter.status_codes = {404, 500};
    codes_filter.resource_types = {"FETCH"};
    capture::LogSection<capture::NetworkEvent> codes_section =
        capture::select_network_events(events, codes_filter, nullptr, 100);
    bool codes = codes_section.filtered == 2;

    return expect(range_and_method && failed_only && codes,
                  "methods, urlPattern, statusRange, statusCodes and failedOnly combine with AND");
}

static bool test_parse_defaults() {
    capture::LogQuery query;
    std::string error_detail;
    bool parsed = capture::parse_log_query(json::object(), query, error_detail);
    return expect(parsed && query.include_console && query.include_network && !query.clear &&
                      query.limit == capture::kDefaultLogLimit,
                  "Empty arguments select both kinds, no clear, default limit");
}

static bool test_parse_full_arguments() {
    json arguments = {
        {"logTypes", {"network"}},
        {"clear", true},
        {"limit", 5},
        {"filter", {
            {"methods", {"POST"}},
            {"statusRange", {{"min", 400}, {"max", 599}}},
            {"urlPattern", "/api/"},
            {"failedOnly", false}
        }}
    };
    capture::LogQuery query;
    std::string error_detail;
    bool parsed = capture::parse_log_query(arguments, query, error_detail);
    return expect(parsed && !query.include_console && query.include_network && query.clear && query.limit == 5 &&
                      query.network_filter.methods.size() == 1 && query.network_filter.status_range.has_value() &&
                      query.network_filter.status_range->min == 400 &&
                      query.network_filter.url_pattern.value_or("") == "/api/",
                  "All browser_get_logs arguments are parsed");
}

static bool test_parse_rejects_bad_input() {
    capture::LogQuery query;
    std::string bad_type_error;
    std::string bad_regex_error;
    std::string bad_limit_error;
    std::string bad_range_error;
    bool bad_type = !capture::parse_log_query(json{{"logTypes", {"dom"}}}, query, bad_type_error);
    bool bad_regex = !capture::parse_log_query(json{{"filter", {{"urlPattern", "(unclosed"}}}}, query,
                                               bad_regex_error);
    bool bad_limit = !capture::parse_log_query(json{{"limit", 0}}, query, bad_limit_error);
    bool bad_range = !capture::parse_log_query(json{{"filter", {{"statusRange", {{"min", 500}, {"max", 400}}}}}},
                                               query, bad_range_error);
    return expect(bad_type && bad_regex && bad_limit && bad_range &&
                      bad_regex_error.find("Invalid urlPattern") == 0,
                  "Unknown log type, invalid regex, zero limit and inverted range are rejected");
}

static bool test_result_document_shape() {
    capture::LogQueryResult result;
    result.success = true;
    capture::LogSection<capture::NetworkEvent> section;
    section.total = 3;
    section.filtered = 1;
    capture::NetworkEvent event = network_event(capture::NetworkPhase::Failed, "GET", "https://x.test/", 0);
    event.id = "req-7";
    event.duration_ms = 12;
    event.error_text = std::string("net::ERR_FAILED");
    section.entries.push_back(event);
    result.network = section;

    json document = capture::log_query_result_to_json(result);
    const json &entry = document["network"]["entries"][0];
    return expect(!document.contains("console") && document["network"]["total"] == 3 &&
                      document["network"]["filtered"] == 1 && entry["phase"] == "failed" &&
                      entry["durationMs"] == 12 && entry["errorText"] == "net::ERR_FAILED" &&
                      !entry.contains("status"),
                  "Result document has one section per selected kind with optional fields omitted");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_console_type_filter();
    all_passed &= test_console_search_ignores_case();
    all_passed &= test_newest_first_with_limit();
    all_passed &= test_network_filters_compose();
    all_passed &= test_parse_defaults();
    all_passed &= test_parse_full_arguments();
    all_passed &= test_parse_rejects_bad_input();
    all_passed &= test_result_document_shape();
    return all_passed;
}

} // namespace test_log_query
