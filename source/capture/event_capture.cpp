#include "capture/event_capture.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <regex>
#include <utility>

namespace capture {

int64_t now_epoch_milliseconds() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

EventCapture::EventCapture(size_t console_capacity, size_t network_capacity)
    : console_entries_(console_capacity), network_events_(network_capacity) {
}

std::string EventCapture::correlation_key(const std::string &url, const std::string &method) {
    return method + " " + url;
}

void EventCapture::set_console_updated_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    console_updated_callback_ = std::move(callback);
}

void EventCapture::on_console_message(const browser_driver::ConsoleMessage &message) {
    ConsoleEntry entry;
    entry.timestamp_ms = now_epoch_milliseconds();
    entry.type = message.type;
    entry.text = message.text;
    {
        std::lock_guard<std::mutex> lock(console_mutex_);
        console_entries_.push(std::move(entry));
    }

    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = console_updated_callback_;
    }
    if (callback) {
        callback();
    }
}

std::string EventCapture::next_correlation_id() {
    return "req-" + std::to_string(next_exchange_number_++);
}

void EventCapture::on_request_started(const browser_driver::RequestInfo &request) {
    std::lock_guard<std::mutex> lock(network_mutex_);

    PendingExchange pending;
    pending.id = next_correlation_id();
    pending.started_at = std::chrono::steady_clock::now();

    NetworkEvent event;
    event.id = pending.id;
    event.timestamp_ms = now_epoch_milliseconds();
    event.phase = NetworkPhase::Request;
    event.url = request.url;
    event.method = request.method;
    event.resource_type = request.resource_type;

    // A second in-flight exchange with the same key replaces the first one.
    pending_exchanges_[correlation_key(request.url, request.method)] = std::move(pending);
    network_events_.push(std::move(event));
}

void EventCapture::complete_exchange_locked(NetworkEvent &event) {
    auto pending_iterator = pending_exchanges_.find(correlation_key(event.url, event.method));
    if (pending_iterator != pending_exchanges_.end()) {
        auto elapsed = std::chrono::steady_clock::now() - pending_iterator->second.started_at;
        int64_t elapsed_ms = static_cast<int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
        event.duration_ms = std::max<int64_t>(0, elapsed_ms);
        event.id = pending_iterator->second.id;
        pending_exchanges_.erase(pending_iterator);
    } else {
        event.id = next_correlation_id();
        debug_log::log("network: no pending request for " + event.method + " " + event.url);
    }
}

void EventCapture::on_response_received(const browser_driver::ResponseInfo &response) {
    NetworkEvent event;
    event.timestamp_ms = now_epoch_milliseconds();
    event.phase = NetworkPhase::Response;
    event.url = response.request.url;
    event.method = response.request.method;
    event.resource_type = response.request.resource_type;
    event.status = response.status;
    event.status_text = response.status_text;

    std::lock_guard<std::mutex> lock(network_mutex_);
    complete_exchange_locked(event);
    network_events_.push(std::move(event));
}

void EventCapture::on_request_failed(const browser_driver::RequestFailure &failure) {
    NetworkEvent event;
    event.timestamp_ms = now_epoch_milliseconds();
    event.phase = NetworkPhase::Failed;
    event.url = failure.request.url;
    event.method = failure.request.method;
    event.resource_type = failure.request.resource_type;
    event.error_text = failure.error_text;

    std::lock_guard<std::mutex> lock(network_mutex_);
    complete_exchange_locked(event);
    network_events_.push(std::move(event));
}

LogQueryResult EventCapture::query(const LogQuery &query) {
    LogQueryResult result;

    std::regex url_regex;
    const std::regex *url_regex_pointer = nullptr;
    if (query.include_network && query.network_filter.url_pattern.has_value()) {
        if (!compile_url_pattern(*query.network_filter.url_pattern, url_regex, result.error_detail)) {
            result.success = false;
            return result;
        }
        url_regex_pointer = &url_regex;
    }

    if (query.include_console) {
        std::lock_guard<std::mutex> lock(console_mutex_);
        result.console = select_console_entries(console_entries_.snapshot(), query.console_filter, query.limit);
        if (query.clear) {
            console_entries_.clear();
        }
    }

    if (query.include_network) {
        std::lock_guard<std::mutex> lock(network_mutex_);
        result.network = select_network_events(network_events_.snapshot(), query.network_filter,
                                               url_regex_pointer, query.limit);
        if (query.clear) {
            network_events_.clear();
            pending_exchanges_.clear();
        }
    }

    result.cleared = query.clear;
    result.success = true;
    return result;
}

std::vector<ConsoleEntry> EventCapture::console_snapshot() const {
    std::lock_guard<std::mutex> lock(console_mutex_);
    return console_entries_.snapshot();
}

std::vector<NetworkEvent> EventCapture::network_snapshot() const {
    std::lock_guard<std::mutex> lock(network_mutex_);
    return network_events_.snapshot();
}

void EventCapture::clear_console() {
    std::lock_guard<std::mutex> lock(console_mutex_);
    console_entries_.clear();
}

void EventCapture::clear_network() {
    std::lock_guard<std::mutex> lock(network_mutex_);
    network_events_.clear();
    pending_exchanges_.clear();
}

void EventCapture::clear_all() {
    clear_console();
    clear_network();
}

size_t EventCapture::pending_correlation_count() const {
    std::lock_guard<std::mutex> lock(network_mutex_);
    return pending_exchanges_.size();
}

bool EventCapture::has_pending_correlation(const std::string &url, const std::string &method) const {
    std::lock_guard<std::mutex> lock(network_mutex_);
    return pending_exchanges_.count(correlation_key(url, method)) > 0;
}

} // namespace capture
