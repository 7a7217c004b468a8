#ifndef WEBMCPS_EVENT_CAPTURE_HPP
#define WEBMCPS_EVENT_CAPTURE_HPP

// Console and network capture for the active page.
// Installed as the page's event sink by the session manager. Each structure
// (console buffer, network buffer + pending correlations) has its own mutex,
// so engine callbacks may append while a query or clear is running.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "capture/log_query.hpp"
#include "capture/ring_buffer.hpp"

namespace capture {

class EventCapture : public browser_driver::PageEventSink {
public:
    EventCapture(size_t console_capacity, size_t network_capacity);

    // --- PageEventSink ---
    void on_console_message(const browser_driver::ConsoleMessage &message) override;
    void on_request_started(const browser_driver::RequestInfo &request) override;
    void on_response_received(const browser_driver::ResponseInfo &response) override;
    void on_request_failed(const browser_driver::RequestFailure &failure) override;

    // Called after every console append (outside the buffer lock).
    void set_console_updated_callback(std::function<void()> callback);

    // Run a query against the current buffers; clears afterwards when query.clear is set.
    LogQueryResult query(const LogQuery &query);

    std::vector<ConsoleEntry> console_snapshot() const;
    std::vector<NetworkEvent> network_snapshot() const;

    void clear_console();
    // Also drops every pending correlation.
    void clear_network();
    void clear_all();

    size_t pending_correlation_count() const;
    bool has_pending_correlation(const std::string &url, const std::string &method) const;

    // Correlation key for an exchange: "<METHOD> <url>".
    static std::string correlation_key(const std::string &url, const std::string &method);

private:
    struct PendingExchange {
        std::string id;
        std::chrono::steady_clock::time_point started_at;
    };

    std::string next_correlation_id();
    // Shared by the response and failure paths. Must be called with network_mutex_ held.
    void complete_exchange_locked(NetworkEvent &event);

    mutable std::mutex console_mutex_;
    RingBuffer<ConsoleEntry> console_entries_;

    mutable std::mutex network_mutex_;
    RingBuffer<NetworkEvent> network_events_;
    std::map<std::string, PendingExchange> pending_exchanges_;
    uint64_t next_exchange_number_ = 1;

    std::mutex callback_mutex_;
    std::function<void()> console_updated_callback_;
};

// Current wall-clock time in epoch milliseconds.
int64_t now_epoch_milliseconds();

} // namespace capture

#endif // WEBMCPS_EVENT_CAPTURE_HPP
