#pragma once
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>
#include "event_sink.hpp"

// Console + optional append-only log file for deauth events and alerts.
class AlertLogger : public EventSink {
public:
    // echo_events=false keeps per-frame lines out of the console (they still reach the file).
    AlertLogger(std::ostream &console, const std::string &log_path = "", bool echo_events = true);

    void on_event(const DeauthEvent &ev) override;
    void on_alert(const AlertOutcome &alert) override;

    bool file_ok() const noexcept;
    uint64_t lines_written() const noexcept;

private:
    void write_line(const std::string &line, bool to_console);

    std::ostream &console_;
    std::string log_path_;
    std::ofstream file_;
    bool echo_events_;
    mutable std::mutex mu_;
    uint64_t lines_ = 0;
};

std::string format_event_line(const DeauthEvent &ev);
std::string format_alert_line(const AlertOutcome &alert);
