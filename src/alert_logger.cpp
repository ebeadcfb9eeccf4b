// src/alert_logger.cpp

#include "alert_logger.hpp"
#include "util_log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

static std::string local_time_now() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream os;
    os << std::put_time(&tm_buf, "%a %b %d %H:%M:%S %Y");
    return os.str();
}

std::string format_event_line(const DeauthEvent &ev) {
    std::ostringstream os;
    os << "[!] Deauth frame detected from " << ev.transmitter_address
       << " to " << ev.destination_address
       << " (reason " << ev.reason_code << ": " << reason_code_name(ev.reason_code) << ")"
       << " at " << local_time_now();
    return os.str();
}

std::string format_alert_line(const AlertOutcome &alert) {
    std::ostringstream os;
    os << "[ALERT] Threshold exceeded: " << alert.window_count
       << " deauth frames in " << to_seconds(alert.time_window) << "s";
    return os.str();
}

AlertLogger::AlertLogger(std::ostream &console, const std::string &log_path, bool echo_events)
    : console_(console), log_path_(log_path), echo_events_(echo_events)
{
    if (!log_path_.empty()) {
        file_.open(log_path_, std::ios::app);
        if (!file_) safe_log("AlertLogger: cannot open " + log_path_ + ", alerts go to console only");
    }
}

void AlertLogger::on_event(const DeauthEvent &ev) {
    write_line(format_event_line(ev), echo_events_);
}

void AlertLogger::on_alert(const AlertOutcome &alert) {
    write_line(format_alert_line(alert), true);
}

bool AlertLogger::file_ok() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return !log_path_.empty() && file_.good();
}

uint64_t AlertLogger::lines_written() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return lines_;
}

void AlertLogger::write_line(const std::string &line, bool to_console) {
    std::lock_guard<std::mutex> lk(mu_);
    if (to_console) console_ << line << '\n' << std::flush;
    if (file_.is_open() && file_) file_ << line << std::endl;
    ++lines_;
}
