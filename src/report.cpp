// src/report.cpp
// Text and JSON renderings of engine statistics, shared by CLI, reporter and HTTP.

#include "report.hpp"
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>

// interface ids come from the command line; escape what JSON requires
static std::string json_escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string format_uptime(Duration d) {
    if (d < Duration::zero()) d = Duration::zero();
    long long total = std::chrono::duration_cast<std::chrono::seconds>(d).count();
    std::ostringstream os;
    os << std::setfill('0') << std::setw(2) << (total / 3600) << ":"
       << std::setw(2) << ((total / 60) % 60) << ":"
       << std::setw(2) << (total % 60);
    return os.str();
}

std::string format_stats_line(const Stats &s) {
    std::ostringstream os;
    os << "Uptime: " << format_uptime(s.uptime)
       << " | Deauth: " << s.total_event_count
       << " | Rate: " << std::fixed << std::setprecision(1) << s.average_rate << " pkt/s"
       << " | Alerts: " << s.alert_count
       << " | Broadcast: " << s.broadcast_event_count
       << " | Suspicious MACs: " << s.distinct_suspicious_addresses
       << " | Window: " << s.window_count
       << " | " << s.interface_id << " (" << engine_state_name(s.state) << ")";
    return os.str();
}

std::string offenders_json(const std::vector<std::pair<std::string,uint64_t>> &offenders) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < offenders.size(); ++i) {
        if (i) out << ", ";
        out << "{\"mac\":\"" << json_escape(offenders[i].first) << "\",\"count\":" << offenders[i].second << "}";
    }
    out << "]";
    return out.str();
}

std::string stats_json(const Stats &s,
                       const std::vector<std::pair<std::string,uint64_t>> &offenders) {
    std::ostringstream out;
    out << "{\n";
    out << "  \"interface\": \"" << json_escape(s.interface_id) << "\",\n";
    out << "  \"state\": \"" << engine_state_name(s.state) << "\",\n";
    out << "  \"uptime_seconds\": " << std::fixed << std::setprecision(3) << to_seconds(s.uptime) << ",\n";
    out << "  \"total_deauth\": " << s.total_event_count << ",\n";
    out << "  \"alerts\": " << s.alert_count << ",\n";
    out << "  \"broadcast\": " << s.broadcast_event_count << ",\n";
    out << "  \"suspicious_macs\": " << s.distinct_suspicious_addresses << ",\n";
    out << "  \"window_count\": " << s.window_count << ",\n";
    out << "  \"rate_pps\": " << s.average_rate << ",\n";
    out << "  \"top_offenders\": " << offenders_json(offenders) << "\n";
    out << "}\n";
    return out.str();
}
