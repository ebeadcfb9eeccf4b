// src/deauth_event.cpp

#include "deauth_event.hpp"
#include <cctype>
#include <cmath>

std::string normalize_mac(const std::string &mac) {
    std::string out;
    out.reserve(mac.size());
    for (char c : mac) {
        if (c == '-') out.push_back(':');
        else out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::optional<Duration> seconds_to_duration(double secs) noexcept {
    if (!std::isfinite(secs) || std::fabs(secs) > MAX_SPAN_SECONDS) return std::nullopt;
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(secs));
}

bool is_broadcast_address(const std::string &mac) noexcept {
    if (mac.size() != 17) return false;
    for (size_t i = 0; i < mac.size(); ++i) {
        char c = mac[i];
        if (i % 3 == 2) {
            if (c != ':' && c != '-') return false;
        } else if (c != 'f' && c != 'F') {
            return false;
        }
    }
    return true;
}

const char *reason_code_name(uint16_t code) noexcept {
    switch (code) {
        case 1: return "Unspecified reason";
        case 2: return "Previous authentication no longer valid";
        case 3: return "Sending STA is leaving IBSS or ESS";
        case 4: return "Disassociated due to inactivity";
        case 5: return "AP unable to handle all associated STAs";
        case 6: return "Class 2 frame received from nonauthenticated STA";
        case 7: return "Class 3 frame received from nonassociated STA";
        case 8: return "Sending STA is leaving BSS";
        case 9: return "STA requesting (re)association is not authenticated";
        default: return "Reserved/unknown";
    }
}
