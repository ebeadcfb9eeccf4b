// src/parser.cpp

#include "parser.hpp"
#include "deauth_event.hpp"
#include <cctype>
#include <regex>
#include <stdexcept>

std::optional<DeauthRecord> parse_deauth_record(const std::string &line) {
    static const std::regex r(
        R"(^\s*(-|\d+(?:\.\d+)?)[\s,]+)"
        R"(([0-9A-Fa-f]{2}(?:[:-][0-9A-Fa-f]{2}){5})[\s,]+)"
        R"(([0-9A-Fa-f]{2}(?:[:-][0-9A-Fa-f]{2}){5}))"
        R"((?:[\s,]+(\d{1,5}))?\s*$)");
    std::smatch m;
    if (!std::regex_match(line, m, r)) return std::nullopt;

    DeauthRecord rec;
    if (m[1].str() != "-") {
        double offset = 0.0;
        try {
            offset = std::stod(m[1].str());
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
        if (!seconds_to_duration(offset)) return std::nullopt;
        rec.offset_seconds = offset;
    }
    rec.transmitter = normalize_mac(m[2].str());
    rec.destination = normalize_mac(m[3].str());
    if (m[4].matched) {
        unsigned long reason = std::stoul(m[4].str());
        if (reason > 0xFFFF) return std::nullopt;
        rec.reason_code = static_cast<uint16_t>(reason);
    }
    return rec;
}

bool is_blank_or_comment(const std::string &line) noexcept {
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == '#';
    }
    return true;
}
