#pragma once
#include <cstdint>
#include <optional>
#include <string>

// One line of the event feed, already reduced to a deauthentication frame by the capture tool.
struct DeauthRecord {
    std::optional<double> offset_seconds;   // empty: stamp on receipt
    std::string transmitter;
    std::string destination;
    uint16_t reason_code = 0;
};

// "<ts|-> <transmitter> <destination> [reason]", whitespace or comma separated.
std::optional<DeauthRecord> parse_deauth_record(const std::string &line);

// Blank lines and '#' comments carry no record and are not parse errors.
bool is_blank_or_comment(const std::string &line) noexcept;
