#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using MonoClock = std::chrono::steady_clock;
using Timestamp = MonoClock::time_point;
using Duration = MonoClock::duration;

// One observed 802.11 deauthentication frame, as delivered by the capture side.
struct DeauthEvent {
    Timestamp timestamp;
    std::string transmitter_address;
    std::string destination_address;
    uint16_t reason_code = 0;
};

constexpr const char *BROADCAST_ADDRESS = "ff:ff:ff:ff:ff:ff";

// Lowercase, ':'-separated form of a MAC address ("AA-BB-.." -> "aa:bb:..").
std::string normalize_mac(const std::string &mac);

bool is_broadcast_address(const std::string &mac) noexcept;

// IEEE 802.11 reason code description, "Reserved/unknown" outside 1..9.
const char *reason_code_name(uint16_t code) noexcept;

// Longest span accepted from feeds and flags (~31 years); keeps time_point arithmetic in range.
constexpr double MAX_SPAN_SECONDS = 1e9;

// Seconds -> Duration, empty for NaN, infinities and magnitudes above MAX_SPAN_SECONDS.
std::optional<Duration> seconds_to_duration(double secs) noexcept;

// Seconds as double, for display and rates.
inline double to_seconds(Duration d) noexcept {
    return std::chrono::duration<double>(d).count();
}
