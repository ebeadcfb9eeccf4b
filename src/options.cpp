// src/options.cpp

#include "options.hpp"
#include <cctype>
#include <stdexcept>

static std::invalid_argument bad_value(const std::string &flag, const std::string &text) {
    return std::invalid_argument(flag + ": invalid value '" + text + "'");
}

long long parse_int_option(const std::string &flag, const std::string &text) {
    size_t pos = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &pos);
    } catch (const std::logic_error &) {
        throw bad_value(flag, text);
    }
    if (pos != text.size()) throw bad_value(flag, text);
    return v;
}

unsigned long long parse_unsigned_option(const std::string &flag, const std::string &text,
                                         unsigned long long lo, unsigned long long hi) {
    // stoull quietly wraps "-1"
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) throw bad_value(flag, text);
    size_t pos = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(text, &pos);
    } catch (const std::logic_error &) {
        throw bad_value(flag, text);
    }
    if (pos != text.size()) throw bad_value(flag, text);
    if (v < lo || v > hi) {
        throw std::invalid_argument(flag + ": " + text + " outside [" + std::to_string(lo) + ", "
                                    + std::to_string(hi) + "]");
    }
    return v;
}

Duration parse_seconds_option(const std::string &flag, const std::string &text) {
    size_t pos = 0;
    double secs = 0.0;
    try {
        secs = std::stod(text, &pos);
    } catch (const std::logic_error &) {
        throw bad_value(flag, text);
    }
    if (pos != text.size()) throw bad_value(flag, text);
    std::optional<Duration> d = seconds_to_duration(secs);
    if (!d) throw bad_value(flag, text);
    return *d;
}
