#pragma once
#include <string>
#include "deauth_event.hpp"

// Numeric command-line values. Each throws std::invalid_argument naming the
// flag when the whole text is not a number of the right kind and range.
long long parse_int_option(const std::string &flag, const std::string &text);
unsigned long long parse_unsigned_option(const std::string &flag, const std::string &text,
                                         unsigned long long lo, unsigned long long hi);

// Seconds as a Duration. Sign is left to the engine's own validation.
Duration parse_seconds_option(const std::string &flag, const std::string &text);
