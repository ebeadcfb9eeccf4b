// tests/test_options.cpp
// Numeric flag values: whole-string numbers only, ranges enforced.

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include "../src/options.hpp"

namespace {

template <typename F>
bool rejects(F fn) {
    try {
        fn();
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

}

int main() {
    using namespace std::chrono_literals;

    if (parse_int_option("--threshold", "25") != 25 || parse_int_option("--threshold", "-3") != -3) {
        std::cerr << "parse_int_option failed on plain integers\n";
        return 2;
    }
    const char *bad_ints[] = {"10abc", "", "1.5", "99999999999999999999999"};
    for (const char *t : bad_ints) {
        if (!rejects([&]{ parse_int_option("--threshold", t); })) {
            std::cerr << "parse_int_option accepted '" << t << "'\n";
            return 3;
        }
    }

    if (parse_unsigned_option("--http-port", "8080", 1, 65535) != 8080) {
        std::cerr << "parse_unsigned_option failed on 8080\n";
        return 4;
    }
    const char *bad_ports[] = {"-1", "0", "70000", "80x", "+80", " 80"};
    for (const char *t : bad_ports) {
        if (!rejects([&]{ parse_unsigned_option("--http-port", t, 1, 65535); })) {
            std::cerr << "parse_unsigned_option accepted port '" << t << "'\n";
            return 5;
        }
    }
    // a negative count must not wrap to a huge queue
    if (!rejects([]{ parse_unsigned_option("--qcap", "-1", 1, 1u << 24); })) {
        std::cerr << "parse_unsigned_option wrapped -1\n";
        return 6;
    }

    if (parse_seconds_option("--window", "2.5") != Duration(2500ms)) {
        std::cerr << "parse_seconds_option failed on 2.5\n";
        return 7;
    }
    // zero and negative pass through; the engine rejects them as configuration
    if (parse_seconds_option("--window", "0") != Duration::zero()
        || parse_seconds_option("--window", "-1") != Duration(-1s)) {
        std::cerr << "parse_seconds_option should leave sign checks to the engine\n";
        return 8;
    }
    const std::string bad_windows[] = {"5s", "nan", "inf", "1e300", std::string(400, '9'), "abc"};
    for (const std::string &t : bad_windows) {
        if (!rejects([&]{ parse_seconds_option("--window", t); })) {
            std::cerr << "parse_seconds_option accepted '" << t.substr(0, 20) << "'\n";
            return 9;
        }
    }

    std::cout << "test_options: OK\n";
    return 0;
}
