// tests/test_sliding_window.cpp
#include <iostream>
#include <chrono>
#include <stdexcept>
#include "../src/sliding_window.hpp"

int main() {
    using namespace std::chrono_literals;
    const Timestamp t0{};

    SlidingWindow w(1s);
    if (w.add_event(t0) != 1 || w.add_event(t0 + 400ms) != 2 || w.add_event(t0 + 1000ms) != 3) {
        std::cerr << "sliding_window: entries exactly span apart must be kept\n";
        return 2;
    }
    // t0 is now 1001ms old
    if (w.add_event(t0 + 1001ms) != 3 || *w.oldest() != t0 + 400ms || *w.newest() != t0 + 1001ms) {
        std::cerr << "sliding_window: stale front entry not evicted\n";
        return 3;
    }
    if (w.evict_older_than(t0 + 10s) != 3 || w.size() != 0 || w.oldest()) {
        std::cerr << "sliding_window: evict_older_than should drain the window\n";
        return 4;
    }

    // constant 10/s feed: size stays bounded by ceil(rate * span) + 1
    SlidingWindow bounded(1s);
    size_t max_seen = 0;
    for (int i = 0; i < 5000; ++i) {
        size_t n = bounded.add_event(t0 + std::chrono::milliseconds(100 * i));
        if (n > max_seen) max_seen = n;
    }
    if (max_seen > 11) {
        std::cerr << "sliding_window: unbounded growth, max " << max_seen << "\n";
        return 5;
    }
    if (bounded.rate() <= 0.0) {
        std::cerr << "sliding_window: expected positive rate\n";
        return 6;
    }

    bool threw = false;
    try { SlidingWindow bad(Duration::zero()); } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) {
        std::cerr << "sliding_window: zero span accepted\n";
        return 7;
    }

    std::cout << "test_sliding_window: OK\n";
    return 0;
}
