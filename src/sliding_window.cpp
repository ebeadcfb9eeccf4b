// src/sliding_window.cpp

#include "sliding_window.hpp"
#include <stdexcept>

SlidingWindow::SlidingWindow(Duration span) : window_span(span) {
    if (span <= Duration::zero())
        throw std::invalid_argument("SlidingWindow: span must be positive");
}

size_t SlidingWindow::add_event(Timestamp ts) {
    stamps.push_back(ts);
    evict_older_than(ts);
    return stamps.size();
}

size_t SlidingWindow::evict_older_than(Timestamp now) {
    size_t dropped = 0;
    // entries arrive in order, so everything stale sits at the front
    while (!stamps.empty() && now - stamps.front() > window_span) {
        stamps.pop_front();
        ++dropped;
    }
    return dropped;
}

std::optional<Timestamp> SlidingWindow::oldest() const {
    if (stamps.empty()) return std::nullopt;
    return stamps.front();
}

std::optional<Timestamp> SlidingWindow::newest() const {
    if (stamps.empty()) return std::nullopt;
    return stamps.back();
}

double SlidingWindow::rate() const noexcept {
    double secs = to_seconds(window_span);
    if (secs <= 0.0) return 0.0;
    return static_cast<double>(stamps.size()) / secs;
}

void SlidingWindow::reset() {
    stamps.clear();
}
