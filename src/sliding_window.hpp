#pragma once
#include <deque>
#include <optional>
#include "deauth_event.hpp"

// SlidingWindow: timestamps of the events seen within the trailing span, oldest first.
// Not synchronised; the owner serialises access.
class SlidingWindow {
    std::deque<Timestamp> stamps;
    Duration window_span;
public:
    explicit SlidingWindow(Duration span);

    // Append ts and evict everything more than span older than ts. Returns the new size.
    size_t add_event(Timestamp ts);

    // Drop front entries t with now - t > span. Returns how many were dropped.
    size_t evict_older_than(Timestamp now);

    size_t size() const noexcept { return stamps.size(); }
    Duration span() const noexcept { return window_span; }
    std::optional<Timestamp> oldest() const;
    std::optional<Timestamp> newest() const;

    // Average rate (events/sec) over the span
    double rate() const noexcept;

    void reset();
};
