#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "deauth_event.hpp"
#include "sliding_window.hpp"

// Raised at construction for a non-positive threshold or window.
class InvalidConfiguration : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raised by ingest()/start() once the session has been stopped.
class SessionClosed : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

enum class EngineState { Created, Running, Stopped };

const char *engine_state_name(EngineState s) noexcept;

struct EngineConfig {
    std::string interface_id;   // opaque, echoed in stats
    int64_t threshold = 10;     // in-window events needed to alert
    Duration time_window = std::chrono::seconds(5);
};

struct AlertOutcome {
    size_t window_count;
    Duration time_window;
    DeauthEvent triggering_event;
};

struct Stats {
    std::string interface_id;
    Duration uptime{};
    uint64_t total_event_count = 0;
    uint64_t alert_count = 0;
    uint64_t broadcast_event_count = 0;
    size_t distinct_suspicious_addresses = 0;
    size_t window_count = 0;
    double average_rate = 0.0;  // events/sec since session start
    EngineState state = EngineState::Created;
};

using ClockFn = std::function<Timestamp()>;

// DetectionEngine: sliding-window deauthentication flood detector for one
// monitoring session. Performs no I/O and owns no threads.
//
// One producer calls ingest() in arrival order; any number of readers may
// call statistics() and the other const reads concurrently.
class DetectionEngine {
    const EngineConfig cfg;
    ClockFn clock;
    Timestamp started_at;

    mutable std::shared_mutex mu;   // guards everything below
    EngineState state_ = EngineState::Created;
    SlidingWindow window;
    std::unordered_map<std::string, uint64_t> offenders;   // transmitter -> events
    std::map<uint16_t, uint64_t> reason_counts;
    uint64_t total_events = 0;
    uint64_t alerts = 0;
    uint64_t broadcast_events = 0;

public:
    // clock defaults to steady_clock::now; tests pass a manual one.
    explicit DetectionEngine(const EngineConfig &config, ClockFn clock_fn = ClockFn());

    DetectionEngine(const DetectionEngine&) = delete;
    DetectionEngine& operator=(const DetectionEngine&) = delete;

    // Created -> Running. No-op while Running; throws SessionClosed once stopped.
    void start();

    // Feed one event. Returns an outcome whenever the window holds at least
    // threshold events, so alerts repeat for as long as the flood lasts.
    std::optional<AlertOutcome> ingest(const DeauthEvent &ev);

    // Terminal. Counters stay readable.
    void stop() noexcept;

    Stats statistics() const;
    EngineState state() const noexcept;
    size_t window_count() const noexcept;

    // distinct transmitters seen this session, sorted
    std::vector<std::string> suspicious_addresses() const;

    // top-k transmitters by event count (desc), ties by address
    std::vector<std::pair<std::string, uint64_t>> top_offenders(size_t K) const;

    std::map<uint16_t, uint64_t> snapshot_reason_counts() const;

    Timestamp session_start() const noexcept { return started_at; }
    const EngineConfig &config() const noexcept { return cfg; }
};
