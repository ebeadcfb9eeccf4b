// src/detection_engine.cpp

#include "detection_engine.hpp"
#include <algorithm>
#include <cstddef>
#include <mutex>

static const size_t MAX_TOPK = 10'000;   // cap top-k responses

static EngineConfig validated(const EngineConfig &c) {
    if (c.threshold <= 0)
        throw InvalidConfiguration("threshold must be positive, got " + std::to_string(c.threshold));
    if (c.time_window <= Duration::zero())
        throw InvalidConfiguration("time_window must be positive");
    return c;
}

const char *engine_state_name(EngineState s) noexcept {
    switch (s) {
        case EngineState::Created: return "created";
        case EngineState::Running: return "running";
        case EngineState::Stopped: return "stopped";
    }
    return "unknown";
}

DetectionEngine::DetectionEngine(const EngineConfig &config, ClockFn clock_fn)
    : cfg(validated(config)),
      clock(clock_fn ? std::move(clock_fn) : ClockFn([] { return MonoClock::now(); })),
      started_at(clock()),
      window(cfg.time_window)
{
}

void DetectionEngine::start() {
    std::unique_lock<std::shared_mutex> lk(mu);
    if (state_ == EngineState::Stopped)
        throw SessionClosed("detection session on " + cfg.interface_id + " is stopped");
    state_ = EngineState::Running;
}

std::optional<AlertOutcome> DetectionEngine::ingest(const DeauthEvent &ev) {
    std::unique_lock<std::shared_mutex> lk(mu);
    if (state_ == EngineState::Stopped)
        throw SessionClosed("ingest after stop on " + cfg.interface_id);
    state_ = EngineState::Running;

    ++total_events;
    if (is_broadcast_address(ev.destination_address)) ++broadcast_events;
    reason_counts[ev.reason_code] += 1;
    offenders[ev.transmitter_address] += 1;

    size_t in_window = window.add_event(ev.timestamp);
    if (in_window < static_cast<uint64_t>(cfg.threshold)) return std::nullopt;

    ++alerts;
    return AlertOutcome{in_window, cfg.time_window, ev};
}

void DetectionEngine::stop() noexcept {
    std::unique_lock<std::shared_mutex> lk(mu);
    state_ = EngineState::Stopped;
}

Stats DetectionEngine::statistics() const {
    Timestamp now = clock();
    Stats s;
    s.interface_id = cfg.interface_id;
    {
        std::shared_lock<std::shared_mutex> lk(mu);
        s.total_event_count = total_events;
        s.alert_count = alerts;
        s.broadcast_event_count = broadcast_events;
        s.distinct_suspicious_addresses = offenders.size();
        s.window_count = window.size();
        s.state = state_;
    }
    s.uptime = now - started_at;
    double secs = to_seconds(s.uptime);
    s.average_rate = (secs > 0.0) ? static_cast<double>(s.total_event_count) / secs : 0.0;
    return s;
}

EngineState DetectionEngine::state() const noexcept {
    std::shared_lock<std::shared_mutex> lk(mu);
    return state_;
}

size_t DetectionEngine::window_count() const noexcept {
    std::shared_lock<std::shared_mutex> lk(mu);
    return window.size();
}

std::vector<std::string> DetectionEngine::suspicious_addresses() const {
    std::vector<std::string> out;
    {
        std::shared_lock<std::shared_mutex> lk(mu);
        out.reserve(offenders.size());
        for (const auto &kv : offenders) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::pair<std::string, uint64_t>> DetectionEngine::top_offenders(size_t K) const {
    if (K == 0) K = 10;
    if (K > MAX_TOPK) K = MAX_TOPK;

    std::vector<std::pair<std::string, uint64_t>> v;
    {
        std::shared_lock<std::shared_mutex> lk(mu);
        v.assign(offenders.begin(), offenders.end());
    }
    auto by_count = [](const auto &a, const auto &b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    };
    if (v.size() > K) {
        std::partial_sort(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(K), v.end(), by_count);
        v.resize(K);
    } else {
        std::sort(v.begin(), v.end(), by_count);
    }
    return v;
}

std::map<uint16_t, uint64_t> DetectionEngine::snapshot_reason_counts() const {
    std::shared_lock<std::shared_mutex> lk(mu);
    return reason_counts;
}
