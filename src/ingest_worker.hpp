#pragma once
#include "bounded_queue.hpp"
#include "detection_engine.hpp"
#include "event_sink.hpp"
#include "parser.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

// Single consumer thread: feed lines -> parse -> engine.ingest -> sink.
// One thread only, so events reach the engine in arrival order.
class IngestWorker {
    BoundedQueue<std::string> &queue;
    DetectionEngine &engine;
    EventSink &sink;

    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> errors{0};
    std::atomic<uint64_t> dropped{0};

    std::mutex done_mu;
    std::condition_variable done_cv;
    bool done = false;

    std::thread worker;

    void run();
    void handle_line(const std::string &line);
public:
    IngestWorker(BoundedQueue<std::string> &q, DetectionEngine &eng, EventSink &out);
    ~IngestWorker();

    IngestWorker(const IngestWorker&) = delete;
    IngestWorker& operator=(const IngestWorker&) = delete;

    // Block until the queue is closed and drained (or g_terminate is raised).
    void wait();
    bool finished();

    uint64_t get_processed() const noexcept { return processed.load(); }
    uint64_t get_parse_errors() const noexcept { return errors.load(); }
    uint64_t get_dropped() const noexcept { return dropped.load(); }
};

// Place a feed record on the engine's timeline: offsets count from session start,
// records without one are stamped with `now`.
DeauthEvent to_event(const DeauthRecord &rec, Timestamp session_start, Timestamp now);
