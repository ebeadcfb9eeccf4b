// src/ingest_worker.cpp
// Consumes feed lines from the bounded queue and drives the detection engine.
// The worker thread is wrapped in try/catch and reports failures via safe_log().

#include "ingest_worker.hpp"
#include "global_ctl.hpp"
#include "util_log.hpp"
#include <chrono>
#include <exception>

DeauthEvent to_event(const DeauthRecord &rec, Timestamp session_start, Timestamp now) {
    DeauthEvent ev;
    std::optional<Duration> offset;
    if (rec.offset_seconds) offset = seconds_to_duration(*rec.offset_seconds);
    if (offset) {
        ev.timestamp = session_start + *offset;
    } else {
        ev.timestamp = now;
    }
    ev.transmitter_address = rec.transmitter;
    ev.destination_address = rec.destination;
    ev.reason_code = rec.reason_code;
    return ev;
}

IngestWorker::IngestWorker(BoundedQueue<std::string> &q, DetectionEngine &eng, EventSink &out)
    : queue(q), engine(eng), sink(out)
{
    worker = std::thread([this]{ run(); });
}

IngestWorker::~IngestWorker() {
    queue.close();
    if (worker.joinable()) worker.join();
}

void IngestWorker::run() {
    try {
        std::string line;
        while (!g_terminate.load() && queue.pop(line)) {
            handle_line(line);
        }
    } catch (const std::exception &ex) {
        safe_log(std::string("Unhandled exception in ingest worker: ") + ex.what());
        g_terminate.store(true);
    }
    {
        std::lock_guard<std::mutex> lk(done_mu);
        done = true;
    }
    done_cv.notify_all();
}

void IngestWorker::handle_line(const std::string &line) {
    if (is_blank_or_comment(line)) return;

    auto rec = parse_deauth_record(line);
    if (!rec) {
        errors.fetch_add(1);
        return;
    }

    DeauthEvent ev = to_event(*rec, engine.session_start(), MonoClock::now());
    std::optional<AlertOutcome> outcome;
    try {
        outcome = engine.ingest(ev);
    } catch (const SessionClosed &sc) {
        if (dropped.fetch_add(1) == 0)
            safe_log(std::string("ingest worker: ") + sc.what() + "; dropping remaining events");
        return;
    }
    processed.fetch_add(1);

    sink.on_event(ev);
    if (outcome) sink.on_alert(*outcome);
}

void IngestWorker::wait() {
    std::unique_lock<std::mutex> lk(done_mu);
    done_cv.wait(lk, [this]{ return done; });
}

bool IngestWorker::finished() {
    std::lock_guard<std::mutex> lk(done_mu);
    return done;
}
