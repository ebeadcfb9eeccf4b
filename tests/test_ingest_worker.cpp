// tests/test_ingest_worker.cpp
// Pushes feed lines through BoundedQueue -> IngestWorker -> DetectionEngine
// and checks what reaches the sink.

#include <iostream>
#include <string>
#include <vector>

#include "../src/bounded_queue.hpp"
#include "../src/detection_engine.hpp"
#include "../src/event_sink.hpp"
#include "../src/global_ctl.hpp"
#include "../src/ingest_worker.hpp"

namespace {

class RecordingSink : public EventSink {
public:
    std::vector<DeauthEvent> events;
    std::vector<AlertOutcome> alerts;
    void on_event(const DeauthEvent &ev) override { events.push_back(ev); }
    void on_alert(const AlertOutcome &a) override { alerts.push_back(a); }
};

}

int main() {
    using namespace std::chrono_literals;

    BoundedQueue<std::string> bq(16);
    DetectionEngine engine({"wlan0mon", 3, 1s});
    RecordingSink sink;

    std::vector<std::string> lines = {
        "# exported from capture",
        "0.000 02:00:00:00:00:01 ff:ff:ff:ff:ff:ff 7",
        "",
        "0.100 02:00:00:00:00:02 ff:ff:ff:ff:ff:ff 7",
        "garbage line",
        "0.200 02:00:00:00:00:01 aa:bb:cc:dd:ee:ff 1",
        "0.300 02:00:00:00:00:03 aa:bb:cc:dd:ee:ff 4",
        "5.000 02:00:00:00:00:04 aa:bb:cc:dd:ee:ff",
    };

    {
        IngestWorker worker(bq, engine, sink);
        for (auto &ln : lines) bq.push(ln);
        bq.close();
        worker.wait();

        if (worker.get_processed() != 5) {
            std::cerr << "ingest_worker: expected 5 processed got " << worker.get_processed() << "\n";
            return 2;
        }
        if (worker.get_parse_errors() != 1) {
            std::cerr << "ingest_worker: expected 1 parse error got " << worker.get_parse_errors() << "\n";
            return 3;
        }
    }

    if (sink.events.size() != 5 || sink.events[0].transmitter_address != "02:00:00:00:00:01"
        || sink.events[3].transmitter_address != "02:00:00:00:00:03") {
        std::cerr << "ingest_worker: events reached the sink out of order\n";
        return 4;
    }
    if (sink.events[1].timestamp - sink.events[0].timestamp != Duration(100ms)) {
        std::cerr << "ingest_worker: feed offsets not mapped onto the session timeline\n";
        return 5;
    }
    // third and fourth in-window frames alert; the 5s frame stands alone
    if (sink.alerts.size() != 2 || sink.alerts[0].window_count != 3 || sink.alerts[1].window_count != 4) {
        std::cerr << "ingest_worker: expected alerts with window 3 and 4, got " << sink.alerts.size() << "\n";
        return 6;
    }
    Stats s = engine.statistics();
    if (s.total_event_count != 5 || s.broadcast_event_count != 2 || s.distinct_suspicious_addresses != 4) {
        std::cerr << "ingest_worker: engine counters mismatch\n";
        return 7;
    }

    // after stop, remaining lines are dropped rather than ingested
    BoundedQueue<std::string> bq2(4);
    engine.stop();
    {
        IngestWorker worker(bq2, engine, sink);
        bq2.push("6.0 02:00:00:00:00:05 ff:ff:ff:ff:ff:ff 7");
        bq2.push("6.1 02:00:00:00:00:05 ff:ff:ff:ff:ff:ff 7");
        bq2.close();
        worker.wait();
        if (worker.get_dropped() != 2 || worker.get_processed() != 0) {
            std::cerr << "ingest_worker: expected 2 dropped after stop\n";
            return 8;
        }
    }
    if (engine.statistics().total_event_count != 5) {
        std::cerr << "ingest_worker: stopped engine was mutated\n";
        return 9;
    }

    // an unrepresentable timestamp is a parse error; the worker keeps going
    {
        BoundedQueue<std::string> bq3(4);
        DetectionEngine fresh({"wlan0mon", 3, 1s});
        RecordingSink sink3;
        IngestWorker worker(bq3, fresh, sink3);
        bq3.push(std::string(400, '9') + " 02:00:00:00:00:06 ff:ff:ff:ff:ff:ff 7");
        bq3.push("0.5 02:00:00:00:00:06 ff:ff:ff:ff:ff:ff 7");
        bq3.close();
        worker.wait();
        if (worker.get_parse_errors() != 1 || worker.get_processed() != 1) {
            std::cerr << "ingest_worker: oversized timestamp not counted as a parse error\n";
            return 10;
        }
        if (g_terminate.load()) {
            std::cerr << "ingest_worker: oversized timestamp requested shutdown\n";
            return 11;
        }
        if (fresh.statistics().total_event_count != 1 || sink3.events.size() != 1) {
            std::cerr << "ingest_worker: valid line after oversized timestamp was lost\n";
            return 12;
        }
    }

    std::cout << "test_ingest_worker: OK\n";
    return 0;
}
