// src/cli.cpp
// Interactive command loop on stdin, used when events are read from a file.
// Returns on QUIT (raising terminate_flag) or when stdin closes.

#include "detection_engine.hpp"
#include "ingest_worker.hpp"
#include "report.hpp"
#include <iostream>
#include <sstream>
#include <atomic>
#include <string>

void run_cli(DetectionEngine &engine, const IngestWorker &worker, std::atomic<bool> &terminate_flag) {
    std::string cmd;
    std::cout << "DeauthShield CLI ready. Commands: STATS | OFFENDERS [K] | MACS | REASONS | WINDOW | STOP | QUIT\n> " << std::flush;

    while (!terminate_flag.load() && std::getline(std::cin, cmd)) {
        if (cmd.empty()) {
            std::cout << "> " << std::flush;
            continue;
        }

        std::stringstream ss(cmd);
        std::string tok;
        ss >> tok;

        if (tok == "STATS") {
            std::cout << format_stats_line(engine.statistics()) << "\n";
            std::cout << "feed: processed=" << worker.get_processed()
                      << " parse_errors=" << worker.get_parse_errors()
                      << " dropped=" << worker.get_dropped() << "\n";
        }
        else if (tok == "OFFENDERS") {
            size_t K = 10;
            ss >> K;
            auto top = engine.top_offenders(K);
            std::cout << "TOP " << top.size() << " transmitters:\n";
            for (auto &p : top) std::cout << p.first << " " << p.second << "\n";
        }
        else if (tok == "MACS") {
            auto macs = engine.suspicious_addresses();
            std::cout << "Suspicious MACs (" << macs.size() << "):\n";
            for (auto &m : macs) std::cout << m << "\n";
        }
        else if (tok == "REASONS") {
            for (auto &p : engine.snapshot_reason_counts())
                std::cout << p.first << " (" << reason_code_name(p.first) << "): " << p.second << "\n";
        }
        else if (tok == "WINDOW") {
            std::cout << engine.window_count() << " deauth frames in the last "
                      << to_seconds(engine.config().time_window) << "s (threshold "
                      << engine.config().threshold << ")\n";
        }
        else if (tok == "STOP") {
            engine.stop();
            std::cout << "Detection session stopped. Final: " << format_stats_line(engine.statistics()) << "\n";
        }
        else if (tok == "QUIT" || tok == "EXIT") {
            terminate_flag.store(true);
            break;
        }
        else {
            std::cout << "Unknown command\n";
        }

        std::cout << "> " << std::flush;
    }
}
