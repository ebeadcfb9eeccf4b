// src/main.cpp
// DeauthShield daemon: reads a deauthentication feed, runs the detection
// engine, reports alerts. Each startup step is logged.

#include "alert_logger.hpp"
#include "bounded_queue.hpp"
#include "detection_engine.hpp"
#include "http_server.hpp"
#include "ingest_worker.hpp"
#include "options.hpp"
#include "report.hpp"
#include "util_log.hpp"

// CLI is implemented in cli.cpp
extern void run_cli(DetectionEngine &engine, const IngestWorker &worker, std::atomic<bool> &terminate_flag);

#include <atomic>
#include <cstdint>
#include <iostream>
#include <thread>
#include <csignal>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <exception>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::atomic<bool> g_terminate{false};

void handle_sigint(int) {
    g_terminate.store(true);
}

// helper: base64 for the HTTP Basic auth header
static std::string base64_encode(const std::string &in) {
    static const char *tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 3 <= in.size()) {
        unsigned x = (static_cast<unsigned char>(in[i]) << 16)
                   | (static_cast<unsigned char>(in[i + 1]) << 8)
                   | static_cast<unsigned char>(in[i + 2]);
        i += 3;
        for (int shift = 18; shift >= 0; shift -= 6) out.push_back(tbl[(x >> shift) & 0x3F]);
    }
    size_t rem = in.size() - i;
    if (rem > 0) {
        unsigned x = static_cast<unsigned char>(in[i]) << 16;
        if (rem == 2) x |= static_cast<unsigned char>(in[i + 1]) << 8;
        out.push_back(tbl[(x >> 18) & 0x3F]);
        out.push_back(tbl[(x >> 12) & 0x3F]);
        out.push_back(rem == 2 ? tbl[(x >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

// Feed producer for a file, with --follow (tail -f style) support.
static void producer_read_file_loop(const std::string &path, bool follow, BoundedQueue<std::string> &bq) {
    try {
        std::error_code ec;
        while (!g_terminate.load() && !fs::exists(path, ec)) {
            if (!follow) {
                safe_log(std::string("producer: feed not found: ") + path);
                bq.close();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::ifstream in(path);
        if (!in) {
            safe_log(std::string("producer: failed to open ") + path);
            bq.close();
            return;
        }

        uintmax_t last_size = fs::file_size(path, ec);
        std::string line;
        while (!g_terminate.load()) {
            while (!g_terminate.load() && std::getline(in, line)) {
                if (!bq.push(std::move(line))) return;
            }
            if (!follow || g_terminate.load()) break;

            uintmax_t cur_size = fs::file_size(path, ec);
            if (ec) cur_size = 0;
            if (cur_size < last_size) {
                // truncated or rotated: start over from the top
                in.close();
                in.open(path);
            }
            last_size = cur_size;
            in.clear();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        bq.close();
    } catch (const std::exception &ex) {
        safe_log(std::string("producer_read_file_loop: exception: ") + ex.what());
        g_terminate.store(true);
        bq.close();
    }
}

static void producer_read_stdin_loop(BoundedQueue<std::string> &bq) {
    try {
        std::string line;
        while (!g_terminate.load() && std::getline(std::cin, line)) {
            if (!bq.push(std::move(line))) break;
        }
        bq.close();
    } catch (const std::exception &ex) {
        safe_log(std::string("producer_read_stdin_loop: exception: ") + ex.what());
        g_terminate.store(true);
        bq.close();
    }
}

static void print_usage(const char *argv0) {
    std::cerr << "usage: " << argv0 << " [options]\n"
              << "  --interface NAME       monitor interface label (default wlan0mon)\n"
              << "  --threshold N          deauth frames per window that raise an alert (default 10)\n"
              << "  --window SECONDS       sliding window length, fractional allowed (default 5)\n"
              << "  --file PATH            read the deauth feed from PATH instead of stdin\n"
              << "  --follow               keep reading PATH as it grows\n"
              << "  --log-file PATH        append events and alerts to PATH\n"
              << "  --diag-log PATH        diagnostics log (default deauthshield.err.log)\n"
              << "  --quiet                console shows alerts only\n"
              << "  --stats-interval S     log a statistics line every S seconds (0 = off)\n"
              << "  --qcap N               feed queue capacity (default 65536)\n"
              << "  --http-enable          serve /stats, /metrics, /offenders\n"
              << "  --http-port P          (default 8080)\n"
              << "  --http-bind ADDR       (default any)\n"
              << "  --http-user U --http-pass P   require Basic auth\n"
              << "  --http-cache-ttl S     (default 1)\n"
              << "feed lines: <seconds|-> <transmitter-mac> <destination-mac> [reason]\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);

    // defaults
    EngineConfig cfg;
    cfg.interface_id = "wlan0mon";
    std::string file;
    bool follow = false;
    std::string alert_log;
    bool quiet = false;
    unsigned stats_interval = 0;
    size_t qcap = 1<<16;

    bool http_enable = false;
    uint16_t http_port = 8080;
    std::string http_bind, http_user, http_pass;
    unsigned http_cache_ttl = 1;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            bool has_val = i + 1 < argc;
            if (a == "--interface" && has_val) cfg.interface_id = argv[++i];
            else if (a == "--threshold" && has_val) cfg.threshold = parse_int_option(a, argv[++i]);
            else if (a == "--window" && has_val) cfg.time_window = parse_seconds_option(a, argv[++i]);
            else if (a == "--file" && has_val) file = argv[++i];
            else if (a == "--follow") follow = true;
            else if (a == "--log-file" && has_val) alert_log = argv[++i];
            else if (a == "--diag-log" && has_val) set_log_path(argv[++i]);
            else if (a == "--quiet") quiet = true;
            else if (a == "--stats-interval" && has_val) stats_interval = static_cast<unsigned>(parse_unsigned_option(a, argv[++i], 0, 86400));
            else if (a == "--qcap" && has_val) qcap = static_cast<size_t>(parse_unsigned_option(a, argv[++i], 1, 1u << 24));
            else if (a == "--http-enable") http_enable = true;
            else if (a == "--http-port" && has_val) http_port = static_cast<uint16_t>(parse_unsigned_option(a, argv[++i], 1, 65535));
            else if (a == "--http-bind" && has_val) http_bind = argv[++i];
            else if (a == "--http-user" && has_val) http_user = argv[++i];
            else if (a == "--http-pass" && has_val) http_pass = argv[++i];
            else if (a == "--http-cache-ttl" && has_val) http_cache_ttl = static_cast<unsigned>(parse_unsigned_option(a, argv[++i], 0, 3600));
            else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
            else {
                std::cerr << "unknown or incomplete option: " << a << "\n";
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "bad option value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    {
        std::ostringstream os;
        os << "Starting DeauthShield; interface=" << cfg.interface_id
           << " threshold=" << cfg.threshold
           << " window=" << to_seconds(cfg.time_window) << "s"
           << " feed=" << (file.empty() ? "<stdin>" : file)
           << " follow=" << (follow ? "true" : "false")
           << " log_file=" << (alert_log.empty() ? "<none>" : alert_log)
           << " http_enable=" << (http_enable ? "true" : "false");
        safe_log(os.str());
    }

    std::unique_ptr<DetectionEngine> engine_ptr;
    try {
        safe_log("STEP: constructing DetectionEngine");
        engine_ptr = std::make_unique<DetectionEngine>(cfg);
        engine_ptr->start();
        safe_log("OK: DetectionEngine running");
    } catch (const InvalidConfiguration &ic) {
        safe_log(std::string("Invalid configuration: ") + ic.what());
        return 1;
    } catch (const std::exception &e) {
        safe_log(std::string("DetectionEngine construction exception: ") + e.what());
        return 1;
    }
    DetectionEngine &engine = *engine_ptr;

    AlertLogger alerts(std::cout, alert_log, !quiet);
    if (!alert_log.empty() && !alerts.file_ok()) {
        safe_log(std::string("Alert log unavailable: ") + alert_log);
    }

    // shared: a detached stdin producer may outlive main's stack
    auto bq_ptr = std::make_shared<BoundedQueue<std::string>>(qcap);
    BoundedQueue<std::string> &bq = *bq_ptr;

    std::unique_ptr<IngestWorker> worker_ptr;
    try {
        safe_log("STEP: starting ingest worker");
        worker_ptr = std::make_unique<IngestWorker>(bq, engine, alerts);
        safe_log("OK: ingest worker started");
    } catch (const std::exception &e) {
        safe_log(std::string("IngestWorker construction exception: ") + e.what());
        return 1;
    }
    IngestWorker &worker = *worker_ptr;

    std::thread prod;
    try {
        safe_log("STEP: starting producer thread");
        if (file.empty()) {
            prod = std::thread([bq_ptr](){ producer_read_stdin_loop(*bq_ptr); });
        } else {
            prod = std::thread([&]{ producer_read_file_loop(file, follow, bq); });
        }
        safe_log("OK: producer thread started");
    } catch (const std::exception &e) {
        safe_log(std::string("Producer thread exception: ") + e.what());
        g_terminate.store(true);
    }

    std::unique_ptr<HttpServer> http_srv;
    if (http_enable) {
        try {
            safe_log("STEP: creating HttpServer");
            std::string auth_expected;
            if (!http_user.empty() || !http_pass.empty()) {
                auth_expected = std::string("Basic ") + base64_encode(http_user + ":" + http_pass);
            }
            http_srv = std::make_unique<HttpServer>(http_bind, http_port, engine,
                                                    http_cache_ttl, auth_expected);
            if (!http_srv->start()) {
                safe_log("HttpServer failed to start");
                http_srv.reset();
            }
        } catch (const std::exception &e) {
            safe_log(std::string("HttpServer exception: ") + e.what());
            http_srv.reset();
        }
    }

    // periodic statistics, like a status bar refreshing once per interval
    std::thread reporter;
    if (stats_interval > 0) {
        reporter = std::thread([&engine, stats_interval]{
            auto next = std::chrono::steady_clock::now() + std::chrono::seconds(stats_interval);
            while (!g_terminate.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                if (std::chrono::steady_clock::now() < next) continue;
                next += std::chrono::seconds(stats_interval);
                try {
                    safe_log(format_stats_line(engine.statistics()));
                } catch (const std::exception &e) {
                    safe_log(std::string("stats reporter: ") + e.what());
                }
            }
        });
    }

    try {
        if (!file.empty()) {
            safe_log("STEP: running CLI (interactive)");
            run_cli(engine, worker, g_terminate);
            safe_log("OK: CLI exited");
        }
        // without --follow the feed ends on its own; otherwise run until SIGINT/QUIT
        while (!g_terminate.load() && !worker.finished()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } catch (const std::exception &e) {
        safe_log(std::string("CLI/loop exception: ") + e.what());
    }

    safe_log("Shutdown: setting terminate flag");
    g_terminate.store(true);
    bq.close();

    if (http_srv) {
        http_srv->stop();
        http_srv.reset();
    }

    // a stdin producer may still sit in getline(); it exits once input ends
    if (prod.joinable()) {
        if (file.empty()) prod.detach();
        else prod.join();
    }
    if (reporter.joinable()) reporter.join();

    std::ostringstream feed;
    feed << "Feed: processed=" << worker.get_processed()
         << " parse_errors=" << worker.get_parse_errors()
         << " dropped=" << worker.get_dropped();
    worker_ptr.reset();
    engine.stop();

    safe_log("Final statistics: " + format_stats_line(engine.statistics()));
    safe_log(feed.str());
    safe_log("DeauthShield shutting down normally.");
    return 0;
}
