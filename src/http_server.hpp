#pragma once
#include <string>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <condition_variable>
#include <cstdint>
#include "detection_engine.hpp"

// Read-only HTTP view of a detection session: /stats, /metrics, /offenders.
class HttpServer {
public:
    HttpServer(const std::string &bind_addr,
               uint16_t port,
               const DetectionEngine &engine_ref,
               unsigned cache_ttl_seconds = 1,
               const std::string &auth_expected = "");
    ~HttpServer();

    bool start();
    void stop();

    // Render a body for path+query, bypassing the cache. Empty for unknown paths.
    std::string render(const std::string &path, const std::string &query) const;

private:
    void accept_loop();
    void serve_connection(int sock_fd);
    void handle_connection(int sock_fd);

    std::string bind_addr_;
    uint16_t port_;
    const DetectionEngine &engine_;
    std::chrono::seconds cache_ttl_;
    std::string auth_expected_header_;

    int listen_sock_;
    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::mutex lifecycle_mu_;

    // client sockets with a live connection thread; stop() waits for it to drain
    std::mutex conn_mu_;
    std::condition_variable conn_cv_;
    std::set<int> open_conns_;

    struct CachedBody {
        std::string body;
        std::chrono::steady_clock::time_point at;
    };
    std::mutex cache_mu_;
    std::map<std::string, CachedBody> cache_;   // keyed by path + query
};
