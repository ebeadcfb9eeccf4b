// src/http_server.cpp
// Lightweight HTTP server exposing detection statistics.
// Provides per-path caching (TTL) and optional Basic Auth protection.
//
// Portable: uses winsock2 on Windows and BSD sockets on POSIX.

#include "http_server.hpp"
#include "report.hpp"
#include "util_log.hpp"

#include <sstream>
#include <cctype>
#include <cstring>
#include <cstdlib>
#include <system_error>

#if defined(_WIN32)
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #define WIN32_LEAN_AND_MEAN
  #include <winsock2.h>
  #include <ws2tcpip.h>
  using socklen_t = int;
  static const int INVALID_SOCKET_FD = INVALID_SOCKET;
  #define HEADER_EQ(a,b) (_stricmp((a),(b))==0)
#else
  #include <unistd.h>
  #include <strings.h>
  #include <sys/socket.h>
  #include <sys/time.h>
  #include <netinet/in.h>
  #include <arpa/inet.h>
  #define closesocket close
  static const int INVALID_SOCKET_FD = -1;
  #define HEADER_EQ(a,b) (strcasecmp((a),(b))==0)
#endif

using steady_clock_t = std::chrono::steady_clock;

static const int CLIENT_RECV_TIMEOUT_SECONDS = 5;

static inline int clamp_int(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

static std::string get_query_param(const std::string &q, const std::string &key) {
    size_t pos = 0;
    while (pos < q.size()) {
        size_t amp = q.find('&', pos);
        std::string pair = q.substr(pos, (amp == std::string::npos ? std::string::npos : amp - pos));
        size_t eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == key) return pair.substr(eq + 1);
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return {};
}

static const char *status_text(int code) {
    switch (code) {
        case 200: return "OK";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        default:  return "Internal Server Error";
    }
}

static std::string http_response(int code, const std::string &body,
                                 const std::string &ct = "text/plain; charset=utf-8",
                                 const std::string &extra_headers = "") {
    std::ostringstream os;
    os << "HTTP/1.1 " << code << " " << status_text(code) << "\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Content-Type: " << ct << "\r\n"
       << extra_headers
       << "Connection: close\r\n"
       << "\r\n"
       << body;
    return os.str();
}

static void send_all(int sock, const std::string &resp) {
    size_t off = 0;
    while (off < resp.size()) {
        int n = static_cast<int>(send(sock, resp.data() + off, static_cast<int>(resp.size() - off), 0));
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

// bound how long a silent client can hold its connection thread
static void set_recv_timeout(int sock, int seconds) {
#if defined(_WIN32)
    DWORD tv = static_cast<DWORD>(seconds) * 1000;
#else
    timeval tv;
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
#endif
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv));
}

// read until "\r\n\r\n" or error. returns true if a full header block arrived.
static bool recv_request(int sock, std::string &out_req) {
    out_req.clear();
    char buf[4096];
    while (true) {
        int r = static_cast<int>(recv(sock, buf, sizeof(buf), 0));
        if (r <= 0) return false;
        out_req.append(buf, buf + r);
        if (out_req.find("\r\n\r\n") != std::string::npos) return true;
        if (out_req.size() > 64 * 1024) return false;
    }
}

HttpServer::HttpServer(const std::string &bind_addr,
                       uint16_t port,
                       const DetectionEngine &engine_ref,
                       unsigned cache_ttl_seconds,
                       const std::string &auth_expected)
    : bind_addr_(bind_addr),
      port_(port),
      engine_(engine_ref),
      cache_ttl_(std::chrono::seconds(cache_ttl_seconds)),
      auth_expected_header_(auth_expected),
      listen_sock_(INVALID_SOCKET_FD),
      running_(false)
{
#if defined(_WIN32)
    WSADATA wsa;
    if (WSAStartup(MAKEWORD(2,2), &wsa) != 0) {
        safe_log("HttpServer: WSAStartup failed");
    }
#endif
}

HttpServer::~HttpServer() {
    stop();
#if defined(_WIN32)
    WSACleanup();
#endif
}

bool HttpServer::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_) return true;

    listen_sock_ = static_cast<int>(socket(AF_INET, SOCK_STREAM, 0));
    if (listen_sock_ == INVALID_SOCKET_FD) {
        safe_log("HttpServer: socket() failed");
        return false;
    }

    int opt = 1;
    setsockopt(listen_sock_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<char*>(&opt), sizeof(opt));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (bind_addr_.empty()) {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
        safe_log("HttpServer: invalid bind address " + bind_addr_);
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
        return false;
    }

    if (bind(listen_sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        safe_log("HttpServer: bind() failed on port " + std::to_string(port_));
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
        return false;
    }

    if (listen(listen_sock_, 16) < 0) {
        safe_log("HttpServer: listen() failed");
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
        return false;
    }

    running_ = true;
    worker_thread_ = std::thread([this]{ this->accept_loop(); });

    safe_log(std::string("HttpServer started on port ") + std::to_string(port_));
    return true;
}

void HttpServer::stop() {
    {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        if (!running_) return;
        running_ = false;
    }

    if (listen_sock_ != INVALID_SOCKET_FD) {
#if !defined(_WIN32)
        shutdown(listen_sock_, SHUT_RDWR);
#endif
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
    }

    if (worker_thread_.joinable()) worker_thread_.join();

    // unblock connection threads still waiting on a client, then wait them out
    {
        std::unique_lock<std::mutex> lk(conn_mu_);
        for (int fd : open_conns_) {
#if defined(_WIN32)
            shutdown(fd, SD_BOTH);
#else
            shutdown(fd, SHUT_RDWR);
#endif
        }
        conn_cv_.wait(lk, [this]{ return open_conns_.empty(); });
    }

    safe_log("HttpServer stopped");
}

void HttpServer::accept_loop() {
    while (running_) {
        sockaddr_in client;
        socklen_t clen = sizeof(client);
        int cli_sock = static_cast<int>(accept(listen_sock_, reinterpret_cast<sockaddr*>(&client), &clen));
        if (!running_) {
            if (cli_sock != INVALID_SOCKET_FD) closesocket(cli_sock);
            break;
        }
        if (cli_sock == INVALID_SOCKET_FD) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        set_recv_timeout(cli_sock, CLIENT_RECV_TIMEOUT_SECONDS);
        {
            std::lock_guard<std::mutex> lk(conn_mu_);
            open_conns_.insert(cli_sock);
        }
        // one request per connection, each on its own thread
        try {
            std::thread([this, cli_sock]{ this->serve_connection(cli_sock); }).detach();
        } catch (const std::system_error &e) {
            safe_log(std::string("HttpServer: cannot spawn connection thread: ") + e.what());
            std::lock_guard<std::mutex> lk(conn_mu_);
            open_conns_.erase(cli_sock);
            closesocket(cli_sock);
        }
    }
}

void HttpServer::serve_connection(int sock_fd) {
    try {
        handle_connection(sock_fd);
    } catch (const std::exception &e) {
        safe_log(std::string("HttpServer: connection error: ") + e.what());
    }
    std::lock_guard<std::mutex> lk(conn_mu_);
    open_conns_.erase(sock_fd);
    closesocket(sock_fd);
    conn_cv_.notify_all();
}

std::string HttpServer::render(const std::string &path, const std::string &query) const {
    int topk = 10;
    std::string s_topk = get_query_param(query, "topk");
    if (!s_topk.empty()) topk = clamp_int(std::atoi(s_topk.c_str()), 1, 1000);

    if (path == "/stats") {
        return stats_json(engine_.statistics(), engine_.top_offenders(static_cast<size_t>(topk)));
    }
    if (path == "/offenders") {
        return offenders_json(engine_.top_offenders(static_cast<size_t>(topk))) + "\n";
    }
    if (path == "/metrics") {
        Stats s = engine_.statistics();
        std::ostringstream out;
        out << "# HELP deauthshield_deauth_total Deauthentication frames ingested\n";
        out << "# TYPE deauthshield_deauth_total counter\n";
        out << "deauthshield_deauth_total " << s.total_event_count << "\n";
        out << "# HELP deauthshield_alerts_total Threshold alerts raised\n";
        out << "# TYPE deauthshield_alerts_total counter\n";
        out << "deauthshield_alerts_total " << s.alert_count << "\n";
        out << "deauthshield_broadcast_total " << s.broadcast_event_count << "\n";
        out << "# HELP deauthshield_window_count Frames inside the sliding window\n";
        out << "# TYPE deauthshield_window_count gauge\n";
        out << "deauthshield_window_count " << s.window_count << "\n";
        out << "deauthshield_suspicious_macs " << s.distinct_suspicious_addresses << "\n";
        out << "deauthshield_rate_pps " << std::fixed << s.average_rate << "\n";
        out << "deauthshield_uptime_seconds " << to_seconds(s.uptime) << "\n";
        for (const auto &p : engine_.snapshot_reason_counts())
            out << "deauthshield_reason_total{code=\"" << p.first << "\"} " << p.second << "\n";
        return out.str();
    }
    return {};
}

void HttpServer::handle_connection(int sock_fd) {
    std::string req;
    if (!recv_request(sock_fd, req)) return;

    std::istringstream rs(req);
    std::string method, fullpath, proto;
    rs >> method >> fullpath >> proto;

    // headers (only Authorization is used)
    std::string line;
    std::string auth_hdr;
    std::getline(rs, line);
    while (std::getline(rs, line)) {
        if (line == "\r" || line.empty()) break;
        size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string hn = line.substr(0, c);
        std::string hv = line.substr(c + 1);
        size_t p = 0; while (p < hv.size() && std::isspace(static_cast<unsigned char>(hv[p]))) ++p;
        hv = hv.substr(p);
        if (!hv.empty() && hv.back() == '\r') hv.pop_back();
        if (HEADER_EQ(hn.c_str(), "Authorization")) auth_hdr = hv;
    }

    if (!auth_expected_header_.empty() && auth_hdr != auth_expected_header_) {
        send_all(sock_fd, http_response(401, "401 Unauthorized", "text/plain",
                                        "WWW-Authenticate: Basic realm=\"deauthshield\"\r\n"));
        return;
    }

    if (method != "GET") {
        send_all(sock_fd, http_response(405, "Only GET supported\n"));
        return;
    }

    std::string path = fullpath;
    std::string query;
    size_t qpos = fullpath.find('?');
    if (qpos != std::string::npos) {
        path = fullpath.substr(0, qpos);
        query = fullpath.substr(qpos + 1);
    }

    std::string ct = (path == "/metrics") ? "text/plain; version=0.0.4" : "application/json";
    std::string body;
    bool used_cache = false;
    {
        std::lock_guard<std::mutex> lk(cache_mu_);
        auto it = cache_.find(fullpath);
        if (it != cache_.end() && (steady_clock_t::now() - it->second.at) < cache_ttl_) {
            body = it->second.body;
            used_cache = true;
        }
    }

    if (!used_cache) {
        try {
            body = render(path, query);
        } catch (const std::exception &e) {
            safe_log(std::string("HttpServer: error building ") + path + ": " + e.what());
            send_all(sock_fd, http_response(500, std::string("error building response: ") + e.what()));
            return;
        }
        if (body.empty()) {
            send_all(sock_fd, http_response(404, "not found\n"));
            return;
        }
        std::lock_guard<std::mutex> lk(cache_mu_);
        if (cache_.size() >= 64) cache_.clear();   // query strings are client-controlled
        cache_[fullpath] =CachedBody{body, steady_clock_t::now()};
    }

    send_all(sock_fd, http_response(200, body, ct));
}
