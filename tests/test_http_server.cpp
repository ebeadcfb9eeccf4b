// tests/test_http_server.cpp
// A client that connects and never sends must not hold up other requests
// or stop(). POSIX sockets only.

#include <iostream>
#include <string>
#include <chrono>
#include <future>
#include <cstring>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include "../src/detection_engine.hpp"
#include "../src/http_server.hpp"

namespace {

const uint16_t TEST_PORT = 18471;

int connect_local(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }
    timeval tv;
    tv.tv_sec = 3;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

std::string http_get(uint16_t port, const std::string &path) {
    int fd = connect_local(port);
    if (fd < 0) return {};
    std::string req = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    if (send(fd, req.data(), req.size(), 0) < 0) {
        close(fd);
        return {};
    }
    std::string resp;
    char buf[4096];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) resp.append(buf, buf + n);
    close(fd);
    return resp;
}

}

int main() {
    using namespace std::chrono_literals;

    DetectionEngine engine({"wlan0mon", 10, 5s});
    engine.start();
    engine.ingest({MonoClock::now(), "02:00:00:00:00:01", BROADCAST_ADDRESS, 7});

    HttpServer srv("127.0.0.1", TEST_PORT, engine, 0);
    if (!srv.start()) {
        std::cerr << "http_server: could not bind 127.0.0.1:" << TEST_PORT << "\n";
        return 2;
    }

    int idle = connect_local(TEST_PORT);
    if (idle < 0) {
        std::cerr << "http_server: idle client could not connect\n";
        return 3;
    }

    std::string resp = http_get(TEST_PORT, "/stats");
    if (resp.compare(0, 15, "HTTP/1.1 200 OK") != 0) {
        std::cerr << "http_server: /stats blocked behind an idle client, got: " << resp << "\n";
        close(idle);
        return 4;
    }
    if (resp.find("\"total_deauth\": 1") == std::string::npos) {
        std::cerr << "http_server: /stats body missing the ingested frame\n";
        close(idle);
        return 5;
    }

    auto stopped = std::async(std::launch::async, [&srv]{ srv.stop(); });
    if (stopped.wait_for(3s) != std::future_status::ready) {
        std::cerr << "http_server: stop() hung on an idle client\n";
        close(idle);
        stopped.wait();
        return 6;
    }
    close(idle);

    std::cout << "test_http_server: OK\n";
    return 0;
}
