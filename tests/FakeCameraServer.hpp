// FakeCameraServer.hpp
// Loopback HTTP server standing in for a camera in tests.
#pragma once

#include <atomic>
#include <cctype>
#include <cstring>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include "../src/DigestAuth.hpp"

namespace CamscoutTest {

struct FakeRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers; // lowercase names
};

struct FakeResponse {
    int status{200};
    std::string reason{"OK"};
    std::vector<std::string> headers; // "Name: value"
    std::string body;
};

class FakeCameraServer {
public:
    using Handler = std::function<FakeResponse(const FakeRequest&)>;

    explicit FakeCameraServer(Handler handler) : m_handler(std::move(handler)) {}
    ~FakeCameraServer() { stop(); }

    FakeCameraServer(const FakeCameraServer&) = delete;
    FakeCameraServer& operator=(const FakeCameraServer&) = delete;

    // Binds address:port (port 0 lets the OS choose) and starts serving.
    bool start(const std::string& address = "127.0.0.1", int port = 0) {
        m_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_fd < 0) return false;
        int opt = 1;
        setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1 ||
            bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(m_fd);
            m_fd = -1;
            return false;
        }
        socklen_t len = sizeof(addr);
        if (getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0 || listen(m_fd, 64) < 0) {
            close(m_fd);
            m_fd = -1;
            return false;
        }
        m_port = ntohs(addr.sin_port);
        m_address = address;
        m_running = true;
        m_thread = std::make_unique<std::thread>(&FakeCameraServer::serve, this);
        return true;
    }

    void stop() {
        if (!m_running.exchange(false)) return;
        if (m_thread && m_thread->joinable()) m_thread->join();
        m_thread.reset();
        if (m_fd >= 0) {
            close(m_fd);
            m_fd = -1;
        }
    }

    int port() const { return m_port; }
    const std::string& address() const { return m_address; }
    int requestCount() const { return m_requests.load(); }

    // Digest-protected vendor endpoint answering body to user:password.
    static Handler digestCamera(const std::string& user, const std::string& password, const std::string& body,
                                std::atomic<int>* authorizedHits = nullptr) {
        return [=](const FakeRequest& req) {
            FakeResponse r;
            if (req.path.rfind("/axis-cgi/param.cgi", 0) != 0) {
                r.status = 404;
                r.reason = "Not Found";
                return r;
            }
            auto auth = req.headers.find("authorization");
            if (auth != req.headers.end() && checkDigest(auth->second, req.method, user, password)) {
                if (authorizedHits) ++*authorizedHits;
                r.body = body;
                r.headers.push_back("Content-Type: text/plain");
                return r;
            }
            r.status = 401;
            r.reason = "Unauthorized";
            r.headers.push_back(std::string("WWW-Authenticate: Digest realm=\"") + kRealm +
                                "\", nonce=\"" + kNonce + "\", qop=\"auth\", algorithm=\"MD5\"");
            return r;
        };
    }

    static constexpr const char* kRealm = "AXIS_ACCC8E000000";
    static constexpr const char* kNonce = "0000d1f2Ab9bc3e4d5f6a7b8c9d0e1f2a3b4c5d6";

    static bool checkDigest(const std::string& header, const std::string& method, const std::string& user,
                            const std::string& password) {
        if (header.rfind("Digest ", 0) != 0) return false;
        auto p = Camscout::parseAuthParams(header.substr(7));
        if (p["username"] != user || p["realm"] != kRealm || p["nonce"] != kNonce) return false;
        Camscout::DigestChallenge ch;
        ch.realm = kRealm;
        ch.nonce = kNonce;
        ch.qop = p["qop"];
        ch.algorithm = p["algorithm"];
        std::string expected = Camscout::computeDigestResponse(ch, {user, password}, method, p["uri"], p["nc"],
                                                               p["cnonce"]);
        return expected == p["response"];
    }

    static std::string brandBody(const std::string& prodType, const std::string& prodNbr,
                                 const std::string& serial = "ACCC8E012345") {
        return "root.Brand.Brand=AXIS\r\n"
               "root.Brand.ProdFullName=AXIS " + prodNbr + " " + prodType + "\r\n"
               "root.Brand.ProdNbr=" + prodNbr + "\r\n"
               "root.Brand.ProdShortName=AXIS " + prodNbr + "\r\n"
               "root.Brand.ProdType=" + prodType + "\r\n"
               "root.Brand.SerialNumber=" + serial + "\r\n"
               "root.Brand.WebURL=http://www.axis.com\r\n";
    }

private:
    void serve() {
        while (m_running) {
            fd_set readfds;
            FD_ZERO(&readfds);
            FD_SET(m_fd, &readfds);
            timeval timeout{};
            timeout.tv_usec = 100000;
            int activity = select(m_fd + 1, &readfds, nullptr, nullptr, &timeout);
            if (activity < 0 || !m_running) break;
            if (activity == 0) continue;

            sockaddr_in clientAddr{};
            socklen_t clientLen = sizeof(clientAddr);
            int clientFd = accept(m_fd, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
            if (clientFd < 0) continue;
            handle(clientFd);
            close(clientFd);
        }
    }

    void handle(int clientFd) {
        timeval tv{};
        tv.tv_sec = 2;
        setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string raw;
        char buffer[4096];
        while (raw.find("\r\n\r\n") == std::string::npos && raw.size() < 65536) {
            ssize_t n = recv(clientFd, buffer, sizeof(buffer), 0);
            if (n <= 0) return;
            raw.append(buffer, static_cast<size_t>(n));
        }
        ++m_requests;

        FakeRequest req;
        size_t lineEnd = raw.find("\r\n");
        std::string requestLine = raw.substr(0, lineEnd);
        size_t sp1 = requestLine.find(' ');
        size_t sp2 = requestLine.find(' ', sp1 + 1);
        req.method = requestLine.substr(0, sp1);
        req.path = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
        size_t pos = lineEnd + 2;
        while (pos < raw.size()) {
            size_t end = raw.find("\r\n", pos);
            if (end == std::string::npos || end == pos) break;
            std::string line = raw.substr(pos, end - pos);
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                std::string value = line.substr(colon + 1);
                value.erase(0, value.find_first_not_of(' '));
                req.headers[name] = value;
            }
            pos = end + 2;
        }

        FakeResponse resp = m_handler(req);
        std::string out = "HTTP/1.1 " + std::to_string(resp.status) + " " + resp.reason + "\r\n";
        for (const auto& h : resp.headers) out += h + "\r\n";
        out += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
        out += "Connection: close\r\n\r\n";
        if (req.method != "HEAD") out += resp.body;
        send(clientFd, out.data(), out.size(), MSG_NOSIGNAL);
    }

    Handler m_handler;
    int m_fd{-1};
    int m_port{0};
    std::string m_address;
    std::atomic<bool> m_running{false};
    std::atomic<int> m_requests{0};
    std::unique_ptr<std::thread> m_thread;
};

} // namespace CamscoutTest
