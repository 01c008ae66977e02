// TcpProber.cpp
#include "TcpProber.hpp"

#include "ScanError.hpp"

#include <chrono>
#include <cstring>
#include <iostream>

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace Camscout {

namespace {

// Poll granularity; bounds how long a cancelled probe keeps its socket.
constexpr int kPollSliceMs = 50;

// Closes the descriptor on every return path.
struct SocketGuard {
    int fd{-1};
    ~SocketGuard() {
        if (fd >= 0) ::close(fd);
    }
};

} // anonymous namespace

const char* toString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Open: return "open";
        case ProbeOutcome::Refused: return "refused";
        case ProbeOutcome::TimedOut: return "timeout";
        case ProbeOutcome::HostUnreachable: return "host_unreachable";
        case ProbeOutcome::NetworkUnreachable: return "network_unreachable";
        case ProbeOutcome::PermissionDenied: return "permission_denied";
        case ProbeOutcome::Error: return "error";
        case ProbeOutcome::Cancelled: return "cancelled";
    }
    return "error";
}

PermissionMonitor& PermissionMonitor::instance() {
    static PermissionMonitor monitor;
    return monitor;
}

bool PermissionMonitor::isPermissionPattern(int err) {
    if (err == EACCES || err == EPERM) return true;
#ifdef __APPLE__
    // macOS 15+ answers EHOSTUNREACH for every local host until access is granted.
    if (err == EHOSTUNREACH) return true;
#endif
    return false;
}

bool PermissionMonitor::report(int err, const std::string& host) {
    m_blocked.store(true);
    if (m_reported.exchange(true)) return false;

    std::string message = describe(ScanErrorKind::PermissionBlocked);
    std::cerr << "[TcpProber] Connection to " << host << " failed with " << std::strerror(err)
              << ". " << message << std::endl;

    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (listener) listener(message);
    return true;
}

void PermissionMonitor::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void PermissionMonitor::reset() {
    m_blocked.store(false);
    m_reported.store(false);
}

ProbeOutcome TcpProber::classifyError(int err, const std::string& host) const {
    if (PermissionMonitor::isPermissionPattern(err)) {
        m_monitor.report(err, host);
        return err == EHOSTUNREACH ? ProbeOutcome::HostUnreachable : ProbeOutcome::PermissionDenied;
    }
    switch (err) {
        case ECONNREFUSED: return ProbeOutcome::Refused;
        case ETIMEDOUT: return ProbeOutcome::TimedOut;
        case EHOSTUNREACH:
        case EHOSTDOWN: return ProbeOutcome::HostUnreachable;
        case ENETUNREACH:
        case ENETDOWN: return ProbeOutcome::NetworkUnreachable;
        default: return ProbeOutcome::Error;
    }
}

ProbeOutcome TcpProber::probe(const std::string& host, int port, int timeoutMs,
                              const CancellationToken* cancel) const {
    if (isCancelled(cancel)) return ProbeOutcome::Cancelled;
    if (port <= 0 || port > 65535) return ProbeOutcome::Error;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;
    addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res) != 0 || !res) {
        return ProbeOutcome::Error;
    }
    sockaddr_storage target{};
    socklen_t targetLen = res->ai_addrlen;
    std::memcpy(&target, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);

    SocketGuard sock;
    sock.fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock.fd < 0) return classifyError(errno, host);

    int flags = fcntl(sock.fd, F_GETFL, 0);
    fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK);

    timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    setsockopt(sock.fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    int rc = ::connect(sock.fd, reinterpret_cast<sockaddr*>(&target), targetLen);
    if (rc == 0) return ProbeOutcome::Open;
    if (errno != EINPROGRESS) return classifyError(errno, host);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        if (isCancelled(cancel)) return ProbeOutcome::Cancelled;
        int left = remainingMs(deadline);
        if (left <= 0) return ProbeOutcome::TimedOut;

        pollfd pfd{};
        pfd.fd = sock.fd;
        pfd.events = POLLOUT;
        int ready = ::poll(&pfd, 1, left < kPollSliceMs ? left : kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return classifyError(errno, host);
        }
        if (ready == 0) continue;

        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
            return classifyError(errno, host);
        }
        if (error == 0) return ProbeOutcome::Open;
        return classifyError(error, host);
    }
}

} // namespace Camscout
