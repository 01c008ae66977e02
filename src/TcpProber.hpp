// TcpProber.hpp
// Cheap TCP liveness check: a handshake and nothing else.
#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "Cancellation.hpp"

namespace Camscout {

enum class ProbeOutcome {
    Open,
    Refused,
    TimedOut,
    HostUnreachable,
    NetworkUnreachable,
    PermissionDenied,
    Error,
    Cancelled
};

const char* toString(ProbeOutcome outcome);

// Records that the OS appears to be blocking local network access. The first
// report in a process is logged and forwarded to the listener; later reports
// only keep the flag set.
class PermissionMonitor {
public:
    using Listener = std::function<void(const std::string& message)>;

    static PermissionMonitor& instance();

    // Returns true when this call was the first report.
    bool report(int err, const std::string& host);
    bool blocked() const { return m_blocked.load(); }
    void setListener(Listener listener);
    void reset();

    // errno values treated as a missing local-network grant on this platform.
    static bool isPermissionPattern(int err);

private:
    PermissionMonitor() = default;
    PermissionMonitor(const PermissionMonitor&) = delete;
    PermissionMonitor& operator=(const PermissionMonitor&) = delete;

    std::atomic<bool> m_blocked{false};
    std::atomic<bool> m_reported{false};
    mutable std::mutex m_mutex;
    Listener m_listener;
};

class TcpProber {
public:
    explicit TcpProber(PermissionMonitor& monitor = PermissionMonitor::instance())
        : m_monitor(monitor) {}

    // Non-blocking connect bounded by timeoutMs. The deadline is enforced on the
    // socket itself because some networks silently drop SYNs instead of rejecting.
    ProbeOutcome probe(const std::string& host, int port, int timeoutMs,
                       const CancellationToken* cancel = nullptr) const;

    bool probeOpen(const std::string& host, int port, int timeoutMs,
                   const CancellationToken* cancel = nullptr) const {
        return probe(host, port, timeoutMs, cancel) == ProbeOutcome::Open;
    }

private:
    ProbeOutcome classifyError(int err, const std::string& host) const;

    PermissionMonitor& m_monitor;
};

} // namespace Camscout
