// ProtocolNegotiator.hpp
// Finds which port and scheme a host's web interface answers on.
#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Cancellation.hpp"
#include "Device.hpp"
#include "TcpProber.hpp"

namespace Camscout {

struct ProtocolProbeResult {
    Protocol protocol{Protocol::Https};
    int port{443};
    bool verified{false}; // false only for the fallback guess
};

// Negotiated results per IP. Shared between workers, so every call locks.
class ProtocolCache {
public:
    std::optional<ProtocolProbeResult> get(const std::string& ip) const;
    void put(const std::string& ip, const ProtocolProbeResult& result);
    void invalidate(const std::string& ip);
    void clear();
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, ProtocolProbeResult> m_entries;
};

// {443, 80} -> {8080, 8000} -> {8443, 81, 8081}
const std::vector<std::vector<int>>& defaultPortTiers();
std::vector<int> defaultPortOrder();

// https for 443 and 8443, http otherwise.
Protocol schemeForPort(int port);

Protocol otherScheme(Protocol protocol);

enum class ProbeVerdict {
    Identified,    // the vendor endpoint answered in a recognisable way
    NotIdentified, // something answered, but not the vendor
    WrongScheme    // transport failed; the other scheme may work
};

class ProtocolNegotiator {
public:
    using Identifier = std::function<ProbeVerdict(const std::string& ip, int port, Protocol protocol,
                                                  const CancellationToken* cancel)>;

    ProtocolNegotiator(ProtocolCache& cache, const TcpProber& prober, int probeTimeoutMs)
        : m_cache(cache), m_prober(prober), m_probeTimeoutMs(probeTimeoutMs) {}

    // Cached result if any; otherwise probes ports in order. The first open port
    // that passes identification wins, else the first open port unverified.
    // Nothing open: nullopt, and nothing is cached.
    std::optional<ProtocolProbeResult> negotiate(const std::string& ip, const std::vector<int>& ports,
                                                 const Identifier& identifier,
                                                 const CancellationToken* cancel = nullptr,
                                                 std::optional<Protocol> forceProtocol = std::nullopt);

    ProtocolCache& cache() { return m_cache; }

private:
    ProtocolCache& m_cache;
    const TcpProber& m_prober;
    int m_probeTimeoutMs;
};

} // namespace Camscout
