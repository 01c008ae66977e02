// ProtocolNegotiator.cpp
#include "ProtocolNegotiator.hpp"

#include "ScanConfig.hpp"

#include <iostream>

namespace Camscout {

std::optional<ProtocolProbeResult> ProtocolCache::get(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(ip);
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

void ProtocolCache::put(const std::string& ip, const ProtocolProbeResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[ip] = result;
}

void ProtocolCache::invalidate(const std::string& ip) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(ip);
}

void ProtocolCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

size_t ProtocolCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

const std::vector<std::vector<int>>& defaultPortTiers() {
    static const std::vector<std::vector<int>> tiers{{443, 80}, {8080, 8000}, {8443, 81, 8081}};
    return tiers;
}

std::vector<int> defaultPortOrder() {
    std::vector<int> ports;
    for (const auto& tier : defaultPortTiers()) ports.insert(ports.end(), tier.begin(), tier.end());
    return ports;
}

Protocol schemeForPort(int port) {
    return (port == 443 || port == 8443) ? Protocol::Https : Protocol::Http;
}

Protocol otherScheme(Protocol protocol) {
    return protocol == Protocol::Https ? Protocol::Http : Protocol::Https;
}

std::optional<ProtocolProbeResult> ProtocolNegotiator::negotiate(const std::string& ip,
                                                                 const std::vector<int>& ports,
                                                                 const Identifier& identifier,
                                                                 const CancellationToken* cancel,
                                                                 std::optional<Protocol> forceProtocol) {
    if (auto cached = m_cache.get(ip)) return cached;

    const std::vector<int> order = ports.empty() ? defaultPortOrder() : ports;

    if (forceProtocol) {
        // The caller asserted the scheme; only the port still has to be found.
        for (int port : order) {
            if (isCancelled(cancel)) return std::nullopt;
            if (!m_prober.probeOpen(ip, port, m_probeTimeoutMs, cancel)) continue;
            ProtocolProbeResult result{*forceProtocol, port, true};
            m_cache.put(ip, result);
            return result;
        }
        return std::nullopt;
    }

    std::optional<int> firstOpen;
    for (int port : order) {
        if (isCancelled(cancel)) return std::nullopt;
        if (!m_prober.probeOpen(ip, port, m_probeTimeoutMs, cancel)) continue;
        if (!firstOpen) firstOpen = port;
        if (!identifier) break;

        Protocol primary = schemeForPort(port);
        ProbeVerdict verdict = identifier(ip, port, primary, cancel);
        if (verdict == ProbeVerdict::Identified) {
            ProtocolProbeResult result{primary, port, true};
            m_cache.put(ip, result);
            return result;
        }
        if (verdict == ProbeVerdict::WrongScheme && !isCancelled(cancel)) {
            Protocol alternate = otherScheme(primary);
            if (identifier(ip, port, alternate, cancel) == ProbeVerdict::Identified) {
                ProtocolProbeResult result{alternate, port, true};
                m_cache.put(ip, result);
                return result;
            }
        }
    }

    if (!firstOpen || isCancelled(cancel)) return std::nullopt;

    ProtocolProbeResult guess{schemeForPort(*firstOpen), *firstOpen, false};
    if (verboseLogging()) {
        std::cout << "[Negotiator] " << ip << " unverified, using " << toString(guess.protocol)
                  << ":" << guess.port << std::endl;
    }
    m_cache.put(ip, guess);
    return guess;
}

} // namespace Camscout
