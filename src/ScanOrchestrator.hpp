// ScanOrchestrator.hpp
// Drives probe -> negotiate -> identify -> classify over every planned range.
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "ArpTable.hpp"
#include "Cancellation.hpp"
#include "DeviceClassifier.hpp"
#include "DeviceRegistry.hpp"
#include "HttpClient.hpp"
#include "NetworkTopology.hpp"
#include "ProtocolNegotiator.hpp"
#include "ScanConfig.hpp"
#include "ScanEvents.hpp"
#include "ServiceListener.hpp"
#include "TcpProber.hpp"

namespace Camscout {

// Runs one operation at a time. Registry, protocol cache and candidate set are
// owned by the caller so that several orchestrators can share them.
class ScanOrchestrator {
public:
    using InterfaceProvider = std::function<std::vector<InterfaceInfo>()>;

    ScanOrchestrator(DeviceRegistry& registry, ProtocolCache& cache, CandidateSet& candidates,
                     const HttpClient& http, PermissionMonitor& monitor = PermissionMonitor::instance(),
                     const ArpTable* arp = nullptr);

    // Service discovery (when enabled), then every planned range.
    ScanSummary runFullScan(const ScanConfig& config, const ScanCallbacks& callbacks = {});

    // Service discovery only.
    ScanSummary runServiceScan(const ScanConfig& config, const ScanCallbacks& callbacks = {});

    // Sweeps the given hosts of one range in the given order.
    ScanSummary sweepHosts(const NetworkRange& range, const std::vector<std::string>& hosts,
                           const ScanConfig& config, const ScanCallbacks& callbacks = {});

    // Identifies stored candidates with config.credentials, without re-probing.
    ScanSummary classifyCandidates(const ScanConfig& config, const ScanCallbacks& callbacks = {});

    // One address with the configured ports and credentials. A device that
    // rejects every credential set is still recorded as requires_auth.
    IdentifyResult testHost(const std::string& ip, const ScanConfig& config,
                            std::optional<Protocol> forceProtocol = std::nullopt);

    // Re-tests a known device with its stored credentials, or with override.
    IdentifyResult testStoredCredentials(const std::string& deviceId, const ScanConfig& config,
                                         const std::optional<CredentialSet>& override = std::nullopt);

    std::vector<InterfaceInfo> listInterfaces() const;

    // Override range or planned ranges; empty with error set when none is usable.
    std::vector<NetworkRange> planScanRanges(const ScanConfig& config, std::string& error) const;

    // Safe from any thread, including a signal handler.
    void cancel() { m_token.cancel(); }
    bool cancelRequested() const { return m_token.isCancelled(); }
    bool isRunning() const { return m_running.load(); }

    void setInterfaceProvider(InterfaceProvider provider) { m_interfaceProvider = std::move(provider); }
    void setServiceSource(ServiceSource source) { m_serviceSource = std::move(source); }

private:
    struct Toolkit;
    struct HostJob;
    struct HostOutcome;
    class RunScope;

    // Per-range bookkeeping for the early-stop policies.
    struct RangeTally {
        size_t cameras{0};
        size_t speakers{0};
    };

    HostOutcome scanHost(const HostJob& job, Toolkit& tools, const ScanConfig& config);
    void runHosts(const std::vector<HostJob>& jobs, Toolkit& tools, const ScanConfig& config,
                  const ScanCallbacks& callbacks, ScanSummary& summary, std::set<std::string>& found);
    void applyOutcome(const HostOutcome& outcome, const ScanCallbacks& callbacks, ScanSummary& summary,
                      std::set<std::string>& found, RangeTally& tally);
    bool policySatisfied(const ScanConfig& config, const RangeTally& tally) const;
    std::set<std::string> runServicePass(Toolkit& tools, const ScanConfig& config,
                                         const std::vector<NetworkRange>& ranges,
                                         const ScanCallbacks& callbacks, ScanSummary& summary,
                                         std::set<std::string>& found);
    bool deadlinePassed(ScanSummary& summary);
    void reportFatal(const std::string& message, const ScanCallbacks& callbacks, ScanSummary& summary);

    DeviceRegistry& m_registry;
    ProtocolCache& m_cache;
    CandidateSet& m_candidates;
    const HttpClient& m_http;
    PermissionMonitor& m_monitor;
    TcpProber m_prober;
    const ArpTable* m_arp;
    InterfaceProvider m_interfaceProvider;
    ServiceSource m_serviceSource;

    CancellationToken m_token;
    std::atomic<bool> m_running{false};
    bool m_hasDeadline{false};
    std::chrono::steady_clock::time_point m_deadline{};
};

} // namespace Camscout
