// PreDiscovery.hpp
// Time-boxed background pass started once at launch.
#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "DeviceRegistry.hpp"
#include "ScanOrchestrator.hpp"

namespace Camscout {

struct PreDiscoverySnapshot {
    std::vector<Device> cameras;
    std::vector<Device> speakers;
    std::vector<CandidateHost> candidates;
    bool inProgress{false};
    bool complete{false};
};

class PreDiscovery {
public:
    static constexpr int kServiceTimeoutMs = 3000;
    static constexpr int kSweepBudgetMs = 10000;
    static constexpr int kSweepConcurrency = 30;

    PreDiscovery(DeviceRegistry& registry, ProtocolCache& cache, CandidateSet& candidates,
                 const HttpClient& http, PermissionMonitor& monitor = PermissionMonitor::instance(),
                 const ArpTable* arp = nullptr);
    ~PreDiscovery();

    PreDiscovery(const PreDiscovery&) = delete;
    PreDiscovery& operator=(const PreDiscovery&) = delete;

    // Starts the background pass. Only the first call does anything.
    bool start(const ScanConfig& base);

    PreDiscoverySnapshot snapshot() const;

    // True once the pass has finished (or was never needed).
    bool waitUntilComplete(int timeoutMs) const;

    void cancel();

    // Drops cached devices, candidates and negotiated protocols.
    void clear();

    // Settings the background pass runs with, derived from the caller's.
    static ScanConfig sweepConfig(const ScanConfig& base);

    ScanOrchestrator& orchestrator() { return m_orchestrator; }

private:
    void run(ScanConfig config);
    void finish();

    DeviceRegistry& m_registry;
    ProtocolCache& m_cache;
    CandidateSet& m_candidates;
    ScanOrchestrator m_orchestrator;

    std::thread m_thread;
    std::atomic<bool> m_started{false};
    std::atomic<bool> m_inProgress{false};
    std::atomic<bool> m_complete{false};
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};

} // namespace Camscout
