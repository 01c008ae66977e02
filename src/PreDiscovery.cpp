// PreDiscovery.cpp
#include "PreDiscovery.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <random>

namespace Camscout {

PreDiscovery::PreDiscovery(DeviceRegistry& registry, ProtocolCache& cache, CandidateSet& candidates,
                           const HttpClient& http, PermissionMonitor& monitor, const ArpTable* arp)
    : m_registry(registry),
      m_cache(cache),
      m_candidates(candidates),
      m_orchestrator(registry, cache, candidates, http, monitor, arp) {}

PreDiscovery::~PreDiscovery() {
    cancel();
    if (m_thread.joinable()) m_thread.join();
}

ScanConfig PreDiscovery::sweepConfig(const ScanConfig& base) {
    ScanConfig config = base;
    config.credentials.clear();
    if (config.ports.empty()) config.ports = {80, 443};
    config.concurrency = kSweepConcurrency;
    config.deadlineMs = kSweepBudgetMs;
    config.subnetPolicy = SubnetPolicy::ScanAllHosts;
    if (config.serviceWindowMs > kServiceTimeoutMs) config.serviceWindowMs = kServiceTimeoutMs;
    return config;
}

bool PreDiscovery::start(const ScanConfig& base) {
    if (m_started.exchange(true)) return false;
    m_inProgress.store(true);
    m_thread = std::thread(&PreDiscovery::run, this, sweepConfig(base));
    return true;
}

void PreDiscovery::run(ScanConfig config) {
    const auto start = std::chrono::steady_clock::now();

    if (config.settleDelayMs > 0) {
        if (verboseLogging()) {
            std::cout << "[PreDiscovery] waiting " << config.settleDelayMs << " ms for network access" << std::endl;
        }
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, std::chrono::milliseconds(config.settleDelayMs),
                      [this] { return m_cancelled.load(); });
    }
    if (m_cancelled.load()) {
        finish();
        return;
    }

    ScanCallbacks callbacks;
    callbacks.onProgress = [this](const ProgressEvent&) {
        if (m_cancelled.load()) m_orchestrator.cancel();
    };

    if (config.useServiceDiscovery) {
        bool timedOut = false;
        auto service = std::async(std::launch::async, [this, &config, &callbacks] {
            return m_orchestrator.runServiceScan(config, callbacks);
        });
        if (service.wait_for(std::chrono::milliseconds(kServiceTimeoutMs)) == std::future_status::timeout) {
            if (verboseLogging()) std::cout << "[PreDiscovery] service discovery timed out" << std::endl;
            timedOut = true;
            m_orchestrator.cancel();
        }
        service.get();
        // Any other cancel ends the whole pass; the sweep would reset the token.
        if (!timedOut && m_orchestrator.cancelRequested()) m_cancelled.store(true);
    }

    if (!m_cancelled.load()) {
        std::string error;
        auto ranges = m_orchestrator.planScanRanges(config, error);
        if (ranges.empty()) {
            std::cerr << "[PreDiscovery] " << error << std::endl;
        } else {
            std::mt19937 rng(std::random_device{}());
            const NetworkRange& primary = ranges.front();
            // The service pass already spent part of the budget.
            int left = kSweepBudgetMs - static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count()) + config.settleDelayMs;
            config.deadlineMs = left > 0 ? left : 1;
            m_orchestrator.sweepHosts(primary, prioritizedHosts(primary, rng), config, callbacks);
        }
    }

    if (verboseLogging()) {
        std::cout << "[PreDiscovery] done: " << m_registry.size() << " devices, " << m_candidates.size()
                  << " candidates" << std::endl;
    }
    finish();
}

void PreDiscovery::finish() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inProgress.store(false);
        m_complete.store(true);
    }
    m_cv.notify_all();
}

PreDiscoverySnapshot PreDiscovery::snapshot() const {
    PreDiscoverySnapshot s;
    s.cameras = m_registry.cameras();
    s.speakers = m_registry.speakers();
    s.candidates = m_candidates.list();
    s.inProgress = m_inProgress.load();
    s.complete = m_complete.load();
    return s;
}

bool PreDiscovery::waitUntilComplete(int timeoutMs) const {
    if (!m_started.load()) return true;
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return m_complete.load(); });
}

void PreDiscovery::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled.store(true);
    }
    m_orchestrator.cancel();
    m_cv.notify_all();
}

void PreDiscovery::clear() {
    m_registry.clear();
    m_candidates.clear();
    m_cache.clear();
}

} // namespace Camscout
