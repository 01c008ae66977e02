// ScanOrchestrator.cpp
#include "ScanOrchestrator.hpp"

#include "WorkerPool.hpp"

#include <algorithm>
#include <iostream>

namespace Camscout {

namespace {

// How long the orchestrating thread waits for one result before re-checking
// cancellation and the deadline.
constexpr int kResultWaitMs = 100;

// Empty when ip lies outside every range.
std::string rangeKeyFor(const std::string& ip, const std::vector<NetworkRange>& ranges) {
    auto addr = parseIpv4(ip);
    if (addr) {
        for (const auto& r : ranges) {
            if (r.contains(*addr)) return r.key();
        }
    }
    return {};
}

long long elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
        .count();
}

} // anonymous namespace

// Per-operation helpers configured from the scan's timeouts.
struct ScanOrchestrator::Toolkit {
    DigestAuthenticator auth;
    DeviceClassifier classifier;
    ProtocolNegotiator negotiator;
    ProtocolNegotiator::Identifier identifier;

    Toolkit(const HttpClient& http, ProtocolCache& cache, const TcpProber& prober, const ArpTable* arp,
            const ScanConfig& config)
        : auth(http, config.httpTimeoutMs),
          classifier(auth, arp),
          negotiator(cache, prober, config.probeTimeoutMs) {
        identifier = [this](const std::string& ip, int port, Protocol protocol, const CancellationToken* cancel) {
            return classifier.checkVendorEndpoint(ip, port, protocol, cancel);
        };
    }

    Toolkit(const Toolkit&) = delete;
    Toolkit& operator=(const Toolkit&) = delete;
};

struct ScanOrchestrator::HostJob {
    std::string ip;
    std::string rangeKey;
    std::vector<int> ports;
    DiscoveryMethod method{DiscoveryMethod::Scan};
    std::optional<ProtocolProbeResult> endpoint; // known already, skip negotiation
};

struct ScanOrchestrator::HostOutcome {
    HostJob job;
    bool open{false};
    std::optional<ProtocolProbeResult> endpoint;
    bool identifyAttempted{false};
    IdentifyResult identify;
    bool candidate{false};
};

// Marks the orchestrator busy, resets cancellation and routes the permission
// notice to this operation's callbacks.
class ScanOrchestrator::RunScope {
public:
    RunScope(ScanOrchestrator& owner, const ScanConfig& config, const ScanCallbacks& callbacks)
        : m_owner(owner) {
        m_owner.m_token.reset();
        m_owner.m_running.store(true);
        m_owner.m_hasDeadline = config.deadlineMs > 0;
        if (m_owner.m_hasDeadline) {
            m_owner.m_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.deadlineMs);
        }
        if (callbacks.onPermissionBlocked) {
            auto forward = callbacks.onPermissionBlocked;
            m_owner.m_monitor.setListener([forward](const std::string& message) { forward(message); });
        }
    }

    ~RunScope() {
        m_owner.m_monitor.setListener(nullptr);
        m_owner.m_running.store(false);
    }

private:
    ScanOrchestrator& m_owner;
};

ScanOrchestrator::ScanOrchestrator(DeviceRegistry& registry, ProtocolCache& cache, CandidateSet& candidates,
                                   const HttpClient& http, PermissionMonitor& monitor, const ArpTable* arp)
    : m_registry(registry),
      m_cache(cache),
      m_candidates(candidates),
      m_http(http),
      m_monitor(monitor),
      m_prober(monitor),
      m_arp(arp),
      m_interfaceProvider(enumerateInterfaces),
      m_serviceSource(multicastServiceSource()) {}

std::vector<InterfaceInfo> ScanOrchestrator::listInterfaces() const {
    return m_interfaceProvider ? m_interfaceProvider() : std::vector<InterfaceInfo>{};
}

std::vector<NetworkRange> ScanOrchestrator::planScanRanges(const ScanConfig& config, std::string& error) const {
    error.clear();
    if (config.cidrOverride) {
        auto range = parseCidr(*config.cidrOverride);
        if (!range) {
            error = "Invalid CIDR range: " + *config.cidrOverride;
            return {};
        }
        return {*range};
    }
    auto ranges = planRanges(listInterfaces());
    if (ranges.empty()) error = describe(ScanErrorKind::ScanFatal);
    return ranges;
}

bool ScanOrchestrator::deadlinePassed(ScanSummary& summary) {
    if (!m_hasDeadline || std::chrono::steady_clock::now() < m_deadline) return false;
    if (!summary.deadlineReached) {
        summary.deadlineReached = true;
        if (verboseLogging()) std::cout << "[Scan] deadline reached, stopping" << std::endl;
    }
    m_token.cancel();
    return true;
}

void ScanOrchestrator::reportFatal(const std::string& message, const ScanCallbacks& callbacks,
                                   ScanSummary& summary) {
    if (summary.fatal) return;
    summary.fatal = true;
    summary.fatalError = message;
    std::cerr << "[Scan] " << message << std::endl;
    if (callbacks.onFatal) callbacks.onFatal(message);
}

ScanOrchestrator::HostOutcome ScanOrchestrator::scanHost(const HostJob& job, Toolkit& tools,
                                                         const ScanConfig& config) {
    HostOutcome out;
    out.job = job;
    const CancellationToken* cancel = &m_token;

    if (job.endpoint) {
        out.endpoint = job.endpoint;
        m_cache.put(job.ip, *job.endpoint);
    } else {
        out.endpoint = tools.negotiator.negotiate(job.ip, job.ports, tools.identifier, cancel);
    }
    if (!out.endpoint) return out;
    out.open = true;

    if (config.credentials.empty()) {
        // Without credentials a vendor-looking host is only remembered.
        out.candidate = out.endpoint->verified;
        return out;
    }

    out.identifyAttempted = true;
    out.identify = tools.classifier.identify(job.ip, out.endpoint->port, out.endpoint->protocol,
                                             config.credentials, job.method, cancel);
    return out;
}

bool ScanOrchestrator::policySatisfied(const ScanConfig& config, const RangeTally& tally) const {
    switch (config.subnetPolicy) {
        case SubnetPolicy::ScanAllHosts:
            return false;
        case SubnetPolicy::StopAtCameraSpeakerPair:
            return tally.cameras > 0 && tally.speakers > 0;
        case SubnetPolicy::StopAtDeviceLimit:
            return config.maxDevicesPerSubnet > 0 &&
                   tally.cameras + tally.speakers >= static_cast<size_t>(config.maxDevicesPerSubnet);
    }
    return false;
}

void ScanOrchestrator::applyOutcome(const HostOutcome& outcome, const ScanCallbacks& callbacks,
                                    ScanSummary& summary, std::set<std::string>& found, RangeTally& tally) {
    const HostJob& job = outcome.job;
    ++summary.hostsScanned;
    if (outcome.open) ++summary.hostsOpen;

    std::string phase = outcome.open ? "open" : "closed";

    if (outcome.candidate) {
        m_candidates.add(CandidateHost{job.ip, outcome.endpoint->port, outcome.endpoint->protocol, job.rangeKey});
        ++summary.candidates;
        phase = "candidate";
    }

    if (outcome.identifyAttempted) {
        const IdentifyResult& r = outcome.identify;
        if (r.errorKind == ScanErrorKind::AuthFailed) {
            ++summary.authFailures;
            // Worth another try once different credentials are supplied.
            m_candidates.add(CandidateHost{job.ip, outcome.endpoint->port, outcome.endpoint->protocol, job.rangeKey});
            std::cerr << "[Scan] " << job.ip << ": " << r.error << std::endl;
            phase = "auth_failed";
        } else if (r.errorKind != ScanErrorKind::None) {
            if (verboseLogging()) {
                std::cout << "[Scan] " << job.ip << ": " << toString(r.errorKind)
                          << (r.error.empty() ? "" : " (" + r.error + ")") << std::endl;
            }
            phase = "rejected";
        }

        if (r.device) {
            Device device = *r.device;
            device.rangeKey = job.rangeKey;
            Device stored;
            UpsertResult res = m_registry.upsert(device, &stored);
            if (stored.status == DeviceStatus::Accessible) m_candidates.remove(job.ip);
            if (res != UpsertResult::Unchanged) {
                found.insert(stored.ip);
                if (callbacks.onDeviceDiscovered) callbacks.onDeviceDiscovered(stored);
            }
            if (stored.role == DeviceRole::Camera) ++tally.cameras;
            if (stored.role == DeviceRole::Speaker) ++tally.speakers;
            for (const auto& camera : m_registry.attachPeripherals(job.rangeKey)) {
                if (callbacks.onDeviceDiscovered) callbacks.onDeviceDiscovered(camera);
            }
            phase = "identified";
        }
    }

    if (callbacks.onProgress) {
        ProgressEvent e;
        e.rangeKey = job.rangeKey;
        e.ip = job.ip;
        e.phase = phase;
        e.scanned = summary.hostsScanned;
        callbacks.onProgress(e);
    }
}

void ScanOrchestrator::runHosts(const std::vector<HostJob>& jobs, Toolkit& tools, const ScanConfig& config,
                                const ScanCallbacks& callbacks, ScanSummary& summary,
                                std::set<std::string>& found) {
    if (jobs.empty()) return;

    const size_t concurrency = static_cast<size_t>(config.effectiveConcurrency());
    WorkerPool<HostOutcome> pool(std::min(concurrency, jobs.size()), concurrency * 2);

    // Progress counters are per range; the summary keeps the running totals.
    ScanSummary local;
    RangeTally tally;
    size_t next = 0;
    size_t submitted = 0;
    size_t completed = 0;
    bool stop = false;
    bool policyStop = false;

    ScanCallbacks rangeCallbacks = callbacks;
    rangeCallbacks.onProgress = [&](const ProgressEvent& e) {
        if (!callbacks.onProgress) return;
        ProgressEvent copy = e;
        copy.scanned = completed;
        copy.total = jobs.size();
        callbacks.onProgress(copy);
    };

    while (true) {
        if (!stop && (deadlinePassed(summary) || isCancelled(&m_token) || policyStop)) {
            stop = true;
            submitted -= pool.discardPending();
        }
        while (!stop && next < jobs.size()) {
            const HostJob& job = jobs[next];
            if (!pool.trySubmit([this, &job, &tools, &config] { return scanHost(job, tools, config); })) break;
            ++next;
            ++submitted;
        }
        if (completed == submitted && (stop || next == jobs.size())) break;

        auto outcome = pool.nextResult(kResultWaitMs);
        if (!outcome) continue;
        ++completed;
        applyOutcome(*outcome, rangeCallbacks, local, found, tally);

        if (!policyStop && policySatisfied(config, tally)) {
            policyStop = true;
            if (verboseLogging()) {
                std::cout << "[Scan] " << jobs.front().rangeKey << ": policy " << toString(config.subnetPolicy)
                          << " satisfied, skipping " << (jobs.size() - next) << " hosts" << std::endl;
            }
        }
    }

    summary.hostsScanned += local.hostsScanned;
    summary.hostsOpen += local.hostsOpen;
    summary.candidates += local.candidates;
    summary.authFailures += local.authFailures;
}

std::set<std::string> ScanOrchestrator::runServicePass(Toolkit& tools, const ScanConfig& config,
                                                       const std::vector<NetworkRange>& ranges,
                                                       const ScanCallbacks& callbacks, ScanSummary& summary,
                                                       std::set<std::string>& found) {
    std::set<std::string> handled;
    if (!m_serviceSource) return handled;

    auto announcements = m_serviceSource(config.serviceWindowMs, &m_token);
    if (isCancelled(&m_token)) return handled;

    std::vector<HostJob> jobs;
    std::set<std::string> queued;
    for (const auto& a : announcements) {
        if (!isVendorAnnouncement(a) || queued.count(a.ip)) continue;
        queued.insert(a.ip);

        HostJob job;
        job.ip = a.ip;
        // Outside every planned range: no range pass, so never paired.
        job.rangeKey = rangeKeyFor(a.ip, ranges);
        job.method = DiscoveryMethod::Service;
        if (a.port > 0 && a.serviceType.find("_rtsp.") == std::string::npos) job.ports.push_back(a.port);
        for (int p : config.effectivePorts()) {
            if (std::find(job.ports.begin(), job.ports.end(), p) == job.ports.end()) job.ports.push_back(p);
        }
        if (callbacks.onProgress) {
            callbacks.onProgress(ProgressEvent{job.rangeKey, job.ip, "service", 0, 0});
        }
        jobs.push_back(std::move(job));
    }
    if (verboseLogging()) {
        std::cout << "[Scan] service discovery: " << announcements.size() << " announcements, " << jobs.size()
                  << " vendor hosts" << std::endl;
    }

    runHosts(jobs, tools, config, callbacks, summary, found);

    for (const auto& job : jobs) {
        if (found.count(job.ip) || m_candidates.contains(job.ip) || m_registry.contains(job.ip)) {
            handled.insert(job.ip);
        }
    }
    return handled;
}

ScanSummary ScanOrchestrator::runFullScan(const ScanConfig& config, const ScanCallbacks& callbacks) {
    const auto start = std::chrono::steady_clock::now();
    RunScope scope(*this, config, callbacks);
    ScanSummary summary;
    std::set<std::string> found;
    Toolkit tools(m_http, m_cache, m_prober, m_arp, config);

    std::string error;
    auto ranges = planScanRanges(config, error);
    if (ranges.empty()) reportFatal(error, callbacks, summary);

    std::set<std::string> serviceHosts;
    if (config.useServiceDiscovery && !deadlinePassed(summary)) {
        serviceHosts = runServicePass(tools, config, ranges, callbacks, summary, found);
    }

    for (const auto& range : ranges) {
        if (isCancelled(&m_token) || deadlinePassed(summary)) break;
        std::vector<HostJob> jobs;
        for (const auto& ip : candidateHosts(range)) {
            if (serviceHosts.count(ip)) continue;
            jobs.push_back(HostJob{ip, range.key(), config.effectivePorts(), DiscoveryMethod::Scan, std::nullopt});
        }
        if (verboseLogging()) {
            std::cout << "[Scan] " << range.key() << ": " << jobs.size() << " hosts, concurrency "
                      << config.effectiveConcurrency() << std::endl;
        }
        runHosts(jobs, tools, config, callbacks, summary, found);
        ++summary.rangesScanned;
    }

    summary.devicesFound = found.size();
    summary.cancelled = isCancelled(&m_token) && !summary.deadlineReached;
    summary.elapsedMs = elapsedSince(start);
    if (callbacks.onScanComplete) callbacks.onScanComplete(summary);
    return summary;
}

ScanSummary ScanOrchestrator::runServiceScan(const ScanConfig& config, const ScanCallbacks& callbacks) {
    const auto start = std::chrono::steady_clock::now();
    RunScope scope(*this, config, callbacks);
    ScanSummary summary;
    std::set<std::string> found;
    Toolkit tools(m_http, m_cache, m_prober, m_arp, config);

    std::string error;
    auto ranges = planScanRanges(config, error);
    runServicePass(tools, config, ranges, callbacks, summary, found);

    summary.devicesFound = found.size();
    summary.cancelled = isCancelled(&m_token) && !summary.deadlineReached;
    summary.elapsedMs = elapsedSince(start);
    if (callbacks.onScanComplete) callbacks.onScanComplete(summary);
    return summary;
}

ScanSummary ScanOrchestrator::sweepHosts(const NetworkRange& range, const std::vector<std::string>& hosts,
                                         const ScanConfig& config, const ScanCallbacks& callbacks) {
    const auto start = std::chrono::steady_clock::now();
    RunScope scope(*this, config, callbacks);
    ScanSummary summary;
    std::set<std::string> found;
    Toolkit tools(m_http, m_cache, m_prober, m_arp, config);

    std::vector<HostJob> jobs;
    for (const auto& ip : hosts) {
        if (m_registry.contains(ip) || m_candidates.contains(ip)) continue;
        jobs.push_back(HostJob{ip, range.key(), config.effectivePorts(), DiscoveryMethod::Scan, std::nullopt});
    }
    runHosts(jobs, tools, config, callbacks, summary, found);
    summary.rangesScanned = 1;

    summary.devicesFound = found.size();
    summary.cancelled = isCancelled(&m_token) && !summary.deadlineReached;
    summary.elapsedMs = elapsedSince(start);
    if (callbacks.onScanComplete) callbacks.onScanComplete(summary);
    return summary;
}

ScanSummary ScanOrchestrator::classifyCandidates(const ScanConfig& config, const ScanCallbacks& callbacks) {
    const auto start = std::chrono::steady_clock::now();
    RunScope scope(*this, config, callbacks);
    ScanSummary summary;
    std::set<std::string> found;
    Toolkit tools(m_http, m_cache, m_prober, m_arp, config);

    if (config.credentials.empty()) {
        reportFatal("Credentials are required to classify candidates", callbacks, summary);
    } else {
        std::vector<HostJob> jobs;
        for (const auto& c : m_candidates.list()) {
            ProtocolProbeResult endpoint{c.protocol, c.port, true};
            jobs.push_back(HostJob{c.ip, c.rangeKey, {c.port}, DiscoveryMethod::Scan, endpoint});
        }
        runHosts(jobs, tools, config, callbacks, summary, found);
    }

    summary.devicesFound = found.size();
    summary.cancelled = isCancelled(&m_token) && !summary.deadlineReached;
    summary.elapsedMs = elapsedSince(start);
    if (callbacks.onScanComplete) callbacks.onScanComplete(summary);
    return summary;
}

IdentifyResult ScanOrchestrator::testHost(const std::string& ip, const ScanConfig& config,
                                          std::optional<Protocol> forceProtocol) {
    RunScope scope(*this, config, {});
    Toolkit tools(m_http, m_cache, m_prober, m_arp, config);
    IdentifyResult result;

    if (!parseIpv4(ip)) {
        result.errorKind = ScanErrorKind::Unreachable;
        result.error = "Invalid IPv4 address: " + ip;
        return result;
    }
    if (forceProtocol) {
        auto cached = m_cache.get(ip);
        if (cached && cached->protocol != *forceProtocol) m_cache.invalidate(ip);
    }

    auto endpoint = tools.negotiator.negotiate(ip, config.effectivePorts(), tools.identifier, &m_token,
                                               forceProtocol);
    if (!endpoint) {
        result.errorKind = isCancelled(&m_token) ? ScanErrorKind::Cancelled : ScanErrorKind::Unreachable;
        result.error = describe(result.errorKind);
        return result;
    }

    result = tools.classifier.identify(ip, endpoint->port, endpoint->protocol, config.credentials,
                                       DiscoveryMethod::Manual, &m_token);
    if (result.device) {
        std::string error;
        result.device->rangeKey = rangeKeyFor(ip, planScanRanges(config, error));
        Device stored;
        m_registry.upsert(*result.device, &stored);
        if (stored.status == DeviceStatus::Accessible) m_candidates.remove(ip);
        result.device = stored;
    }
    return result;
}

IdentifyResult ScanOrchestrator::testStoredCredentials(const std::string& deviceId, const ScanConfig& config,
                                                       const std::optional<CredentialSet>& override) {
    RunScope scope(*this, config, {});
    Toolkit tools(m_http, m_cache, m_prober, m_arp, config);
    IdentifyResult result;

    auto device = m_registry.findById(deviceId);
    if (!device) {
        result.errorKind = ScanErrorKind::NotASupportedDevice;
        result.error = "Unknown device: " + deviceId;
        return result;
    }

    std::vector<CredentialSet> credentials;
    if (override) credentials.push_back(*override);
    else if (device->credentials) credentials.push_back(*device->credentials);
    else credentials = config.credentials;
    if (credentials.empty()) {
        result.errorKind = ScanErrorKind::AuthFailed;
        result.error = "No credentials stored for " + deviceId;
        return result;
    }

    result = tools.classifier.identify(device->ip, device->port, device->protocol, credentials,
                                       DiscoveryMethod::Manual, &m_token);

    Device updated = *device;
    if (result.device) {
        updated = *result.device;
        updated.discoveryMethod = device->discoveryMethod;
        updated.rangeKey = device->rangeKey;
        if (updated.role == DeviceRole::Camera) updated.pairedPeripheral = device->pairedPeripheral;
        if (!updated.mac) updated.mac = device->mac;
    } else if (result.errorKind != ScanErrorKind::Cancelled) {
        updated.status = DeviceStatus::Error;
        updated.error = result.error.empty() ? describe(result.errorKind) : result.error;
    }
    m_registry.replace(updated);
    if (updated.status == DeviceStatus::Accessible) m_candidates.remove(updated.ip);
    result.device = m_registry.findByIp(updated.ip);

    if (verboseLogging()) {
        std::cout << "[Scan] re-test " << deviceId << " -> " << toString(updated.status) << std::endl;
    }
    return result;
}

} // namespace Camscout
