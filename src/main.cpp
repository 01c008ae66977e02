// main.cpp
#include "ArpTable.hpp"
#include "DeviceRegistry.hpp"
#include "HttpClient.hpp"
#include "NetworkTopology.hpp"
#include "PreDiscovery.hpp"
#include "ProtocolNegotiator.hpp"
#include "ScanConfig.hpp"
#include "ScanEvents.hpp"
#include "ScanOrchestrator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace Camscout;

namespace {

std::atomic<ScanOrchestrator*> g_active{nullptr};
std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
    if (ScanOrchestrator* o = g_active.load()) o->cancel();
}

void printUsage() {
    std::cerr << "Usage: camscout <command> [options]\n"
              << "Commands:\n"
              << "  scan         full discovery (service discovery + address sweep)\n"
              << "  services     service discovery only\n"
              << "  cache        run the startup pre-discovery pass and print its cache\n"
              << "  classify     pre-discovery, then identify its candidates with --credentials\n"
              << "  test-ip      --ip=A.B.C.D [--protocol=http|https] test one address\n"
              << "  test-device  --id=DEVICE_ID [--retest=user:pass] scan, then re-test a known device\n"
              << "  interfaces   list local interfaces and the ranges a scan would use\n"
              << "Options:\n"
              << "  --cidr=A.B.C.D/N  --ports=443,80  --concurrency=N  --credentials=user:pass (repeatable)\n"
              << "  --no-services  --policy=all|pair|limit  --max-per-subnet=N  --deadline-ms=N\n"
              << "  --probe-timeout-ms=N  --http-timeout-ms=N  --service-window-ms=N  --settle-ms=N\n"
              << "  --wait-ms=N (cache/classify)  --verbose\n";
}

std::string snapshotJson(const PreDiscoverySnapshot& s) {
    std::ostringstream o;
    o << "{\"inProgress\":" << (s.inProgress ? "true" : "false")
      << ",\"complete\":" << (s.complete ? "true" : "false") << ",\"cameras\":[";
    for (size_t i = 0; i < s.cameras.size(); ++i) o << (i ? "," : "") << deviceToJson(s.cameras[i]);
    o << "],\"speakers\":[";
    for (size_t i = 0; i < s.speakers.size(); ++i) o << (i ? "," : "") << deviceToJson(s.speakers[i]);
    o << "],\"candidates\":[";
    for (size_t i = 0; i < s.candidates.size(); ++i) {
        const auto& c = s.candidates[i];
        o << (i ? "," : "") << "{\"ip\":\"" << jsonEscape(c.ip) << "\",\"port\":" << c.port
          << ",\"protocol\":\"" << toString(c.protocol) << "\"}";
    }
    o << "]}";
    return o.str();
}

std::string identifyJson(const std::string& target, const IdentifyResult& r) {
    std::ostringstream o;
    o << "{\"target\":\"" << jsonEscape(target) << "\",\"ok\":" << (r.identified() ? "true" : "false")
      << ",\"outcome\":\"" << toString(r.errorKind) << "\"";
    if (!r.error.empty()) o << ",\"error\":\"" << jsonEscape(r.error) << "\"";
    if (r.device) o << ",\"device\":" << deviceToJson(*r.device);
    o << "}";
    return o.str();
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 2;
    }
    const std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        printUsage();
        return 0;
    }

    ScanConfig config = ScanConfig::fromEnvironment();
    std::string ip;
    std::string deviceId;
    std::optional<Protocol> protocol;
    std::optional<CredentialSet> retest;
    int waitMs = 15000;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        const std::string ipFlag = "--ip=";
        const std::string idFlag = "--id=";
        const std::string protoFlag = "--protocol=";
        const std::string retestFlag = "--retest=";
        const std::string waitFlag = "--wait-ms=";

        if (arg.rfind(ipFlag, 0) == 0) ip = arg.substr(ipFlag.size());
        else if (arg.rfind(idFlag, 0) == 0) deviceId = arg.substr(idFlag.size());
        else if (arg.rfind(protoFlag, 0) == 0) {
            std::string p = arg.substr(protoFlag.size());
            if (p == "http") protocol = Protocol::Http;
            else if (p == "https") protocol = Protocol::Https;
            else {
                std::cerr << "[main] Unknown protocol: " << p << std::endl;
                return 2;
            }
        } else if (arg.rfind(retestFlag, 0) == 0) {
            retest = parseCredential(arg.substr(retestFlag.size()));
            if (!retest) {
                std::cerr << "[main] Expected --retest=user:pass" << std::endl;
                return 2;
            }
        } else if (arg.rfind(waitFlag, 0) == 0) {
            waitMs = std::atoi(arg.substr(waitFlag.size()).c_str());
        } else {
            std::string error;
            if (!config.applyArgument(arg, error)) {
                std::cerr << "[main] " << error << std::endl;
                printUsage();
                return 2;
            }
        }
    }

    HttpClient http;
    DeviceRegistry registry;
    ProtocolCache cache;
    CandidateSet candidates;
    ArpTable arp;
    JsonLineWriter writer(std::cout);
    ScanCallbacks callbacks = writer.callbacks();

    ScanOrchestrator orchestrator(registry, cache, candidates, http, PermissionMonitor::instance(), &arp);
    g_active.store(&orchestrator);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    int rc = 0;
    if (command == "scan") {
        ScanSummary s = orchestrator.runFullScan(config, callbacks);
        rc = s.fatal ? 1 : 0;
    } else if (command == "services") {
        orchestrator.runServiceScan(config, callbacks);
    } else if (command == "cache" || command == "classify") {
        if (command == "classify" && config.credentials.empty()) {
            std::cerr << "[main] classify needs at least one --credentials=user:pass" << std::endl;
            return 2;
        }
        PreDiscovery pre(registry, cache, candidates, http, PermissionMonitor::instance(), &arp);
        g_active.store(&pre.orchestrator());
        pre.start(config);
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(waitMs);
        while (!pre.waitUntilComplete(100)) {
            if (g_interrupted.load() || std::chrono::steady_clock::now() >= until) {
                pre.cancel();
                pre.waitUntilComplete(waitMs);
                break;
            }
        }
        writer.write("cache", snapshotJson(pre.snapshot()));
        g_active.store(&orchestrator);
        if (command == "classify" && !g_interrupted.load()) {
            orchestrator.classifyCandidates(config, callbacks);
        }
    } else if (command == "test-ip") {
        if (ip.empty()) {
            std::cerr << "[main] test-ip needs --ip=A.B.C.D" << std::endl;
            return 2;
        }
        IdentifyResult r = orchestrator.testHost(ip, config, protocol);
        writer.write("test-result", identifyJson(ip, r));
        rc = r.identified() ? 0 : 1;
    } else if (command == "test-device") {
        if (deviceId.empty()) {
            std::cerr << "[main] test-device needs --id=DEVICE_ID" << std::endl;
            return 2;
        }
        orchestrator.runFullScan(config, callbacks);
        IdentifyResult r = orchestrator.testStoredCredentials(deviceId, config, retest);
        writer.write("test-result", identifyJson(deviceId, r));
        rc = r.identified() ? 0 : 1;
    } else if (command == "interfaces") {
        for (const auto& iface : orchestrator.listInterfaces()) {
            std::ostringstream o;
            o << "{\"name\":\"" << jsonEscape(iface.name) << "\",\"address\":\"" << iface.address
              << "\",\"netmask\":\"" << iface.netmask << "\",\"prefix\":" << iface.prefixLength
              << ",\"kind\":\""
              << (classifyInterface(iface.name) == InterfaceKind::Physical  ? "physical"
                  : classifyInterface(iface.name) == InterfaceKind::Virtual ? "virtual"
                                                                            : "other")
              << "\"}";
            writer.write("interface", o.str());
        }
        std::string error;
        for (const auto& range : orchestrator.planScanRanges(config, error)) {
            writer.write("range", "{\"key\":\"" + jsonEscape(range.key()) + "\",\"hosts\":" +
                                      std::to_string(candidateHosts(range).size()) + "}");
        }
        if (!error.empty()) writer.writeMessage("scan-error", error);
    } else {
        std::cerr << "[main] Unknown command: " << command << std::endl;
        printUsage();
        rc = 2;
    }

    g_active.store(nullptr);
    return rc;
}
