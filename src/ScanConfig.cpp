// ScanConfig.cpp
#include "ScanConfig.hpp"

#include "ProtocolNegotiator.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Camscout {

namespace {

std::atomic<bool> g_verbose{false};

bool envFlag(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    std::string s(v);
    return s == "1" || s == "true" || s == "yes";
}

std::optional<int> parseInt(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool envInt(const char* name, int& out) {
    const char* v = std::getenv(name);
    if (!v) return false;
    auto parsed = parseInt(v);
    if (!parsed || *parsed < 0) {
        std::cerr << "[ScanConfig] Ignoring invalid " << name << "=" << v << std::endl;
        return false;
    }
    out = *parsed;
    return true;
}

bool takeValue(const std::string& arg, const std::string& prefix, std::string& value) {
    if (arg.rfind(prefix, 0) != 0) return false;
    value = arg.substr(prefix.size());
    return true;
}

} // anonymous namespace

const char* toString(SubnetPolicy policy) {
    switch (policy) {
        case SubnetPolicy::ScanAllHosts: return "all";
        case SubnetPolicy::StopAtCameraSpeakerPair: return "pair";
        case SubnetPolicy::StopAtDeviceLimit: return "limit";
    }
    return "all";
}

int ScanConfig::defaultSettleDelayMs() {
#ifdef __APPLE__
    // Local network permission is granted asynchronously after the first attempt.
    return 3000;
#else
    return 0;
#endif
}

ScanConfig ScanConfig::fromEnvironment() {
    ScanConfig config;
    if (const char* cidr = std::getenv("CAMSCOUT_CIDR")) {
        if (*cidr) config.cidrOverride = cidr;
    }
    if (const char* ports = std::getenv("CAMSCOUT_PORTS")) {
        if (auto parsed = parsePortList(ports)) {
            config.ports = *parsed;
        } else {
            std::cerr << "[ScanConfig] Ignoring invalid CAMSCOUT_PORTS=" << ports << std::endl;
        }
    }
    envInt("CAMSCOUT_CONCURRENCY", config.concurrency);
    envInt("CAMSCOUT_PROBE_TIMEOUT_MS", config.probeTimeoutMs);
    envInt("CAMSCOUT_HTTP_TIMEOUT_MS", config.httpTimeoutMs);
    envInt("CAMSCOUT_SERVICE_WINDOW_MS", config.serviceWindowMs);
    envInt("CAMSCOUT_SETTLE_MS", config.settleDelayMs);
    if (envFlag("CAMSCOUT_NO_SERVICES")) config.useServiceDiscovery = false;
    if (envFlag("CAMSCOUT_VERBOSE")) setVerboseLogging(true);
    return config;
}

bool ScanConfig::applyArgument(const std::string& arg, std::string& error) {
    std::string value;
    if (takeValue(arg, "--cidr=", value)) {
        cidrOverride = value;
    } else if (takeValue(arg, "--ports=", value)) {
        auto parsed = parsePortList(value);
        if (!parsed) {
            error = "invalid port list: " + value;
            return false;
        }
        ports = *parsed;
    } else if (takeValue(arg, "--credentials=", value)) {
        auto cred = parseCredential(value);
        if (!cred) {
            error = "credentials must be user:password";
            return false;
        }
        credentials.push_back(*cred);
    } else if (arg == "--no-services") {
        useServiceDiscovery = false;
    } else if (arg == "--services") {
        useServiceDiscovery = true;
    } else if (arg == "--verbose") {
        setVerboseLogging(true);
    } else if (takeValue(arg, "--policy=", value)) {
        if (value == "all") subnetPolicy = SubnetPolicy::ScanAllHosts;
        else if (value == "pair") subnetPolicy = SubnetPolicy::StopAtCameraSpeakerPair;
        else if (value == "limit") subnetPolicy = SubnetPolicy::StopAtDeviceLimit;
        else {
            error = "policy must be all, pair or limit";
            return false;
        }
    } else {
        struct IntFlag { const char* prefix; int* target; };
        const IntFlag intFlags[] = {
            {"--concurrency=", &concurrency},
            {"--probe-timeout-ms=", &probeTimeoutMs},
            {"--http-timeout-ms=", &httpTimeoutMs},
            {"--service-window-ms=", &serviceWindowMs},
            {"--max-per-subnet=", &maxDevicesPerSubnet},
            {"--deadline-ms=", &deadlineMs},
            {"--settle-ms=", &settleDelayMs},
        };
        for (const auto& flag : intFlags) {
            if (takeValue(arg, flag.prefix, value)) {
                auto parsed = parseInt(value);
                if (!parsed || *parsed < 0) {
                    error = std::string("invalid value for ") + flag.prefix + value;
                    return false;
                }
                *flag.target = *parsed;
                return true;
            }
        }
        error = "unknown option: " + arg;
        return false;
    }
    return true;
}

std::vector<int> ScanConfig::effectivePorts() const {
    if (!ports.empty()) return ports;
    return defaultPortOrder();
}

int ScanConfig::effectiveConcurrency() const {
    return std::clamp(concurrency, 1, kMaxConcurrency);
}

std::optional<std::vector<int>> parsePortList(const std::string& text) {
    std::vector<int> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto port = parseInt(item);
        if (!port || *port < 1 || *port > 65535) return std::nullopt;
        if (std::find(out.begin(), out.end(), *port) == out.end()) out.push_back(*port);
    }
    if (out.empty()) return std::nullopt;
    return out;
}

std::optional<CredentialSet> parseCredential(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0) return std::nullopt;
    return CredentialSet{text.substr(0, colon), text.substr(colon + 1)};
}

bool verboseLogging() {
    return g_verbose.load();
}

void setVerboseLogging(bool enabled) {
    g_verbose.store(enabled);
}

} // namespace Camscout
