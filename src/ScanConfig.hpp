// ScanConfig.hpp
// Scan options: defaults, then CAMSCOUT_* environment, then --flag=value arguments.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Device.hpp"

namespace Camscout {

// What to do once devices have been found on a subnet.
enum class SubnetPolicy {
    ScanAllHosts,            // exhaustive (default)
    StopAtCameraSpeakerPair, // stop a range once one camera and one speaker are known
    StopAtDeviceLimit        // stop a range after maxDevicesPerSubnet devices
};

const char* toString(SubnetPolicy policy);

struct ScanConfig {
    std::optional<std::string> cidrOverride;
    std::vector<int> ports;              // empty: default port tiers
    int concurrency{20};
    std::vector<CredentialSet> credentials;
    bool useServiceDiscovery{true};
    int probeTimeoutMs{1000};
    int httpTimeoutMs{5000};
    int serviceWindowMs{3000};
    SubnetPolicy subnetPolicy{SubnetPolicy::ScanAllHosts};
    int maxDevicesPerSubnet{2};
    int deadlineMs{0};                   // 0: no wall-clock limit
    int settleDelayMs{defaultSettleDelayMs()};

    static constexpr int kMaxConcurrency = 64;

    // Defaults overlaid with CAMSCOUT_* variables.
    static ScanConfig fromEnvironment();

    // Applies one "--name=value" argument. Unknown names return false with error set.
    bool applyArgument(const std::string& arg, std::string& error);

    // Port order used by negotiation: explicit list, or the default tiers flattened.
    std::vector<int> effectivePorts() const;

    // Concurrency clamped to [1, kMaxConcurrency].
    int effectiveConcurrency() const;

    static int defaultSettleDelayMs();
};

// "443,80,8080" -> {443, 80, 8080}; rejects ports outside 1..65535.
std::optional<std::vector<int>> parsePortList(const std::string& text);

// "user:pass" -> CredentialSet; the password may itself contain ':'.
std::optional<CredentialSet> parseCredential(const std::string& text);

// Process-wide switch for informational log lines (CAMSCOUT_VERBOSE / --verbose).
bool verboseLogging();
void setVerboseLogging(bool enabled);

} // namespace Camscout
