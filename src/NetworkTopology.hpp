// NetworkTopology.hpp
// Local interface enumeration and the address ranges worth scanning.
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Camscout {

struct InterfaceInfo {
    std::string name;
    std::string address;   // dotted quad
    std::string netmask;   // dotted quad
    int prefixLength{0};
    bool multicast{false};
};

enum class InterfaceKind { Physical, Other, Virtual };

struct NetworkRange {
    std::string interfaceName;
    std::uint32_t baseAddress{0};   // host byte order, already masked
    int prefixLength{32};
    std::string localAddress;       // our own address on the range, may be empty
    bool physical{false};

    std::string cidr() const;
    // Stable key identifying this range within one pass.
    std::string key() const { return interfaceName + "/" + cidr(); }
    bool contains(std::uint32_t address) const;
};

// IPv4 helpers, host byte order.
std::optional<std::uint32_t> parseIpv4(const std::string& text);
std::string formatIpv4(std::uint32_t address);
std::uint32_t prefixToMask(int prefixLength);
int maskToPrefix(std::uint32_t mask);

// UP, non-loopback IPv4 interfaces.
std::vector<InterfaceInfo> enumerateInterfaces();

InterfaceKind classifyInterface(const std::string& name);

// Physical ranges first, then other non-virtual ones. Virtual and tunnel
// interfaces are used only when nothing else exists. Auto-planned ranges wider
// than kMinAutoPrefix are narrowed to the /24 around the local address.
std::vector<NetworkRange> planRanges(const std::vector<InterfaceInfo>& interfaces);

constexpr int kMinAutoPrefix = 22;
constexpr int kMinOverridePrefix = 16;

// "192.168.1.0/24" -> range named "custom". Host bits are masked off.
std::optional<NetworkRange> parseCidr(const std::string& text);

// Every address except network and broadcast: /32 and /31 yield nothing.
std::vector<std::string> candidateHosts(const NetworkRange& range);

// Statistically common camera suffixes (.100-.200, .64, .88, .156) first, the
// remaining hosts shuffled behind them.
std::vector<std::string> prioritizedHosts(const NetworkRange& range, std::mt19937& rng);

bool isCommonCameraSuffix(std::uint32_t address);

} // namespace Camscout
