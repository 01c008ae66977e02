// NetworkTopology.cpp
#include "NetworkTopology.hpp"

#include "ScanConfig.hpp"

#include <algorithm>
#include <iostream>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace Camscout {

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool containsText(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

} // anonymous namespace

std::string NetworkRange::cidr() const {
    return formatIpv4(baseAddress) + "/" + std::to_string(prefixLength);
}

bool NetworkRange::contains(std::uint32_t address) const {
    return (address & prefixToMask(prefixLength)) == baseAddress;
}

std::optional<std::uint32_t> parseIpv4(const std::string& text) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return std::nullopt;
    return ntohl(addr.s_addr);
}

std::string formatIpv4(std::uint32_t address) {
    in_addr addr{};
    addr.s_addr = htonl(address);
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr, buf, sizeof(buf));
    return buf;
}

std::uint32_t prefixToMask(int prefixLength) {
    if (prefixLength <= 0) return 0;
    if (prefixLength >= 32) return 0xFFFFFFFFu;
    return 0xFFFFFFFFu << (32 - prefixLength);
}

int maskToPrefix(std::uint32_t mask) {
    // Leading ones only; a non-contiguous mask stops at the first zero bit.
    int bits = 0;
    while (bits < 32 && (mask & (0x80000000u >> bits))) ++bits;
    return bits;
}

std::vector<InterfaceInfo> enumerateInterfaces() {
    std::vector<InterfaceInfo> out;
    struct ifaddrs* ifas = nullptr;
    if (getifaddrs(&ifas) != 0) {
        std::cerr << "[NetworkTopology] getifaddrs failed" << std::endl;
        return out;
    }
    for (auto* it = ifas; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (!(it->ifa_flags & IFF_UP)) continue;
        if (it->ifa_flags & IFF_LOOPBACK) continue;

        InterfaceInfo info;
        info.name = it->ifa_name ? it->ifa_name : "";
        auto addr = ntohl(reinterpret_cast<sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
        std::uint32_t mask = 0xFFFFFF00u;
        if (it->ifa_netmask) {
            mask = ntohl(reinterpret_cast<sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
        }
        info.address = formatIpv4(addr);
        info.netmask = formatIpv4(mask);
        info.prefixLength = maskToPrefix(mask);
        info.multicast = (it->ifa_flags & IFF_MULTICAST) != 0;
        out.push_back(std::move(info));
    }
    freeifaddrs(ifas);

    if (verboseLogging()) {
        for (const auto& i : out) {
            std::cout << "[NetworkTopology] " << i.name << " " << i.address << "/" << i.prefixLength << std::endl;
        }
    }
    return out;
}

InterfaceKind classifyInterface(const std::string& name) {
    static const char* virtualPrefixes[] = {
        "docker", "br-", "veth", "virbr", "vmnet", "vboxnet", "tun", "tap",
        "wg", "zt", "utun", "lo", "llw", "awdl", "bridge", "cni", "flannel", "tailscale"
    };
    static const char* virtualNames[] = {
        "VirtualBox", "VMware", "vEthernet", "Hyper-V", "Docker", "WSL", "Loopback"
    };
    for (auto p : virtualPrefixes) if (startsWith(name, p)) return InterfaceKind::Virtual;
    for (auto n : virtualNames) if (containsText(name, n)) return InterfaceKind::Virtual;

    static const char* physicalPrefixes[] = {"eth", "en", "wl", "wlan"};
    static const char* physicalNames[] = {"Ethernet", "Wi-Fi", "Local Area Connection", "Wireless"};
    for (auto p : physicalPrefixes) if (startsWith(name, p)) return InterfaceKind::Physical;
    for (auto n : physicalNames) if (containsText(name, n)) return InterfaceKind::Physical;
    return InterfaceKind::Other;
}

std::vector<NetworkRange> planRanges(const std::vector<InterfaceInfo>& interfaces) {
    std::vector<NetworkRange> physical, other, virt;
    for (const auto& info : interfaces) {
        auto addr = parseIpv4(info.address);
        if (!addr) continue;
        NetworkRange range;
        range.interfaceName = info.name;
        range.localAddress = info.address;
        range.prefixLength = info.prefixLength < kMinAutoPrefix ? 24 : info.prefixLength;
        range.baseAddress = *addr & prefixToMask(range.prefixLength);

        auto kind = classifyInterface(info.name);
        range.physical = kind == InterfaceKind::Physical;
        auto& bucket = kind == InterfaceKind::Physical ? physical
                       : kind == InterfaceKind::Other  ? other
                                                       : virt;
        // Two addresses on the same subnet are one range.
        auto sameRange = [&](const NetworkRange& r) {
            return r.baseAddress == range.baseAddress && r.prefixLength == range.prefixLength;
        };
        bool seen = std::any_of(physical.begin(), physical.end(), sameRange) ||
                    std::any_of(other.begin(), other.end(), sameRange) ||
                    std::any_of(virt.begin(), virt.end(), sameRange);
        if (!seen) bucket.push_back(std::move(range));
    }

    std::vector<NetworkRange> out;
    out.insert(out.end(), physical.begin(), physical.end());
    out.insert(out.end(), other.begin(), other.end());
    if (out.empty()) {
        out = virt;
    } else if (!virt.empty() && verboseLogging()) {
        std::cout << "[NetworkTopology] Skipping " << virt.size() << " virtual interface range(s)" << std::endl;
    }
    return out;
}

std::optional<NetworkRange> parseCidr(const std::string& text) {
    auto slash = text.find('/');
    std::string ip = text.substr(0, slash);
    int prefix = 24;
    if (slash != std::string::npos) {
        std::string bits = text.substr(slash + 1);
        if (bits.empty() || bits.size() > 2 ||
            !std::all_of(bits.begin(), bits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return std::nullopt;
        }
        prefix = std::stoi(bits);
    }
    if (prefix < kMinOverridePrefix || prefix > 32) return std::nullopt;
    auto addr = parseIpv4(ip);
    if (!addr) return std::nullopt;

    NetworkRange range;
    range.interfaceName = "custom";
    range.prefixLength = prefix;
    range.baseAddress = *addr & prefixToMask(prefix);
    range.physical = true;
    return range;
}

std::vector<std::string> candidateHosts(const NetworkRange& range) {
    std::vector<std::string> out;
    if (range.prefixLength >= 31) return out;
    std::uint64_t size = std::uint64_t{1} << (32 - range.prefixLength);
    out.reserve(static_cast<size_t>(size - 2));
    for (std::uint64_t i = 1; i + 1 < size; ++i) {
        out.push_back(formatIpv4(range.baseAddress + static_cast<std::uint32_t>(i)));
    }
    return out;
}

bool isCommonCameraSuffix(std::uint32_t address) {
    std::uint32_t last = address & 0xFFu;
    return (last >= 100 && last <= 200) || last == 64 || last == 88 || last == 156;
}

std::vector<std::string> prioritizedHosts(const NetworkRange& range, std::mt19937& rng) {
    std::vector<std::string> common, rest;
    for (auto& host : candidateHosts(range)) {
        auto addr = parseIpv4(host);
        if (addr && isCommonCameraSuffix(*addr)) common.push_back(std::move(host));
        else rest.push_back(std::move(host));
    }
    std::shuffle(rest.begin(), rest.end(), rng);
    common.insert(common.end(), rest.begin(), rest.end());
    return common;
}

} // namespace Camscout
