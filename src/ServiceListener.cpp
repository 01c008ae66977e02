// ServiceListener.cpp
#include "ServiceListener.hpp"

#include "NetworkTopology.hpp"
#include "ScanConfig.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <iostream>

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Camscout {

namespace {

constexpr int kPollSliceMs = 100;

struct SocketGuard {
    int fd{-1};
    ~SocketGuard() {
        if (fd >= 0) ::close(fd);
    }
};

bool containsNoCase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

// Binds 5353 with address reuse; when another responder owns the port, falls
// back to an ephemeral port and asks for unicast replies.
int openSocket(bool& unicastResponse) {
    unicastResponse = false;
    int yes = 1;
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return -1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#ifdef SO_REUSEPORT
    setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
#endif
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(Mdns::kPort);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) return fd;

    if (verboseLogging()) {
        std::cout << "[ServiceListener] port 5353 busy (" << std::strerror(errno)
                  << "), using ephemeral port with unicast replies" << std::endl;
    }
    ::close(fd);
    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return -1;
    addr.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    unicastResponse = true;
    return fd;
}

void sendQuery(int fd, const std::vector<std::uint8_t>& query, const std::vector<in_addr>& interfaces) {
    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(Mdns::kPort);
    inet_pton(AF_INET, Mdns::kGroupAddress, &group.sin_addr);

    if (interfaces.empty()) {
        ::sendto(fd, query.data(), query.size(), 0, reinterpret_cast<sockaddr*>(&group), sizeof(group));
        return;
    }
    for (const auto& iface : interfaces) {
        setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface));
        if (::sendto(fd, query.data(), query.size(), 0, reinterpret_cast<sockaddr*>(&group), sizeof(group)) < 0 &&
            verboseLogging()) {
            std::cerr << "[ServiceListener] sendto failed: " << std::strerror(errno) << std::endl;
        }
    }
}

} // anonymous namespace

const std::vector<std::string>& defaultServiceTypes() {
    static const std::vector<std::string> types{"_axis-video._tcp.local", "_http._tcp.local", "_rtsp._tcp.local"};
    return types;
}

bool isVendorAnnouncement(const ServiceAnnouncement& a) {
    if (a.serviceType == "_axis-video._tcp.local") return true;
    if (containsNoCase(a.instance, "axis")) return true;
    for (const auto& kv : a.txt) {
        if ((kv.first == "manufacturer" || kv.first == "vendor") && containsNoCase(kv.second, "axis")) return true;
        if (kv.first == "macaddress") return true;
    }
    return false;
}

AnnouncementAssembler::AnnouncementAssembler(const std::vector<std::string>& serviceTypes) {
    for (const auto& t : serviceTypes) m_types.insert(Mdns::canonicalName(t));
}

void AnnouncementAssembler::feed(const Mdns::Message& message, const std::string& sourceIp) {
    // PTR first so that SRV/TXT in the same packet find their instance.
    for (const auto& rr : message.records) {
        if (rr.type != Mdns::TypePTR || !m_types.count(rr.name) || rr.target.empty()) continue;
        Instance& inst = m_instances[rr.target];
        inst.serviceType = rr.name;
        if (inst.sourceIp.empty()) inst.sourceIp = sourceIp;
    }
    for (const auto& rr : message.records) {
        switch (rr.type) {
            case Mdns::TypeSRV: {
                auto it = m_instances.find(rr.name);
                if (it == m_instances.end()) break;
                it->second.host = rr.target;
                it->second.port = rr.port;
                break;
            }
            case Mdns::TypeTXT: {
                auto it = m_instances.find(rr.name);
                if (it == m_instances.end()) break;
                for (const auto& kv : rr.txt) it->second.txt[kv.first] = kv.second;
                break;
            }
            case Mdns::TypeA:
                if (!rr.address.empty()) m_hostAddresses[rr.name] = rr.address;
                break;
            default:
                break;
        }
    }
}

std::vector<ServiceAnnouncement> AnnouncementAssembler::announcements() const {
    std::vector<ServiceAnnouncement> out;
    for (const auto& entry : m_instances) {
        const Instance& inst = entry.second;
        ServiceAnnouncement a;
        a.instance = entry.first;
        a.serviceType = inst.serviceType;
        a.host = inst.host;
        a.port = inst.port;
        a.txt = inst.txt;
        auto addr = m_hostAddresses.find(inst.host);
        a.ip = addr != m_hostAddresses.end() ? addr->second : inst.sourceIp;
        if (a.ip.empty()) continue;
        out.push_back(std::move(a));
    }
    return out;
}

std::vector<ServiceAnnouncement> ServiceListener::listen(const CancellationToken* cancel) const {
    bool unicastResponse = false;
    SocketGuard sock;
    sock.fd = openSocket(unicastResponse);
    if (sock.fd < 0) {
        std::cerr << "[ServiceListener] cannot open UDP socket: " << std::strerror(errno) << std::endl;
        return {};
    }

    int ttl = 255;
    setsockopt(sock.fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    std::vector<in_addr> interfaces;
    in_addr group{};
    inet_pton(AF_INET, Mdns::kGroupAddress, &group);
    for (const auto& info : enumerateInterfaces()) {
        if (!info.multicast) continue;
        in_addr iface{};
        if (inet_pton(AF_INET, info.address.c_str(), &iface) != 1) continue;
        ip_mreq mreq{};
        mreq.imr_multiaddr = group;
        mreq.imr_interface = iface;
        if (setsockopt(sock.fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0 && verboseLogging()) {
            std::cout << "[ServiceListener] join failed on " << info.name << ": " << std::strerror(errno) << std::endl;
        }
        interfaces.push_back(iface);
    }

    const auto query = Mdns::buildQuery(m_serviceTypes, unicastResponse);
    sendQuery(sock.fd, query, interfaces);

    AnnouncementAssembler assembler(m_serviceTypes);
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + std::chrono::milliseconds(m_windowMs);
    const auto requery = start + std::chrono::milliseconds(m_windowMs / 2);
    bool requeried = false;
    std::uint8_t buf[9000];
    int packets = 0;

    while (!isCancelled(cancel)) {
        int left = remainingMs(deadline);
        if (left <= 0) break;
        if (!requeried && std::chrono::steady_clock::now() >= requery) {
            sendQuery(sock.fd, query, interfaces);
            requeried = true;
        }
        pollfd pfd{sock.fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, std::min(left, kPollSliceMs));
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ServiceListener] poll failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (rc == 0) continue;

        sockaddr_in src{};
        socklen_t slen = sizeof(src);
        ssize_t n = ::recvfrom(sock.fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&src), &slen);
        if (n <= 0) continue;
        auto message = Mdns::parseMessage(buf, static_cast<size_t>(n));
        if (!message || !message->isResponse()) continue;
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
        assembler.feed(*message, ip);
        ++packets;
    }

    auto found = assembler.announcements();
    if (verboseLogging()) {
        std::cout << "[ServiceListener] " << packets << " responses, " << found.size() << " services" << std::endl;
    }
    return found;
}

ServiceSource multicastServiceSource() {
    return [](int windowMs, const CancellationToken* cancel) {
        return ServiceListener(windowMs).listen(cancel);
    };
}

} // namespace Camscout
