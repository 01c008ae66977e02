// ServiceListener.hpp
// Passive mDNS listening for camera service announcements.
#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "Cancellation.hpp"
#include "MdnsCodec.hpp"

namespace Camscout {

struct ServiceAnnouncement {
    std::string instance;    // "axis-accc8e012345._axis-video._tcp.local"
    std::string serviceType; // "_axis-video._tcp.local"
    std::string host;        // SRV target, may be empty
    std::string ip;
    int port{0};
    std::map<std::string, std::string> txt;
};

const std::vector<std::string>& defaultServiceTypes();

// Vendor service type, "axis" in the instance name, or a vendor marker in TXT.
bool isVendorAnnouncement(const ServiceAnnouncement& announcement);

// Joins PTR -> SRV -> A records that may arrive in separate packets.
class AnnouncementAssembler {
public:
    explicit AnnouncementAssembler(const std::vector<std::string>& serviceTypes = defaultServiceTypes());

    void feed(const Mdns::Message& message, const std::string& sourceIp);

    // One entry per instance that has an address. When no A record was seen
    // the packet source address stands in.
    std::vector<ServiceAnnouncement> announcements() const;

private:
    struct Instance {
        std::string serviceType;
        std::string host;
        int port{0};
        std::map<std::string, std::string> txt;
        std::string sourceIp;
    };

    std::set<std::string> m_types;
    std::map<std::string, Instance> m_instances;
    std::map<std::string, std::string> m_hostAddresses;
};

class ServiceListener {
public:
    explicit ServiceListener(int windowMs, std::vector<std::string> serviceTypes = defaultServiceTypes())
        : m_windowMs(windowMs), m_serviceTypes(std::move(serviceTypes)) {}

    // Queries and listens for windowMs or until cancelled. Socket failures are
    // logged and yield an empty list.
    std::vector<ServiceAnnouncement> listen(const CancellationToken* cancel = nullptr) const;

    int windowMs() const { return m_windowMs; }

private:
    int m_windowMs;
    std::vector<std::string> m_serviceTypes;
};

// Injectable announcement source; the default wraps ServiceListener.
using ServiceSource = std::function<std::vector<ServiceAnnouncement>(int windowMs, const CancellationToken* cancel)>;

ServiceSource multicastServiceSource();

} // namespace Camscout
