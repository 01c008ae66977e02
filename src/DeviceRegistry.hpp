// DeviceRegistry.hpp
// Deduplicated set of discovered devices, plus unauthenticated candidates.
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Device.hpp"

namespace Camscout {

enum class UpsertResult { Added, Updated, Unchanged };

// Entries are keyed by IP. A MAC seen on a second IP folds that IP into the
// existing entry's alternateAddresses instead of creating a duplicate.
class DeviceRegistry {
public:
    // Merges device into the registry and returns the stored entry through stored.
    UpsertResult upsert(const Device& device, Device* stored = nullptr);

    // Overwrites the entry for device.ip, keeping its discoveredAt.
    void replace(const Device& device);

    std::optional<Device> findByIp(const std::string& ip) const;
    std::optional<Device> findById(const std::string& id) const;
    bool contains(const std::string& ip) const;

    std::vector<Device> all() const;
    std::vector<Device> cameras() const;
    std::vector<Device> speakers() const;
    size_t size() const;

    // Links the first speaker of rangeKey to every camera of rangeKey that has
    // no peripheral yet. Returns the cameras that changed.
    std::vector<Device> attachPeripherals(const std::string& rangeKey);

    void clear();

private:
    // Index into m_devices, or npos.
    size_t indexOfIp(const std::string& ip) const;
    size_t indexOfMac(const std::string& mac, size_t skip) const;
    static bool sameContent(const Device& a, const Device& b);
    static void mergeInto(Device& existing, const Device& incoming);

    mutable std::mutex m_mutex;
    std::vector<Device> m_devices; // discovery order
};

struct CandidateHost {
    std::string ip;
    int port{80};
    Protocol protocol{Protocol::Http};
    std::string rangeKey;
};

// Hosts that answered like the vendor but could not be authenticated yet.
class CandidateSet {
public:
    void add(const CandidateHost& candidate);
    void remove(const std::string& ip);
    bool contains(const std::string& ip) const;
    std::vector<CandidateHost> list() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, CandidateHost> m_hosts;
};

} // namespace Camscout
