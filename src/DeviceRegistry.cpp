// DeviceRegistry.cpp
#include "DeviceRegistry.hpp"

#include <algorithm>
#include <iostream>

#include "ScanConfig.hpp"

namespace Camscout {

namespace {
constexpr size_t npos = static_cast<size_t>(-1);

void addAlternate(Device& d, const std::string& ip) {
    if (ip.empty() || ip == d.ip) return;
    if (std::find(d.alternateAddresses.begin(), d.alternateAddresses.end(), ip) == d.alternateAddresses.end()) {
        d.alternateAddresses.push_back(ip);
    }
}
} // anonymous namespace

size_t DeviceRegistry::indexOfIp(const std::string& ip) const {
    for (size_t i = 0; i < m_devices.size(); ++i) {
        const Device& d = m_devices[i];
        if (d.ip == ip) return i;
        if (std::find(d.alternateAddresses.begin(), d.alternateAddresses.end(), ip) != d.alternateAddresses.end()) {
            return i;
        }
    }
    return npos;
}

size_t DeviceRegistry::indexOfMac(const std::string& mac, size_t skip) const {
    for (size_t i = 0; i < m_devices.size(); ++i) {
        if (i != skip && m_devices[i].mac && *m_devices[i].mac == mac) return i;
    }
    return npos;
}

bool DeviceRegistry::sameContent(const Device& a, const Device& b) {
    return a.id == b.id && a.ip == b.ip && a.port == b.port && a.protocol == b.protocol && a.role == b.role &&
           a.model == b.model && a.mac == b.mac && a.status == b.status && a.error == b.error &&
           a.credentials == b.credentials && a.pairedPeripheral == b.pairedPeripheral &&
           a.alternateAddresses == b.alternateAddresses && a.capabilities == b.capabilities;
}

void DeviceRegistry::mergeInto(Device& existing, const Device& incoming) {
    const bool upgrade = incoming.status == DeviceStatus::Accessible || existing.status != DeviceStatus::Accessible;
    if (upgrade) {
        std::string discoveredAt = existing.discoveredAt;
        DiscoveryMethod method = existing.discoveryMethod;
        std::string ip = existing.ip;
        std::vector<std::string> alternates = existing.alternateAddresses;
        std::optional<std::string> mac = existing.mac;
        std::optional<std::string> paired = existing.pairedPeripheral;

        existing = incoming;
        existing.ip = ip;
        existing.id = makeDeviceId(existing.role, ip);
        existing.discoveredAt = discoveredAt.empty() ? incoming.discoveredAt : discoveredAt;
        existing.discoveryMethod = method;
        existing.alternateAddresses = alternates;
        if (!existing.mac) existing.mac = mac;
        if (!existing.pairedPeripheral && existing.role == DeviceRole::Camera) existing.pairedPeripheral = paired;
        if (existing.role != DeviceRole::Camera) existing.pairedPeripheral.reset();
    } else if (!existing.mac && incoming.mac) {
        existing.mac = incoming.mac;
    }
    addAlternate(existing, incoming.ip);
}

UpsertResult DeviceRegistry::upsert(const Device& device, Device* stored) {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t index = indexOfIp(device.ip);
    if (index == npos && device.mac) index = indexOfMac(*device.mac, npos);

    if (index == npos) {
        m_devices.push_back(device);
        if (stored) *stored = device;
        return UpsertResult::Added;
    }

    Device before = m_devices[index];
    mergeInto(m_devices[index], device);

    // A newly learned MAC may reveal that another entry is the same device.
    if (m_devices[index].mac) {
        size_t other = indexOfMac(*m_devices[index].mac, index);
        if (other != npos) {
            Device& keep = m_devices[index];
            const Device& gone = m_devices[other];
            addAlternate(keep, gone.ip);
            for (const auto& alt : gone.alternateAddresses) addAlternate(keep, alt);
            if (verboseLogging()) {
                std::cout << "[Registry] merged " << gone.ip << " into " << keep.ip << " (same MAC)" << std::endl;
            }
            m_devices.erase(m_devices.begin() + static_cast<std::ptrdiff_t>(other));
            if (other < index) --index;
        }
    }

    if (stored) *stored = m_devices[index];
    return sameContent(before, m_devices[index]) ? UpsertResult::Unchanged : UpsertResult::Updated;
}

void DeviceRegistry::replace(const Device& device) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t index = indexOfIp(device.ip);
    if (index == npos) {
        m_devices.push_back(device);
        return;
    }
    Device& existing = m_devices[index];
    std::string discoveredAt = existing.discoveredAt;
    std::vector<std::string> alternates = existing.alternateAddresses;
    std::string ip = existing.ip;
    existing = device;
    existing.ip = ip;
    existing.discoveredAt = discoveredAt;
    existing.alternateAddresses = alternates;
}

std::optional<Device> DeviceRegistry::findByIp(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t index = indexOfIp(ip);
    if (index == npos) return std::nullopt;
    return m_devices[index];
}

std::optional<Device> DeviceRegistry::findById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& d : m_devices) {
        if (d.id == id) return d;
    }
    return std::nullopt;
}

bool DeviceRegistry::contains(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return indexOfIp(ip) != npos;
}

std::vector<Device> DeviceRegistry::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices;
}

std::vector<Device> DeviceRegistry::cameras() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Device> out;
    for (const auto& d : m_devices) {
        if (d.role == DeviceRole::Camera) out.push_back(d);
    }
    return out;
}

std::vector<Device> DeviceRegistry::speakers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Device> out;
    for (const auto& d : m_devices) {
        if (d.role == DeviceRole::Speaker) out.push_back(d);
    }
    return out;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices.size();
}

std::vector<Device> DeviceRegistry::attachPeripherals(const std::string& rangeKey) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Device> changed;
    if (rangeKey.empty()) return changed;

    auto speaker = std::find_if(m_devices.begin(), m_devices.end(), [&](const Device& d) {
        return d.role == DeviceRole::Speaker && d.rangeKey == rangeKey;
    });
    if (speaker == m_devices.end()) return changed;
    const std::string speakerIp = speaker->ip;

    for (auto& d : m_devices) {
        if (d.role != DeviceRole::Camera || d.rangeKey != rangeKey || d.pairedPeripheral) continue;
        d.pairedPeripheral = speakerIp;
        changed.push_back(d);
    }
    return changed;
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_devices.clear();
}

void CandidateSet::add(const CandidateHost& candidate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hosts[candidate.ip] = candidate;
}

void CandidateSet::remove(const std::string& ip) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hosts.erase(ip);
}

bool CandidateSet::contains(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hosts.count(ip) != 0;
}

std::vector<CandidateHost> CandidateSet::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CandidateHost> out;
    out.reserve(m_hosts.size());
    for (const auto& kv : m_hosts) out.push_back(kv.second);
    return out;
}

size_t CandidateSet::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hosts.size();
}

void CandidateSet::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hosts.clear();
}

} // namespace Camscout
