// Device.hpp
// Data model shared by every stage of discovery.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Camscout {

enum class Protocol { Http, Https };
enum class DeviceRole { Camera, Speaker, Unknown };
enum class DiscoveryMethod { Scan, Service, Manual };
enum class DeviceStatus { Accessible, RequiresAuth, Error };

const char* toString(Protocol protocol);
const char* toString(DeviceRole role);
const char* toString(DiscoveryMethod method);
const char* toString(DeviceStatus status);

// Default port for a scheme (443 for https, 80 for http).
int defaultPort(Protocol protocol);

// Caller-supplied credentials. Never defaulted by the engine.
struct CredentialSet {
    std::string username;
    std::string password;

    bool operator==(const CredentialSet& other) const {
        return username == other.username && password == other.password;
    }
};

struct Device {
    std::string id;
    std::string ip;
    int port{80};
    Protocol protocol{Protocol::Http};
    DeviceRole role{DeviceRole::Unknown};
    std::string model;
    std::string manufacturer;
    std::string productType;
    std::string serialNumber;
    std::optional<std::string> mac;
    std::vector<std::string> capabilities;
    DiscoveryMethod discoveryMethod{DiscoveryMethod::Scan};
    DeviceStatus status{DeviceStatus::Error};
    std::string error;
    std::optional<CredentialSet> credentials;
    std::optional<std::string> pairedPeripheral; // ip of the speaker paired with a camera
    std::string discoveredAt;                    // ISO-8601 UTC
    std::string rangeKey;                        // NetworkRange pass the device was found on
    std::vector<std::string> alternateAddresses; // other IPs merged in by MAC

    std::string httpUrl() const;
    std::string rtspUrl() const;
};

// "camera-192-168-1-10", "speaker-..." or "device-..."
std::string makeDeviceId(DeviceRole role, const std::string& ip);

// Current UTC time, e.g. 2025-01-31T12:00:00Z
std::string nowIso8601();

// Identity of a registry entry: IP until a MAC is known, MAC afterwards.
struct IpIdentity {
    std::string ip;
};
struct MacIdentity {
    std::string mac;
};
using DeviceIdentity = std::variant<IpIdentity, MacIdentity>;

DeviceIdentity identityOf(const Device& device);
std::string identityKey(const DeviceIdentity& identity);

// Canonical MAC form AA:BB:CC:DD:EE:FF, or nullopt when text is not a MAC.
std::optional<std::string> normalizeMac(const std::string& text);

} // namespace Camscout
