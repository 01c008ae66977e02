// Device.cpp
#include "Device.hpp"

#include <cctype>
#include <ctime>
#include <type_traits>

namespace Camscout {

const char* toString(Protocol protocol) {
    return protocol == Protocol::Https ? "https" : "http";
}

const char* toString(DeviceRole role) {
    switch (role) {
        case DeviceRole::Camera: return "camera";
        case DeviceRole::Speaker: return "speaker";
        case DeviceRole::Unknown: break;
    }
    return "unknown";
}

const char* toString(DiscoveryMethod method) {
    switch (method) {
        case DiscoveryMethod::Scan: return "scan";
        case DiscoveryMethod::Service: return "service";
        case DiscoveryMethod::Manual: return "manual";
    }
    return "scan";
}

const char* toString(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Accessible: return "accessible";
        case DeviceStatus::RequiresAuth: return "requires_auth";
        case DeviceStatus::Error: break;
    }
    return "error";
}

int defaultPort(Protocol protocol) {
    return protocol == Protocol::Https ? 443 : 80;
}

std::string Device::httpUrl() const {
    return std::string(toString(protocol)) + "://" + ip + ":" + std::to_string(port);
}

std::string Device::rtspUrl() const {
    // Credentials are never embedded; the consumer authenticates the stream itself.
    return "rtsp://" + ip + ":554/axis-media/media.amp";
}

std::string makeDeviceId(DeviceRole role, const std::string& ip) {
    std::string id = role == DeviceRole::Camera    ? "camera-"
                     : role == DeviceRole::Speaker ? "speaker-"
                                                   : "device-";
    for (char c : ip) id.push_back(c == '.' || c == ':' ? '-' : c);
    return id;
}

std::string nowIso8601() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

DeviceIdentity identityOf(const Device& device) {
    if (device.mac && !device.mac->empty()) return MacIdentity{*device.mac};
    return IpIdentity{device.ip};
}

std::string identityKey(const DeviceIdentity& identity) {
    return std::visit([](const auto& id) -> std::string {
        using T = std::decay_t<decltype(id)>;
        if constexpr (std::is_same_v<T, MacIdentity>) {
            return "mac:" + id.mac;
        } else {
            return "ip:" + id.ip;
        }
    }, identity);
}

std::optional<std::string> normalizeMac(const std::string& text) {
    std::string hex;
    for (char c : text) {
        if (c == ':' || c == '-' || c == '.') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (hex.size() != 12 || hex == "000000000000") return std::nullopt;
    std::string out;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!out.empty()) out.push_back(':');
        out.append(hex, i, 2);
    }
    return out;
}

} // namespace Camscout
