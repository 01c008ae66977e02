// DeviceClassifier.hpp
// Vendor parameter probe and camera/speaker classification.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ArpTable.hpp"
#include "Cancellation.hpp"
#include "Device.hpp"
#include "DigestAuth.hpp"
#include "ProtocolNegotiator.hpp"
#include "ScanError.hpp"

namespace Camscout {

constexpr const char* kBrandQueryPath = "/axis-cgi/param.cgi?action=list&group=Brand";
constexpr const char* kVendorMarker = "AXIS";
constexpr const char* kManufacturerName = "Axis Communications";

struct BrandInfo {
    std::string brand;
    std::string prodType;
    std::string prodNbr;
    std::string prodFullName;
    std::string prodShortName;
    std::string serialNumber;
    std::string webUrl;
};

// key=value lines, keys optionally prefixed "root.Brand." or "Brand.".
BrandInfo parseBrandParameters(const std::string& text);

bool hasVendorMarker(const BrandInfo& info);

enum class Classification { Camera, Speaker, NotSupported };

const char* toString(Classification classification);

// Requires the vendor marker. Speaker keywords in ProdType make a speaker, anything else a camera.
Classification classify(const BrandInfo& info);

// The serial number is the MAC on this vendor's devices.
std::optional<std::string> macFromSerial(const std::string& serial);

struct IdentifyResult {
    std::optional<Device> device;
    ScanErrorKind errorKind{ScanErrorKind::None};
    AuthOutcome authOutcome{AuthOutcome::TransportError};
    std::string error;

    bool identified() const { return device.has_value() && device->status == DeviceStatus::Accessible; }
};

class DeviceClassifier {
public:
    explicit DeviceClassifier(const DigestAuthenticator& auth, const ArpTable* arp = nullptr)
        : m_auth(auth), m_arp(arp) {}

    // Tries each credential set in order until one is accepted. With no
    // credential sets only an unauthenticated 200 can identify the device.
    // When every set is rejected a manual lookup still yields a requires_auth
    // Device; scan lookups yield none.
    IdentifyResult identify(const std::string& ip, int port, Protocol protocol,
                            const std::vector<CredentialSet>& credentialSets,
                            DiscoveryMethod method,
                            const CancellationToken* cancel = nullptr) const;

    // Unauthenticated check of the vendor endpoint: 401 with a Digest challenge
    // or 200 carrying the vendor marker.
    ProbeVerdict checkVendorEndpoint(const std::string& ip, int port, Protocol protocol,
                                     const CancellationToken* cancel = nullptr) const;

    Device buildDevice(const std::string& ip, int port, Protocol protocol, const BrandInfo& info,
                       Classification classification, DiscoveryMethod method) const;

private:
    std::optional<std::string> resolveMac(const std::string& ip, const BrandInfo& info) const;

    const DigestAuthenticator& m_auth;
    const ArpTable* m_arp;
};

} // namespace Camscout
