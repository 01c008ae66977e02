// DeviceClassifier.cpp
#include "DeviceClassifier.hpp"

#include "ScanConfig.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace Camscout {

namespace {

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

const char* kSpeakerKeywords[] = {"speaker", "audio", "sound", "horn"};

} // anonymous namespace

BrandInfo parseBrandParameters(const std::string& text) {
    BrandInfo info;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.rfind("root.Brand.", 0) == 0) key = key.substr(11);
        else if (key.rfind("Brand.", 0) == 0) key = key.substr(6);

        if (key == "Brand") info.brand = value;
        else if (key == "ProdType") info.prodType = value;
        else if (key == "ProdNbr") info.prodNbr = value;
        else if (key == "ProdFullName") info.prodFullName = value;
        else if (key == "ProdShortName") info.prodShortName = value;
        else if (key == "SerialNumber") info.serialNumber = value;
        else if (key == "WebURL") info.webUrl = value;
    }
    return info;
}

bool hasVendorMarker(const BrandInfo& info) {
    return lowerCopy(info.brand) == lowerCopy(kVendorMarker);
}

const char* toString(Classification classification) {
    switch (classification) {
        case Classification::Camera: return "camera";
        case Classification::Speaker: return "speaker";
        case Classification::NotSupported: return "not_supported";
    }
    return "not_supported";
}

Classification classify(const BrandInfo& info) {
    // Product type is only trusted once the vendor marker is present.
    if (!hasVendorMarker(info)) return Classification::NotSupported;
    const std::string type = lowerCopy(info.prodType);
    for (const char* keyword : kSpeakerKeywords) {
        if (type.find(keyword) != std::string::npos) return Classification::Speaker;
    }
    return Classification::Camera;
}

std::optional<std::string> macFromSerial(const std::string& serial) {
    std::string s = trim(serial);
    if (s.size() != 12) return std::nullopt;
    return normalizeMac(s);
}

std::optional<std::string> DeviceClassifier::resolveMac(const std::string& ip, const BrandInfo& info) const {
    if (auto mac = macFromSerial(info.serialNumber)) return mac;
    if (m_arp) return m_arp->lookup(ip);
    return std::nullopt;
}

Device DeviceClassifier::buildDevice(const std::string& ip, int port, Protocol protocol, const BrandInfo& info,
                                     Classification classification, DiscoveryMethod method) const {
    Device d;
    d.role = classification == Classification::Speaker ? DeviceRole::Speaker : DeviceRole::Camera;
    d.id = makeDeviceId(d.role, ip);
    d.ip = ip;
    d.port = port;
    d.protocol = protocol;
    if (!info.prodNbr.empty()) d.model = info.prodNbr;
    else if (!info.prodShortName.empty()) d.model = info.prodShortName;
    else d.model = "Unknown Model";
    d.manufacturer = kManufacturerName;
    d.productType = info.prodType;
    d.serialNumber = info.serialNumber;
    d.mac = resolveMac(ip, info);
    d.capabilities.push_back(protocol == Protocol::Https ? "HTTPS" : "HTTP");
    if (d.role == DeviceRole::Camera) {
        d.capabilities.push_back("ACAP");
        d.capabilities.push_back("VAPIX");
        d.capabilities.push_back("RTSP");
    } else {
        d.capabilities.push_back("VAPIX");
    }
    d.discoveryMethod = method;
    d.status = DeviceStatus::Accessible;
    d.discoveredAt = nowIso8601();
    return d;
}

IdentifyResult DeviceClassifier::identify(const std::string& ip, int port, Protocol protocol,
                                          const std::vector<CredentialSet>& credentialSets,
                                          DiscoveryMethod method,
                                          const CancellationToken* cancel) const {
    IdentifyResult result;

    auto accept = [&](const std::string& body, const std::optional<CredentialSet>& creds) {
        BrandInfo info = parseBrandParameters(body);
        Classification c = classify(info);
        if (c == Classification::NotSupported) {
            result.errorKind = ScanErrorKind::NotASupportedDevice;
            result.error = describe(result.errorKind);
            return;
        }
        result.device = buildDevice(ip, port, protocol, info, c, method);
        result.device->credentials = creds;
        result.errorKind = ScanErrorKind::None;
        result.error.clear();
        if (verboseLogging()) {
            std::cout << "[Classifier] " << ip << " is a " << toString(c) << " (" << result.device->model
                      << ")" << std::endl;
        }
    };

    if (credentialSets.empty()) {
        HttpResponse r = m_auth.unauthenticatedRequest(ip, port, protocol, kBrandQueryPath, cancel);
        if (r.cancelled) {
            result.authOutcome = AuthOutcome::Cancelled;
            result.errorKind = ScanErrorKind::Cancelled;
            return result;
        }
        if (!r.transportOk) {
            result.authOutcome = AuthOutcome::TransportError;
            result.errorKind = ScanErrorKind::TransportError;
            result.error = r.error;
            return result;
        }
        if (r.status == 200) {
            result.authOutcome = AuthOutcome::Ok;
            accept(r.body, std::nullopt);
        } else if (r.status == 401 && selectDigestChallenge(r.wwwAuthenticate)) {
            result.authOutcome = AuthOutcome::AuthFailed;
            result.errorKind = ScanErrorKind::AuthFailed;
            result.error = "Credentials required";
        } else {
            result.authOutcome = AuthOutcome::AuthUnsupported;
            result.errorKind = ScanErrorKind::AuthUnsupported;
            result.error = describe(result.errorKind);
        }
        return result;
    }

    for (const auto& creds : credentialSets) {
        if (isCancelled(cancel)) {
            result.authOutcome = AuthOutcome::Cancelled;
            result.errorKind = ScanErrorKind::Cancelled;
            return result;
        }
        AuthResult auth = m_auth.authenticatedRequest(ip, port, protocol, kBrandQueryPath, "GET", creds, cancel);
        result.authOutcome = auth.outcome;
        switch (auth.outcome) {
            case AuthOutcome::Ok:
                accept(auth.body, creds);
                return result;
            case AuthOutcome::AuthFailed:
                result.errorKind = ScanErrorKind::AuthFailed;
                result.error = describe(ScanErrorKind::AuthFailed);
                continue; // next credential set
            case AuthOutcome::AuthUnsupported:
                // 401 without Digest is terminal; any other status means this is not the vendor path.
                result.errorKind = auth.status == 401 ? ScanErrorKind::AuthUnsupported
                                                      : ScanErrorKind::NotASupportedDevice;
                result.error = auth.status == 401 ? describe(ScanErrorKind::AuthUnsupported) : auth.error;
                return result;
            case AuthOutcome::HttpError:
            case AuthOutcome::TransportError:
                result.errorKind = ScanErrorKind::TransportError;
                result.error = auth.error;
                return result;
            case AuthOutcome::Cancelled:
                result.errorKind = ScanErrorKind::Cancelled;
                return result;
        }
    }

    // Every credential set was rejected by a Digest endpoint on the vendor path.
    if (method == DiscoveryMethod::Manual) {
        Device d;
        d.id = makeDeviceId(DeviceRole::Unknown, ip);
        d.ip = ip;
        d.port = port;
        d.protocol = protocol;
        d.role = DeviceRole::Unknown;
        d.model = "Unknown Model";
        d.manufacturer = kManufacturerName;
        d.discoveryMethod = method;
        d.status = DeviceStatus::RequiresAuth;
        d.error = result.error;
        d.discoveredAt = nowIso8601();
        if (m_arp) d.mac = m_arp->lookup(ip);
        result.device = d;
    }
    return result;
}

ProbeVerdict DeviceClassifier::checkVendorEndpoint(const std::string& ip, int port, Protocol protocol,
                                                   const CancellationToken* cancel) const {
    HttpResponse r = m_auth.unauthenticatedRequest(ip, port, protocol, kBrandQueryPath, cancel);
    if (r.cancelled) return ProbeVerdict::NotIdentified;
    if (!r.transportOk) return ProbeVerdict::WrongScheme;
    if (r.status == 401 && selectDigestChallenge(r.wwwAuthenticate)) return ProbeVerdict::Identified;
    if (r.status == 200 && hasVendorMarker(parseBrandParameters(r.body))) return ProbeVerdict::Identified;
    return ProbeVerdict::NotIdentified;
}

} // namespace Camscout
