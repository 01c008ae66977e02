// ScanError.hpp
#pragma once

#include <string>

namespace Camscout {

// Why a host did not turn into an accessible device.
enum class ScanErrorKind {
    None,
    Unreachable,         // TCP failed or timed out; excluded silently
    PermissionBlocked,   // OS refused local network access; reported once per process
    AuthUnsupported,     // endpoint answered without a Digest challenge
    AuthFailed,          // Digest retry still answered 401
    NotASupportedDevice, // authenticated but no vendor match
    TransportError,      // HTTP/TLS level failure after the port was open
    Cancelled,
    ScanFatal            // whole-scan condition, e.g. no usable interfaces
};

inline const char* toString(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::None: return "none";
        case ScanErrorKind::Unreachable: return "unreachable";
        case ScanErrorKind::PermissionBlocked: return "permission_blocked";
        case ScanErrorKind::AuthUnsupported: return "auth_unsupported";
        case ScanErrorKind::AuthFailed: return "auth_failed";
        case ScanErrorKind::NotASupportedDevice: return "not_supported";
        case ScanErrorKind::TransportError: return "transport_error";
        case ScanErrorKind::Cancelled: return "cancelled";
        case ScanErrorKind::ScanFatal: return "scan_fatal";
    }
    return "unknown";
}

// Operator-facing text for the kinds that are ever shown.
inline std::string describe(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::PermissionBlocked:
            return "Local network access appears to be blocked. Allow this application to access "
                   "devices on the local network (OS privacy settings or firewall) and scan again.";
        case ScanErrorKind::AuthUnsupported:
            return "Device does not support digest authentication";
        case ScanErrorKind::AuthFailed:
            return "Invalid username or password";
        case ScanErrorKind::NotASupportedDevice:
            return "Not a supported device";
        case ScanErrorKind::TransportError:
            return "Connection failed";
        case ScanErrorKind::Unreachable:
            return "Host unreachable";
        case ScanErrorKind::Cancelled:
            return "Cancelled";
        case ScanErrorKind::ScanFatal:
            return "No usable network interfaces";
        case ScanErrorKind::None:
            break;
    }
    return {};
}

} // namespace Camscout
