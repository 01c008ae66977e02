// ScanEvents.cpp
#include "ScanEvents.hpp"

#include <cstdio>
#include <sstream>

namespace Camscout {

std::string jsonEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

namespace {

std::string quoted(const std::string& s) {
    return "\"" + jsonEscape(s) + "\"";
}

} // anonymous namespace

std::string deviceToJson(const Device& d) {
    std::ostringstream o;
    o << "{\"id\":" << quoted(d.id)
      << ",\"ip\":" << quoted(d.ip)
      << ",\"port\":" << d.port
      << ",\"protocol\":" << quoted(toString(d.protocol))
      << ",\"role\":" << quoted(toString(d.role))
      << ",\"model\":" << quoted(d.model)
      << ",\"manufacturer\":" << quoted(d.manufacturer);
    if (!d.productType.empty()) o << ",\"productType\":" << quoted(d.productType);
    if (!d.serialNumber.empty()) o << ",\"serialNumber\":" << quoted(d.serialNumber);
    if (d.mac) o << ",\"mac\":" << quoted(*d.mac);
    o << ",\"capabilities\":[";
    for (size_t i = 0; i < d.capabilities.size(); ++i) {
        if (i) o << ",";
        o << quoted(d.capabilities[i]);
    }
    o << "]"
      << ",\"discoveryMethod\":" << quoted(toString(d.discoveryMethod))
      << ",\"status\":" << quoted(toString(d.status));
    if (!d.error.empty()) o << ",\"error\":" << quoted(d.error);
    // The password never leaves the process.
    if (d.credentials) o << ",\"username\":" << quoted(d.credentials->username);
    if (d.pairedPeripheral) o << ",\"pairedPeripheral\":" << quoted(*d.pairedPeripheral);
    if (!d.alternateAddresses.empty()) {
        o << ",\"alternateAddresses\":[";
        for (size_t i = 0; i < d.alternateAddresses.size(); ++i) {
            if (i) o << ",";
            o << quoted(d.alternateAddresses[i]);
        }
        o << "]";
    }
    o << ",\"httpUrl\":" << quoted(d.httpUrl());
    if (d.role == DeviceRole::Camera) o << ",\"rtspUrl\":" << quoted(d.rtspUrl());
    o << ",\"discoveredAt\":" << quoted(d.discoveredAt);
    if (!d.rangeKey.empty()) o << ",\"range\":" << quoted(d.rangeKey);
    o << "}";
    return o.str();
}

std::string progressToJson(const ProgressEvent& e) {
    std::ostringstream o;
    o << "{\"range\":" << quoted(e.rangeKey) << ",\"ip\":" << quoted(e.ip) << ",\"phase\":" << quoted(e.phase)
      << ",\"scanned\":" << e.scanned << ",\"total\":" << e.total << "}";
    return o.str();
}

std::string summaryToJson(const ScanSummary& s) {
    std::ostringstream o;
    o << "{\"ranges\":" << s.rangesScanned << ",\"hostsScanned\":" << s.hostsScanned
      << ",\"hostsOpen\":" << s.hostsOpen << ",\"deviceCount\":" << s.devicesFound
      << ",\"candidates\":" << s.candidates << ",\"authFailures\":" << s.authFailures
      << ",\"cancelled\":" << (s.cancelled ? "true" : "false")
      << ",\"deadlineReached\":" << (s.deadlineReached ? "true" : "false")
      << ",\"fatal\":" << (s.fatal ? "true" : "false");
    if (!s.fatalError.empty()) o << ",\"error\":" << quoted(s.fatalError);
    o << ",\"elapsedMs\":" << s.elapsedMs << "}";
    return o.str();
}

void JsonLineWriter::write(const std::string& event, const std::string& payload) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << "{\"event\":" << quoted(event) << ",\"data\":" << payload << "}" << std::endl;
}

void JsonLineWriter::writeMessage(const std::string& event, const std::string& message) {
    write(event, "{\"message\":" + quoted(message) + "}");
}

ScanCallbacks JsonLineWriter::callbacks() {
    ScanCallbacks cb;
    cb.onProgress = [this](const ProgressEvent& e) { write("scan-progress", progressToJson(e)); };
    cb.onDeviceDiscovered = [this](const Device& d) { write("device-discovered", deviceToJson(d)); };
    cb.onScanComplete = [this](const ScanSummary& s) { write("scan-complete", summaryToJson(s)); };
    cb.onPermissionBlocked = [this](const std::string& m) { writeMessage("permission-blocked", m); };
    cb.onFatal = [this](const std::string& m) { writeMessage("scan-error", m); };
    return cb;
}

} // namespace Camscout
