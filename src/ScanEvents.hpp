// ScanEvents.hpp
// Progress, discovery and completion events, and their JSON-line form.
#pragma once

#include <functional>
#include <mutex>
#include <ostream>
#include <string>

#include "Device.hpp"

namespace Camscout {

struct ProgressEvent {
    std::string rangeKey;
    std::string ip;
    std::string phase;  // probing, open, closed, identified, rejected, skipped, service
    size_t scanned{0};
    size_t total{0};
};

struct ScanSummary {
    size_t rangesScanned{0};
    size_t hostsScanned{0};
    size_t hostsOpen{0};
    size_t devicesFound{0};
    size_t candidates{0};
    size_t authFailures{0};
    bool cancelled{false};
    bool deadlineReached{false};
    bool fatal{false};
    std::string fatalError;
    long long elapsedMs{0};
};

// Any member may be left empty.
struct ScanCallbacks {
    std::function<void(const ProgressEvent&)> onProgress;
    std::function<void(const Device&)> onDeviceDiscovered;
    std::function<void(const ScanSummary&)> onScanComplete;
    std::function<void(const std::string& message)> onPermissionBlocked;
    std::function<void(const std::string& message)> onFatal;
};

std::string jsonEscape(const std::string& text);
std::string deviceToJson(const Device& device);
std::string progressToJson(const ProgressEvent& event);
std::string summaryToJson(const ScanSummary& summary);

// Writes {"event":"...", ...} lines. Safe to call from several threads.
class JsonLineWriter {
public:
    explicit JsonLineWriter(std::ostream& out) : m_out(out) {}

    void write(const std::string& event, const std::string& payload);
    void writeMessage(const std::string& event, const std::string& message);

    // Callbacks that print every event.
    ScanCallbacks callbacks();

private:
    std::ostream& m_out;
    std::mutex m_mutex;
};

} // namespace Camscout
