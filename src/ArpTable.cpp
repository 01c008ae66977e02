// ArpTable.cpp
#include "ArpTable.hpp"

#include "Device.hpp"

#include <fstream>
#include <sstream>

namespace Camscout {

std::map<std::string, std::string> ArpTable::parse(const std::string& text) {
    std::map<std::string, std::string> entries;
    std::istringstream in(text);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) { header = false; continue; }
        // IP address  HW type  Flags  HW address  Mask  Device
        std::istringstream fields(line);
        std::string ip, hwType, flags, hw;
        if (!(fields >> ip >> hwType >> flags >> hw)) continue;
        if (flags == "0x0") continue;
        if (auto mac = normalizeMac(hw)) entries[ip] = *mac;
    }
    return entries;
}

std::optional<std::string> ArpTable::lookup(const std::string& ip) const {
    std::ifstream file(m_path);
    if (!file) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto entries = parse(buffer.str());
    auto it = entries.find(ip);
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

} // namespace Camscout
