// ArpTable.hpp
// Kernel neighbour table lookups (Linux /proc/net/arp).
#pragma once

#include <map>
#include <optional>
#include <string>

namespace Camscout {

class ArpTable {
public:
    explicit ArpTable(std::string path = "/proc/net/arp") : m_path(std::move(path)) {}
    virtual ~ArpTable() = default;

    // Normalised MAC for ip, or nullopt when the kernel has no complete entry.
    virtual std::optional<std::string> lookup(const std::string& ip) const;

    // ip -> MAC from the text of /proc/net/arp. Incomplete entries are skipped.
    static std::map<std::string, std::string> parse(const std::string& text);

private:
    std::string m_path;
};

} // namespace Camscout
