// MdnsCodec.hpp
// Minimal DNS message encoding/decoding for multicast service discovery.
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Camscout {
namespace Mdns {

constexpr std::uint16_t kPort = 5353;
constexpr const char* kGroupAddress = "224.0.0.251";

enum RecordType : std::uint16_t {
    TypeA = 1,
    TypePTR = 12,
    TypeTXT = 16,
    TypeAAAA = 28,
    TypeSRV = 33
};

constexpr std::uint16_t kClassIn = 1;
constexpr std::uint16_t kUnicastResponseBit = 0x8000; // QU in questions, cache-flush in answers

struct ResourceRecord {
    std::string name;       // canonical, lowercase, no trailing dot
    std::uint16_t type{0};
    std::uint16_t rclass{0};
    std::uint32_t ttl{0};

    std::string target;     // PTR target or SRV target, canonical
    std::uint16_t port{0};  // SRV
    std::string address;    // A, dotted quad
    std::map<std::string, std::string> txt; // keys lowercased
};

struct Message {
    std::uint16_t id{0};
    std::uint16_t flags{0};
    bool isResponse() const { return (flags & 0x8000) != 0; }
    std::vector<std::string> questions;
    std::vector<ResourceRecord> records; // answers, authority and additional together
};

// "_HTTP._tcp.local." -> "_http._tcp.local"
std::string canonicalName(const std::string& name);

// PTR questions for each service type; unicastResponse sets the QU bit.
std::vector<std::uint8_t> buildQuery(const std::vector<std::string>& serviceTypes, bool unicastResponse);

// Decodes a datagram. Follows name compression with a loop guard; returns
// nullopt on truncation or malformed pointers.
std::optional<Message> parseMessage(const std::uint8_t* data, size_t length);

// Serialises records as a response. Used by tests to stand in for a responder.
std::vector<std::uint8_t> buildResponse(const std::vector<ResourceRecord>& records);

} // namespace Mdns
} // namespace Camscout
