// MdnsCodec.cpp
#include "MdnsCodec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace Camscout {
namespace Mdns {

namespace {

void put16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void put32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    put16(out, static_cast<std::uint16_t>(v >> 16));
    put16(out, static_cast<std::uint16_t>(v & 0xFFFF));
}

void putName(std::vector<std::uint8_t>& out, const std::string& name) {
    size_t start = 0;
    std::string n = name;
    if (!n.empty() && n.back() == '.') n.pop_back();
    while (start <= n.size() && !n.empty()) {
        size_t dot = n.find('.', start);
        std::string label = n.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (label.size() > 63) label.resize(63);
        out.push_back(static_cast<std::uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    out.push_back(0);
}

class Reader {
public:
    Reader(const std::uint8_t* data, size_t length) : m_data(data), m_length(length) {}

    bool u16(size_t& pos, std::uint16_t& v) const {
        if (pos + 2 > m_length) return false;
        v = static_cast<std::uint16_t>((m_data[pos] << 8) | m_data[pos + 1]);
        pos += 2;
        return true;
    }

    bool u32(size_t& pos, std::uint32_t& v) const {
        std::uint16_t hi = 0, lo = 0;
        if (!u16(pos, hi) || !u16(pos, lo)) return false;
        v = (static_cast<std::uint32_t>(hi) << 16) | lo;
        return true;
    }

    // Reads a possibly compressed name starting at pos; pos ends after the
    // in-place part of the name.
    bool name(size_t& pos, std::string& out) const {
        out.clear();
        size_t cursor = pos;
        bool jumped = false;
        int hops = 0;
        while (true) {
            if (cursor >= m_length) return false;
            std::uint8_t len = m_data[cursor];
            if ((len & 0xC0) == 0xC0) {
                if (cursor + 1 >= m_length) return false;
                size_t target = static_cast<size_t>(((len & 0x3F) << 8) | m_data[cursor + 1]);
                if (!jumped) pos = cursor + 2;
                jumped = true;
                if (++hops > 32 || target >= m_length) return false;
                cursor = target;
                continue;
            }
            if ((len & 0xC0) != 0) return false;
            ++cursor;
            if (len == 0) break;
            if (cursor + len > m_length) return false;
            if (!out.empty()) out.push_back('.');
            out.append(reinterpret_cast<const char*>(m_data + cursor), len);
            cursor += len;
        }
        if (!jumped) pos = cursor;
        return true;
    }

    const std::uint8_t* data() const { return m_data; }
    size_t length() const { return m_length; }

private:
    const std::uint8_t* m_data;
    size_t m_length;
};

std::map<std::string, std::string> parseTxt(const std::uint8_t* p, size_t len) {
    std::map<std::string, std::string> txt;
    size_t i = 0;
    while (i < len) {
        size_t n = p[i++];
        if (i + n > len) break;
        std::string entry(reinterpret_cast<const char*>(p + i), n);
        i += n;
        if (entry.empty()) continue;
        size_t eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        txt[key] = eq == std::string::npos ? std::string() : entry.substr(eq + 1);
    }
    return txt;
}

} // anonymous namespace

std::string canonicalName(const std::string& name) {
    std::string out = name;
    while (!out.empty() && out.back() == '.') out.pop_back();
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::uint8_t> buildQuery(const std::vector<std::string>& serviceTypes, bool unicastResponse) {
    std::vector<std::uint8_t> out;
    put16(out, 0);       // id
    put16(out, 0);       // flags: standard query
    put16(out, static_cast<std::uint16_t>(serviceTypes.size()));
    put16(out, 0);
    put16(out, 0);
    put16(out, 0);
    for (const auto& type : serviceTypes) {
        putName(out, type);
        put16(out, TypePTR);
        put16(out, static_cast<std::uint16_t>(kClassIn | (unicastResponse ? kUnicastResponseBit : 0)));
    }
    return out;
}

std::optional<Message> parseMessage(const std::uint8_t* data, size_t length) {
    if (!data || length < 12) return std::nullopt;
    Reader r(data, length);
    Message msg;
    size_t pos = 0;
    std::uint16_t qd = 0, an = 0, ns = 0, ar = 0;
    if (!r.u16(pos, msg.id) || !r.u16(pos, msg.flags) || !r.u16(pos, qd) || !r.u16(pos, an) ||
        !r.u16(pos, ns) || !r.u16(pos, ar)) {
        return std::nullopt;
    }

    for (int i = 0; i < qd; ++i) {
        std::string name;
        std::uint16_t type = 0, qclass = 0;
        if (!r.name(pos, name) || !r.u16(pos, type) || !r.u16(pos, qclass)) return std::nullopt;
        msg.questions.push_back(canonicalName(name));
    }

    const int total = an + ns + ar;
    for (int i = 0; i < total; ++i) {
        ResourceRecord rr;
        std::string name;
        std::uint16_t rdlength = 0;
        if (!r.name(pos, name) || !r.u16(pos, rr.type) || !r.u16(pos, rr.rclass) || !r.u32(pos, rr.ttl) ||
            !r.u16(pos, rdlength)) {
            return std::nullopt;
        }
        if (pos + rdlength > length) return std::nullopt;
        rr.name = canonicalName(name);
        rr.rclass = static_cast<std::uint16_t>(rr.rclass & ~kUnicastResponseBit);
        size_t rdata = pos;

        switch (rr.type) {
            case TypePTR: {
                size_t p = rdata;
                std::string target;
                if (!r.name(p, target)) return std::nullopt;
                rr.target = canonicalName(target);
                break;
            }
            case TypeSRV: {
                size_t p = rdata;
                std::uint16_t priority = 0, weight = 0;
                std::string target;
                if (!r.u16(p, priority) || !r.u16(p, weight) || !r.u16(p, rr.port) || !r.name(p, target)) {
                    return std::nullopt;
                }
                rr.target = canonicalName(target);
                break;
            }
            case TypeA:
                if (rdlength == 4) {
                    char buf[16];
                    std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", data[rdata], data[rdata + 1],
                                  data[rdata + 2], data[rdata + 3]);
                    rr.address = buf;
                }
                break;
            case TypeTXT:
                rr.txt = parseTxt(data + rdata, rdlength);
                break;
            default:
                break;
        }
        pos = rdata + rdlength;
        msg.records.push_back(std::move(rr));
    }
    return msg;
}

std::vector<std::uint8_t> buildResponse(const std::vector<ResourceRecord>& records) {
    std::vector<std::uint8_t> out;
    put16(out, 0);
    put16(out, 0x8400); // response, authoritative
    put16(out, 0);
    put16(out, static_cast<std::uint16_t>(records.size()));
    put16(out, 0);
    put16(out, 0);
    for (const auto& rr : records) {
        putName(out, rr.name);
        put16(out, rr.type);
        put16(out, rr.rclass ? rr.rclass : kClassIn);
        put32(out, rr.ttl ? rr.ttl : 120);

        std::vector<std::uint8_t> rdata;
        switch (rr.type) {
            case TypePTR:
                putName(rdata, rr.target);
                break;
            case TypeSRV:
                put16(rdata, 0);
                put16(rdata, 0);
                put16(rdata, rr.port);
                putName(rdata, rr.target);
                break;
            case TypeA: {
                unsigned a = 0, b = 0, c = 0, d = 0;
                if (std::sscanf(rr.address.c_str(), "%u.%u.%u.%u", &a, &b, &c, &d) == 4) {
                    rdata = {static_cast<std::uint8_t>(a), static_cast<std::uint8_t>(b),
                             static_cast<std::uint8_t>(c), static_cast<std::uint8_t>(d)};
                }
                break;
            }
            case TypeTXT:
                for (const auto& kv : rr.txt) {
                    std::string entry = kv.second.empty() ? kv.first : kv.first + "=" + kv.second;
                    if (entry.size() > 255) entry.resize(255);
                    rdata.push_back(static_cast<std::uint8_t>(entry.size()));
                    rdata.insert(rdata.end(), entry.begin(), entry.end());
                }
                if (rdata.empty()) rdata.push_back(0);
                break;
            default:
                break;
        }
        put16(out, static_cast<std::uint16_t>(rdata.size()));
        out.insert(out.end(), rdata.begin(), rdata.end());
    }
    return out;
}

} // namespace Mdns
} // namespace Camscout
