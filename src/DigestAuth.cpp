// DigestAuth.cpp
#include "DigestAuth.hpp"

#include "ScanConfig.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#include <openssl/md5.h>
#include <openssl/rand.h>

namespace Camscout {

namespace {

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string toHex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) oss << std::setw(2) << static_cast<int>(data[i]);
    return oss.str();
}

// Position just after a standalone "Digest" scheme token, or npos.
size_t findDigestScheme(const std::string& header) {
    std::string lower = toLower(header);
    size_t pos = 0;
    while ((pos = lower.find("digest", pos)) != std::string::npos) {
        bool startOk = pos == 0 || lower[pos - 1] == ' ' || lower[pos - 1] == ',';
        size_t end = pos + 6;
        bool endOk = end == lower.size() || lower[end] == ' ' || lower[end] == '\t';
        if (startOk && endOk) return end;
        pos = end;
    }
    return std::string::npos;
}

} // anonymous namespace

std::string DigestChallenge::selectedQop() const {
    std::stringstream ss(qop);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b == std::string::npos) continue;
        if (toLower(item.substr(b, e - b + 1)) == "auth") return "auth";
    }
    return {};
}

bool DigestChallenge::isSession() const {
    return toLower(algorithm) == "md5-sess";
}

std::map<std::string, std::string> parseAuthParams(const std::string& params) {
    std::map<std::string, std::string> out;
    size_t i = 0;
    const size_t n = params.size();
    while (i < n) {
        while (i < n && (params[i] == ' ' || params[i] == '\t' || params[i] == ',')) ++i;
        size_t keyStart = i;
        while (i < n && params[i] != '=' && params[i] != ',' && params[i] != ' ') ++i;
        std::string key = toLower(params.substr(keyStart, i - keyStart));
        while (i < n && params[i] == ' ') ++i;
        if (i >= n || params[i] != '=') {
            // A bare token (another scheme name); stop at the next scheme.
            if (!key.empty() && !out.empty()) break;
            continue;
        }
        ++i; // '='
        while (i < n && params[i] == ' ') ++i;
        std::string value;
        if (i < n && params[i] == '"') {
            ++i;
            while (i < n && params[i] != '"') {
                if (params[i] == '\\' && i + 1 < n) ++i;
                value.push_back(params[i++]);
            }
            if (i < n) ++i; // closing quote
        } else {
            size_t valueStart = i;
            while (i < n && params[i] != ',') ++i;
            value = params.substr(valueStart, i - valueStart);
            size_t e = value.find_last_not_of(" \t");
            value = e == std::string::npos ? std::string() : value.substr(0, e + 1);
        }
        if (!key.empty() && !out.count(key)) out[key] = value;
    }
    return out;
}

std::optional<DigestChallenge> parseDigestChallenge(const std::string& header) {
    size_t start = findDigestScheme(header);
    if (start == std::string::npos) return std::nullopt;
    auto params = parseAuthParams(header.substr(start));

    auto realm = params.find("realm");
    auto nonce = params.find("nonce");
    if (realm == params.end() || nonce == params.end() || nonce->second.empty()) return std::nullopt;

    DigestChallenge challenge;
    challenge.realm = realm->second;
    challenge.nonce = nonce->second;
    if (auto it = params.find("qop"); it != params.end()) challenge.qop = it->second;
    if (auto it = params.find("algorithm"); it != params.end()) challenge.algorithm = it->second;
    if (auto it = params.find("opaque"); it != params.end()) challenge.opaque = it->second;
    return challenge;
}

std::optional<DigestChallenge> selectDigestChallenge(const std::vector<std::string>& headers) {
    std::optional<DigestChallenge> fallback;
    for (const auto& h : headers) {
        auto challenge = parseDigestChallenge(h);
        if (!challenge) continue;
        std::string alg = toLower(challenge->algorithm);
        if (alg.empty() || alg == "md5" || alg == "md5-sess") return challenge;
        if (!fallback) fallback = challenge;
    }
    return fallback;
}

std::string md5Hex(const std::string& input) {
    unsigned char digest[MD5_DIGEST_LENGTH];
    MD5(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return toHex(digest, MD5_DIGEST_LENGTH);
}

std::string generateCnonce() {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd() & 0xFF);
    }
    return toHex(bytes, sizeof(bytes));
}

std::string computeDigestResponse(const DigestChallenge& challenge, const CredentialSet& credentials,
                                  const std::string& method, const std::string& uri,
                                  const std::string& nc, const std::string& cnonce) {
    std::string ha1 = md5Hex(credentials.username + ":" + challenge.realm + ":" + credentials.password);
    if (challenge.isSession()) {
        ha1 = md5Hex(ha1 + ":" + challenge.nonce + ":" + cnonce);
    }
    std::string ha2 = md5Hex(method + ":" + uri);
    std::string qop = challenge.selectedQop();
    if (qop.empty()) {
        return md5Hex(ha1 + ":" + challenge.nonce + ":" + ha2);
    }
    return md5Hex(ha1 + ":" + challenge.nonce + ":" + nc + ":" + cnonce + ":" + qop + ":" + ha2);
}

std::string buildAuthorizationHeader(const DigestChallenge& challenge, const CredentialSet& credentials,
                                     const std::string& method, const std::string& uri,
                                     const std::string& nc, const std::string& cnonce) {
    std::string response = computeDigestResponse(challenge, credentials, method, uri, nc, cnonce);
    std::string qop = challenge.selectedQop();

    std::ostringstream h;
    h << "Digest username=\"" << credentials.username << "\""
      << ", realm=\"" << challenge.realm << "\""
      << ", nonce=\"" << challenge.nonce << "\""
      << ", uri=\"" << uri << "\"";
    if (!qop.empty()) {
        h << ", qop=" << qop << ", nc=" << nc << ", cnonce=\"" << cnonce << "\"";
    }
    h << ", response=\"" << response << "\"";
    if (!challenge.algorithm.empty()) h << ", algorithm=" << challenge.algorithm;
    if (challenge.opaque) h << ", opaque=\"" << *challenge.opaque << "\"";
    return h.str();
}

const char* toString(AuthOutcome outcome) {
    switch (outcome) {
        case AuthOutcome::Ok: return "ok";
        case AuthOutcome::AuthUnsupported: return "auth_unsupported";
        case AuthOutcome::AuthFailed: return "auth_failed";
        case AuthOutcome::HttpError: return "http_error";
        case AuthOutcome::TransportError: return "transport_error";
        case AuthOutcome::Cancelled: return "cancelled";
    }
    return "transport_error";
}

HttpResponse DigestAuthenticator::unauthenticatedRequest(const std::string& host, int port, Protocol protocol,
                                                         const std::string& path,
                                                         const CancellationToken* cancel) const {
    HttpRequestOptions options;
    options.timeoutMs = m_timeoutMs;
    options.insecureTls = true; // devices ship self-signed certificates
    options.cancel = cancel;
    return m_http.request(HttpClient::buildUrl(toString(protocol), host, port, path), options);
}

AuthResult DigestAuthenticator::authenticatedRequest(const std::string& host, int port, Protocol protocol,
                                                     const std::string& path, const std::string& method,
                                                     const CredentialSet& credentials,
                                                     const CancellationToken* cancel) const {
    AuthResult result;
    const std::string url = HttpClient::buildUrl(toString(protocol), host, port, path);

    HttpRequestOptions options;
    options.method = method;
    options.timeoutMs = m_timeoutMs;
    options.insecureTls = true;
    options.cancel = cancel;

    HttpResponse first = m_http.request(url, options);
    if (first.cancelled) {
        result.outcome = AuthOutcome::Cancelled;
        return result;
    }
    if (!first.transportOk) {
        result.outcome = AuthOutcome::TransportError;
        result.error = first.error;
        return result;
    }
    result.status = first.status;
    if (first.status == 200) {
        result.outcome = AuthOutcome::Ok;
        result.body = std::move(first.body);
        return result;
    }

    auto challenge = first.status == 401 ? selectDigestChallenge(first.wwwAuthenticate) : std::nullopt;
    if (!challenge) {
        result.outcome = AuthOutcome::AuthUnsupported;
        result.error = first.status == 401 ? "Device does not support digest authentication"
                                           : "HTTP " + std::to_string(first.status);
        return result;
    }

    // Fresh client nonce per request; the challenge is consumed by this one retry.
    const std::string nc = "00000001";
    const std::string cnonce = generateCnonce();
    options.headers.push_back("Authorization: " +
                              buildAuthorizationHeader(*challenge, credentials, method, path, nc, cnonce));

    HttpResponse second = m_http.request(url, options);
    result.challenged = true;
    if (second.cancelled) {
        result.outcome = AuthOutcome::Cancelled;
        return result;
    }
    if (!second.transportOk) {
        result.outcome = AuthOutcome::TransportError;
        result.error = second.error;
        return result;
    }
    result.status = second.status;
    if (second.status == 200) {
        result.outcome = AuthOutcome::Ok;
        result.body = std::move(second.body);
    } else if (second.status == 401) {
        result.outcome = AuthOutcome::AuthFailed;
        result.error = "Invalid username or password";
    } else {
        result.outcome = AuthOutcome::HttpError;
        result.error = "HTTP " + std::to_string(second.status);
    }
    if (verboseLogging()) {
        std::cout << "[DigestAuth] " << host << ":" << port << " -> " << toString(result.outcome) << std::endl;
    }
    return result;
}

} // namespace Camscout
