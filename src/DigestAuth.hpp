// DigestAuth.hpp
// RFC 2617 Digest challenge/response against one endpoint.
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Cancellation.hpp"
#include "Device.hpp"
#include "HttpClient.hpp"

namespace Camscout {

struct DigestChallenge {
    std::string realm;
    std::string nonce;
    std::string qop;        // as sent, e.g. "auth" or "auth,auth-int"
    std::string algorithm;  // as sent, may be empty
    std::optional<std::string> opaque;

    // "auth" when offered, else empty (RFC 2069 compatibility mode).
    std::string selectedQop() const;
    bool isSession() const; // MD5-sess
};

// Lowercase auth-param map from the text after the scheme token.
std::map<std::string, std::string> parseAuthParams(const std::string& params);

// Parses one WWW-Authenticate value. Returns nullopt unless it is a Digest
// challenge carrying realm and nonce.
std::optional<DigestChallenge> parseDigestChallenge(const std::string& header);

// First usable Digest challenge among several WWW-Authenticate headers,
// preferring MD5 variants.
std::optional<DigestChallenge> selectDigestChallenge(const std::vector<std::string>& headers);

std::string md5Hex(const std::string& input);

// 8 random bytes as 16 lowercase hex characters.
std::string generateCnonce();

std::string computeDigestResponse(const DigestChallenge& challenge, const CredentialSet& credentials,
                                  const std::string& method, const std::string& uri,
                                  const std::string& nc, const std::string& cnonce);

// Full header value: Digest username="...", realm="...", ...
std::string buildAuthorizationHeader(const DigestChallenge& challenge, const CredentialSet& credentials,
                                     const std::string& method, const std::string& uri,
                                     const std::string& nc, const std::string& cnonce);

enum class AuthOutcome {
    Ok,              // 200, with or without a challenge
    AuthUnsupported, // answered without a Digest challenge
    AuthFailed,      // the single Digest retry was still 401
    HttpError,       // retry answered something other than 200/401
    TransportError,  // connect, TLS or timeout failure
    Cancelled
};

const char* toString(AuthOutcome outcome);

struct AuthResult {
    AuthOutcome outcome{AuthOutcome::TransportError};
    long status{0};
    std::string body;
    std::string error;
    bool challenged{false};   // a Digest challenge was answered

    bool ok() const { return outcome == AuthOutcome::Ok; }
};

class DigestAuthenticator {
public:
    explicit DigestAuthenticator(const HttpClient& http, long timeoutMs = 5000)
        : m_http(http), m_timeoutMs(timeoutMs) {}

    // One unauthenticated request, then at most one Digest retry. Never loops
    // over credentials; that is the caller's decision.
    AuthResult authenticatedRequest(const std::string& host, int port, Protocol protocol,
                                    const std::string& path, const std::string& method,
                                    const CredentialSet& credentials,
                                    const CancellationToken* cancel = nullptr) const;

    // The first leg only: status, body and any Digest challenge.
    HttpResponse unauthenticatedRequest(const std::string& host, int port, Protocol protocol,
                                        const std::string& path,
                                        const CancellationToken* cancel = nullptr) const;

    long timeoutMs() const { return m_timeoutMs; }

private:
    const HttpClient& m_http;
    long m_timeoutMs;
};

} // namespace Camscout
