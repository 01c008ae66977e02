// HttpClient.hpp
// Thin libcurl wrapper for the short HTTP(S) exchanges discovery needs.
#pragma once

#include <string>
#include <vector>

#include "Cancellation.hpp"

namespace Camscout {

struct HttpRequestOptions {
    std::string method{"GET"};
    long timeoutMs{5000};
    long connectTimeoutMs{0};               // 0: same as timeoutMs
    bool insecureTls{false};                // accept self-signed certificates
    std::vector<std::string> headers;       // "Name: value"
    const CancellationToken* cancel{nullptr};
};

struct HttpResponse {
    bool transportOk{false};                // a status line was received
    bool cancelled{false};
    long status{0};
    std::string body;
    std::vector<std::string> wwwAuthenticate; // one entry per WWW-Authenticate header
    std::string error;
};

class HttpClient {
public:
    HttpClient();

    HttpResponse request(const std::string& url, const HttpRequestOptions& options) const;

    // "http://10.0.0.5:80/path"
    static std::string buildUrl(const std::string& scheme, const std::string& host, int port,
                                const std::string& path);
};

} // namespace Camscout
