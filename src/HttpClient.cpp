// HttpClient.cpp
#include "HttpClient.hpp"

#include "ScanConfig.hpp"

#include <cctype>
#include <iostream>
#include <mutex>

#include <curl/curl.h>

namespace Camscout {

namespace {

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool startsWithNoCase(const std::string& s, const char* prefix) {
    size_t i = 0;
    for (; prefix[i]; ++i) {
        if (i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

struct HeaderState {
    std::vector<std::string> wwwAuthenticate;
};

struct ProgressState {
    const CancellationToken* cancel{nullptr};
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<HeaderState*>(userdata);
    std::string line(ptr, size * nmemb);
    // A new status line starts a new header block (e.g. after 100 Continue).
    if (startsWithNoCase(line, "HTTP/")) {
        state->wwwAuthenticate.clear();
    } else if (startsWithNoCase(line, "WWW-Authenticate:")) {
        state->wwwAuthenticate.push_back(trim(line.substr(17)));
    }
    return size * nmemb;
}

int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<ProgressState*>(clientp);
    return isCancelled(state->cancel) ? 1 : 0;
}

} // anonymous namespace

HttpClient::HttpClient() {
    ensureCurlInitialized();
}

std::string HttpClient::buildUrl(const std::string& scheme, const std::string& host, int port,
                                 const std::string& path) {
    std::string url = scheme + "://" + host + ":" + std::to_string(port);
    if (path.empty() || path[0] != '/') url.push_back('/');
    return url + path;
}

HttpResponse HttpClient::request(const std::string& url, const HttpRequestOptions& options) const {
    HttpResponse response;
    if (isCancelled(options.cancel)) {
        response.cancelled = true;
        response.error = "cancelled";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    HeaderState headerState;
    ProgressState progressState{options.cancel};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headerState);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     options.connectTimeoutMs > 0 ? options.connectTimeoutMs : options.timeoutMs);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "camscout/1.0");
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progressState);

    if (options.insecureTls) {
        // Discovery only: trust is deferred until the device is identified.
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    } else {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    }

    if (options.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (options.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, options.method.c_str());
    }

    struct curl_slist* headers = nullptr;
    for (const auto& h : options.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode rc = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);

    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    response.status = code;
    response.wwwAuthenticate = std::move(headerState.wwwAuthenticate);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        response.cancelled = true;
        response.error = "cancelled";
    } else if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
        if (verboseLogging()) {
            std::cout << "[HttpClient] " << url << " -> " << response.error << std::endl;
        }
    } else {
        response.transportOk = code > 0;
    }
    return response;
}

} // namespace Camscout
