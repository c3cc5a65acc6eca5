/**
 * @file HttpClient.cpp
 * @brief HTTP transport implementation using libcurl
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Core/HttpClient.hpp>
#include <Tether/Core/ErrorCodes.hpp>

#include <curl/curl.h>
#include <net/if.h>
#include <mutex>
#include <algorithm>
#include <cctype>
#include <new>

namespace Tether::Network {

// Defined in TlsContext.cpp
ErrorCode configureTlsVersion(CURL* curl);
ErrorCode configureTlsVerification(CURL* curl, bool verifyPeer, bool verifyHost);

// ============================================================================
// Global cURL initialization
// ============================================================================

namespace {
    std::once_flag g_curlInitFlag;
    bool g_curlInitialized = false;

    bool initializeCurl() {
        std::call_once(g_curlInitFlag, []() {
            CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
            g_curlInitialized = (res == CURLE_OK);
        });
        return g_curlInitialized;
    }

    // curl_global_cleanup() is not called; it is not thread-safe and the
    // process exit reclaims everything.
}

// ============================================================================
// cURL callbacks
// ============================================================================

namespace {
    struct BodySink {
        ByteBuffer* buffer;
        size_t limit;
        bool overflowed = false;
    };

    size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* sink = static_cast<BodySink*>(userp);

        if (realsize > sink->limit - sink->buffer->size()) {
            sink->overflowed = true;
            return 0;  // curl aborts with CURLE_WRITE_ERROR
        }

        try {
            const Byte* data = static_cast<const Byte*>(contents);
            sink->buffer->insert(sink->buffer->end(), data, data + realsize);
            return realsize;
        } catch (const std::bad_alloc&) {
            return 0;  // curl reports CURLE_WRITE_ERROR
        }
    }

    size_t headerCallback(char* buffer, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* headers = static_cast<HttpHeaders*>(userp);

        std::string header(buffer, realsize);

        // A new status line starts a new header block (e.g. after 100 Continue)
        if (header.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return realsize;
        }

        // "Name: Value\r\n"
        size_t colonPos = header.find(':');
        if (colonPos != std::string::npos && colonPos > 0) {
            std::string name = header.substr(0, colonPos);
            std::string value = header.substr(colonPos + 1);

            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);

            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            (*headers)[name] = value;
        }

        return realsize;
    }

    ErrorCode mapCurlError(CURLcode res) {
        switch (res) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return ErrorCode::DnsResolutionFailed;
            case CURLE_COULDNT_CONNECT:
                return ErrorCode::ConnectionFailed;
            case CURLE_INTERFACE_FAILED:
                return ErrorCode::InterfaceNotFound;
            case CURLE_OPERATION_TIMEDOUT:
                return ErrorCode::Timeout;
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
                return ErrorCode::TlsHandshakeFailed;
            case CURLE_PEER_FAILED_VERIFICATION:
                return ErrorCode::CertificateInvalid;
            case CURLE_URL_MALFORMAT:
            case CURLE_UNSUPPORTED_PROTOCOL:
                return ErrorCode::InvalidUrl;
            default:
                return ErrorCode::HttpRequestFailed;
        }
    }
}

// ============================================================================
// HttpClient::Impl
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const TransportOptions& options)
        : m_options(options) {
        initializeCurl();
    }

    Result<HttpResponse> send(const HttpRequest& request) {
        if (!g_curlInitialized) {
            return ErrorCode::CurlInitFailed;
        }

        std::lock_guard<std::mutex> lock(m_mutex);

        CURL* curl = curl_easy_init();
        if (!curl) {
            return ErrorCode::CurlInitFailed;
        }

        struct CurlGuard {
            CURL* handle;
            curl_slist* headers;
            ~CurlGuard() {
                if (headers) curl_slist_free_all(headers);
                if (handle) curl_easy_cleanup(handle);
            }
        } guard{curl, nullptr};

        ErrorCode tlsResult = configureTlsVersion(curl);
        if (tlsResult != ErrorCode::Success) {
            return tlsResult;
        }
        tlsResult = configureTlsVerification(curl, m_options.verifyTls, m_options.verifyTls);
        if (tlsResult != ErrorCode::Success) {
            return tlsResult;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (!m_options.bindInterface.empty()) {
            // "if!" forces an interface name, never an address or host
            m_interfaceSpec = "if!" + m_options.bindInterface;
            curl_easy_setopt(curl, CURLOPT_INTERFACE, m_interfaceSpec.c_str());
        }

        if (!m_options.proxy.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, m_options.proxy.c_str());
        }

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
                break;
        }

        for (const auto& [name, value] : request.headers) {
            std::string header = name + ": " + value;
            curl_slist* appended = curl_slist_append(guard.headers, header.c_str());
            if (!appended) {
                return ErrorCode::HttpRequestFailed;
            }
            guard.headers = appended;
        }
        if (guard.headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, guard.headers);
        }

        long timeoutMs = request.timeout.count() > 0
            ? static_cast<long>(request.timeout.count())
            : static_cast<long>(m_options.defaultTimeout.count());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);

        if (request.followRedirects) {
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.maxRedirects));
        } else {
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        }

        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_options.userAgent.c_str());

        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        BodySink sink{&response.body, m_options.maxResponseBytes};
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        auto startTime = Clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.elapsed = std::chrono::duration_cast<Milliseconds>(Clock::now() - startTime);

        if (res != CURLE_OK) {
            if (sink.overflowed) {
                return ErrorCode::ResponseTooLarge;
            }
            return mapCurlError(res);
        }

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);

        return response;
    }

    const TransportOptions& options() const noexcept {
        return m_options;
    }

private:
    mutable std::mutex m_mutex;
    TransportOptions m_options;
    std::string m_interfaceSpec;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const TransportOptions& options)
    : m_impl(std::make_unique<Impl>(options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    return m_impl->send(request);
}

Result<HttpResponse> HttpClient::get(const std::string& url, const HttpHeaders& headers) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url;
    request.headers = headers;
    return send(request);
}

Result<HttpResponse> HttpClient::post(
    const std::string& url,
    const ByteBuffer& body,
    const HttpHeaders& headers
) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    request.body = body;
    request.headers = headers;
    return send(request);
}

const TransportOptions& HttpClient::options() const noexcept {
    return m_impl->options();
}

// ============================================================================
// Transport builder
// ============================================================================

Result<std::unique_ptr<HttpTransport>> buildTransport(const TransportOptions& options) {
    if (!initializeCurl()) {
        return ErrorCode::TransportBuildFailed;
    }

    if (!options.bindInterface.empty() &&
        if_nametoindex(options.bindInterface.c_str()) == 0) {
        return ErrorCode::InterfaceNotFound;
    }

    if (!options.proxy.empty()) {
        CURLU* url = curl_url();
        if (!url) {
            return ErrorCode::TransportBuildFailed;
        }
        CURLUcode rc = curl_url_set(url, CURLUPART_URL, options.proxy.c_str(), CURLU_GUESS_SCHEME);
        curl_url_cleanup(url);
        if (rc != CURLUE_OK) {
            return ErrorCode::TransportBuildFailed;
        }
    }

    std::unique_ptr<HttpTransport> transport = std::make_unique<HttpClient>(options);
    return Result<std::unique_ptr<HttpTransport>>(std::move(transport));
}

// ============================================================================
// HttpResponse helper methods
// ============================================================================

std::string HttpResponse::getHeader(const std::string& name) const {
    std::string lowerName = name;
    std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = headers.find(lowerName);
    if (it != headers.end()) {
        return it->second;
    }
    return "";
}

} // namespace Tether::Network
