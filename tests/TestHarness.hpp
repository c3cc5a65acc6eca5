// tests/TestHarness.hpp
#pragma once

#include <Tether/Core/Types.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <Tether/Core/HttpClient.hpp>
#include <Tether/Core/Logger.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Tether::Testing {

// ============================================================================
// Memory Utilities
// ============================================================================

/**
 * Check if memory region contains only zeros
 */
bool isZeroed(const void* data, size_t size);

// ============================================================================
// Random Data Generation
// ============================================================================

/**
 * Generate random bytes for testing
 */
ByteBuffer randomBytes(size_t size);

/**
 * Bit flipper for tampering tests
 */
class BitFlipper {
public:
    static void flipBit(ByteBuffer& data, size_t bit_position);
};

// ============================================================================
// Files
// ============================================================================

/**
 * Temporary file removed on destruction
 */
class TempFile {
public:
    explicit TempFile(const std::string& content, const std::string& suffix = ".conf");
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// ============================================================================
// Waiting
// ============================================================================

/**
 * Poll @p predicate until it holds or @p timeout passes
 */
bool waitFor(const std::function<bool()>& predicate,
             Milliseconds timeout = Milliseconds{5000});

// ============================================================================
// Log capture
// ============================================================================

/**
 * Routes Logger output to memory for the lifetime of the object
 */
class LogCapture {
public:
    explicit LogCapture(Core::LogLevel level = Core::LogLevel::Debug);
    ~LogCapture();

    std::vector<std::string> lines() const;

    /// Number of captured lines containing @p text
    size_t count(const std::string& text) const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_lines;
};

// ============================================================================
// Scripted HTTP transport
// ============================================================================

Network::HttpResponse makeResponse(int status, const std::string& body = {},
                                   Network::HttpHeaders headers = {});

Network::HttpResponse redirectTo(const std::string& location, int status = 302);

/**
 * HttpTransport answering from per-URL handlers
 *
 * The query string is ignored when matching. Unmatched URLs fail with
 * ConnectionFailed. Every request is recorded.
 */
class FakeTransport : public Network::HttpTransport {
public:
    using Handler = std::function<Result<Network::HttpResponse>(const Network::HttpRequest&)>;

    Result<Network::HttpResponse> send(const Network::HttpRequest& request) override;

    void on(const std::string& url, Handler handler);
    void respond(const std::string& url, const Network::HttpResponse& response);
    void fail(const std::string& url, ErrorCode error);

    std::vector<Network::HttpRequest> requests() const;
    size_t countTo(const std::string& url) const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Handler> m_handlers;
    std::vector<Network::HttpRequest> m_requests;
};

// ============================================================================
// Simulated captive portal
// ============================================================================

/**
 * Portal behaviour knobs; every field may be changed between requests
 */
struct PortalScript {
    std::string algoId;               ///< Empty = AES-GCM
    int ticketResult = 0;
    int loginResult = 0;
    std::optional<std::string> loginInterval = std::string("30");
    std::string heartbeatInterval = "45";
    bool sendLocation = true;
};

/**
 * Implements the portal side of the handshake on a FakeTransport
 *
 * The probe answers probeStatus (204 or a redirect to the index page).
 * Ticket replies are plain; login, heartbeat and logout replies are sealed
 * with the cipher the client negotiated.
 */
class FakePortal {
public:
    static constexpr const char* kProbeUrl = "http://probe.test/generate_204";
    static constexpr const char* kIndexUrl = "http://portal.test/index.jsp";
    static constexpr const char* kLocation =
        "http://portal.test/index.jsp?wlanuserip=10.20.30.40&wlanacip=10.0.0.1"
        "&redirect=http%3A%2F%2Fexample.com%2Fhome";
    static constexpr const char* kTicketUrl = "http://portal.test/api/ticket";
    static constexpr const char* kAuthUrl = "http://portal.test/api/auth";
    static constexpr const char* kKeepUrl = "http://portal.test/api/keep";
    static constexpr const char* kTermUrl = "http://portal.test/api/term";
    static constexpr const char* kTicket = "TICKET-0001";

    explicit FakePortal(FakeTransport& transport);

    void setProbeStatus(int status) { m_probeStatus = status; }

    /// The <config> page served at kIndexUrl
    static Network::HttpResponse indexPage();

    PortalScript& script() { return m_script; }

    size_t probes() const { return m_transport.countTo(kProbeUrl); }
    size_t ticketRequests() const { return m_transport.countTo(kTicketUrl); }
    size_t loginRequests() const { return m_transport.countTo(kAuthUrl); }
    size_t heartbeats() const { return m_transport.countTo(kKeepUrl); }
    size_t logouts() const { return m_transport.countTo(kTermUrl); }

private:
    Result<Network::HttpResponse> sealedReply(const Network::HttpRequest& request,
                                              const std::string& responseXml,
                                              const char* expectedRoot);

    FakeTransport& m_transport;
    PortalScript m_script;
    std::atomic<int> m_probeStatus{204};
};

// ============================================================================
// Assertion Helpers
// ============================================================================

#define ASSERT_ZEROED(data, size) \
    ASSERT_TRUE(::Tether::Testing::isZeroed(data, size)) \
        << "Memory not properly zeroed"

#define ASSERT_RESULT_OK(result) \
    ASSERT_TRUE((result).isSuccess()) \
        << "Operation failed: " << ::Tether::getErrorMessage((result).error())

#define EXPECT_RESULT_ERROR(result, code) \
    do { \
        auto&& _r = (result); \
        ASSERT_TRUE(_r.isFailure()) << "Expected " #code; \
        EXPECT_EQ(_r.error(), code); \
    } while (0)

} // namespace Tether::Testing
