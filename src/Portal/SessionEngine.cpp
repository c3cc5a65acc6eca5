/**
 * @file SessionEngine.cpp
 * @brief Probe loop, heartbeat and logout of one portal session
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/SessionEngine.hpp>
#include <Tether/Portal/FailurePolicy.hpp>
#include <Tether/Portal/HostIdentity.hpp>
#include <Tether/Portal/PortalHandshake.hpp>
#include <Tether/Portal/StateCodec.hpp>
#include <Tether/Core/Crypto.hpp>
#include <Tether/Core/Logger.hpp>

#include <algorithm>
#include <exception>

namespace Tether::Portal {

namespace {

constexpr int kStatusNoContent = 204;
constexpr size_t kRequestIdLength = 5;

std::string errorText(ErrorCode code) {
    return std::string(getErrorMessage(code));
}

} // namespace

std::string_view sessionStateName(SessionState state) noexcept {
    switch (state) {
        case SessionState::Unauthenticated: return "unauthenticated";
        case SessionState::Authenticating:  return "authenticating";
        case SessionState::Authenticated:   return "authenticated";
        case SessionState::LoggedOut:       return "logged_out";
    }
    return "unknown";
}

// ============================================================================
// SessionEngine::Impl
// ============================================================================

class SessionEngine::Impl {
public:
    Impl(const Config::KeeperConfig& cfg,
         std::unique_ptr<Network::HttpTransport> httpTransport,
         CipherRegistry cipherRegistry)
        : config(cfg)
        , transport(std::move(httpTransport))
        , registry(std::move(cipherRegistry))
        , lifetime(std::make_shared<Lifetime>()) {
        session.pollInterval = Milliseconds(config.checkIntervalMs);
        session.retryInterval = Milliseconds(config.retryIntervalMs);
    }

    void run();

    Result<void> checkNetwork();
    Result<void> handleRedirect(const std::string& location);
    Result<void> authenticate(const std::string& location);
    Result<void> sendHeartbeat();
    void logout();

    Config::KeeperConfig config;
    std::unique_ptr<Network::HttpTransport> transport;
    CipherRegistry registry;
    Session session;
    std::shared_ptr<Lifetime> lifetime;
    std::string prefix;

    bool pollArmed = false;
    TimePoint nextProbe{};

    bool logoutDone = false;
    int logoutAttempts = 0;

private:
    /// Stops both timers and logs out on every exit from run()
    struct TeardownGuard {
        Impl& impl;

        ~TeardownGuard() {
            try {
                impl.logout();
            } catch (const std::exception& e) {
                TETHER_LOG_ERROR_F("%slogout aborted: %s", impl.prefix.c_str(), e.what());
            }
            impl.session.heartbeat.disable();
            impl.pollArmed = false;
        }
    };

    Milliseconds requestTimeout() const {
        return Milliseconds(config.requestTimeoutMs);
    }

    Network::HttpRequest probeRequest(Milliseconds timeout) const {
        Network::HttpRequest request;
        request.method = Network::HttpMethod::GET;
        request.url = config.probeUrl;
        request.followRedirects = false;
        request.timeout = timeout;
        return request;
    }

    void probeTick();
    void heartbeatTick();
};

void SessionEngine::Impl::run() {
    TETHER_LOG_INFO(prefix + "client start");
    TeardownGuard guard{*this};

    pollArmed = true;
    probeTick();

    while (true) {
        TimePoint wake = nextProbe;
        if (auto deadline = session.heartbeat.deadline()) {
            wake = std::min(wake, *deadline);
        }

        if (lifetime->waitUntil(wake)) {
            TETHER_LOG_INFO(prefix + "client context cancel");
            break;
        }

        if (Clock::now() >= nextProbe) {
            probeTick();
        }
        if (session.heartbeat.isDue(Clock::now())) {
            heartbeatTick();
        }
    }
}

void SessionEngine::Impl::probeTick() {
    auto result = checkNetwork();
    TimePoint now = Clock::now();

    if (result.isSuccess()) {
        nextProbe = now + session.pollInterval;
        return;
    }

    TETHER_LOG_WARNING_F("%sNetwork check failed:%s", prefix.c_str(), errorText(result.error()).c_str());
    switch (policyFor(Operation::Probe)) {
        case FailurePolicy::LogAndRetryNextTick:
            nextProbe = now + session.retryInterval;
            break;
        case FailurePolicy::LogAndContinue:
        case FailurePolicy::Fatal:
            nextProbe = now + session.pollInterval;
            break;
    }
}

void SessionEngine::Impl::heartbeatTick() {
    auto result = sendHeartbeat();
    if (result.isSuccess()) {
        TETHER_LOG_INFO(prefix + "send heartbeat");
        return;
    }

    TETHER_LOG_WARNING_F("%ssend heartbeat error: %s", prefix.c_str(), errorText(result.error()).c_str());
    if (policyFor(Operation::Heartbeat) == FailurePolicy::LogAndRetryNextTick) {
        // Previous interval stays in effect
        session.heartbeat.rearm(Clock::now());
    } else {
        session.heartbeat.disable();
    }
}

Result<void> SessionEngine::Impl::checkNetwork() {
    auto response = transport->send(probeRequest(requestTimeout()));
    if (response.isFailure()) {
        return response.error();
    }

    const Network::HttpResponse& probe = response.value();
    if (probe.statusCode == kStatusNoContent) {
        return Result<void>::Success();
    }

    if (probe.isRedirect()) {
        session.heartbeat.disable();
        TETHER_LOG_INFO(prefix + "auth required");
        return handleRedirect(probe.getHeader("Location"));
    }

    TETHER_LOG_DEBUG_F("%sprobe answered %d", prefix.c_str(), probe.statusCode);
    return ErrorCode::UnexpectedStatus;
}

Result<void> SessionEngine::Impl::handleRedirect(const std::string& location) {
    auto result = authenticate(location);
    if (result.isFailure()) {
        TETHER_LOG_ERROR_F("%sauth failed: %s", prefix.c_str(), errorText(result.error()).c_str());
        return Result<void>::Success();
    }

    TETHER_LOG_INFO(prefix + "auth finished");
    return Result<void>::Success();
}

Result<void> SessionEngine::Impl::authenticate(const std::string& location) {
    session.state = SessionState::Authenticating;

    PortalHandshake handshake(*transport, registry, prefix);
    auto result = handshake.run(session.identity, location,
                                config.username, config.password, config.probeUrl);
    if (result.isFailure()) {
        session.state = SessionState::Unauthenticated;
        return result.error();
    }

    HandshakeResult& established = result.value();
    session.identity = std::move(established.identity);
    session.endpoints = std::move(established.endpoints);
    session.cipher = std::move(established.cipher);
    session.state = SessionState::Authenticated;

    Seconds interval = established.heartbeatInterval.value_or(config.heartbeatDefault);
    session.heartbeat.arm(interval, Clock::now());

    TETHER_LOG_DEBUG_F("%sheartbeat every %lld s via %s", prefix.c_str(),
                       static_cast<long long>(interval.count()), session.identity.algoId.c_str());
    return Result<void>::Success();
}

Result<void> SessionEngine::Impl::sendHeartbeat() {
    if (!session.hasCipher()) {
        return ErrorCode::NotAuthenticated;
    }

    ByteBuffer state = serialize(buildStateDocument(session));
    auto response = exchangeState(*transport, session.endpoints.keepUrl, state,
                                  *session.cipher, session.identity.clientId, requestTimeout());
    if (response.isFailure()) {
        return response.error();
    }

    auto interval = requireInterval(response.value());
    if (interval.isFailure()) {
        return interval.error();
    }

    session.heartbeat.arm(interval.value(), Clock::now());
    return Result<void>::Success();
}

void SessionEngine::Impl::logout() {
    if (logoutDone) {
        return;
    }
    logoutDone = true;
    ++logoutAttempts;

    auto probe = transport->send(probeRequest(kLogoutTimeout));
    if (probe.isFailure()) {
        TETHER_LOG_DEBUG_F("%slogout probe failed: %s", prefix.c_str(), errorText(probe.error()).c_str());
    } else if (probe.value().statusCode == kStatusNoContent && session.hasCipher()) {
        ByteBuffer state = serialize(buildStateDocument(session));
        auto response = exchangeState(*transport, session.endpoints.termUrl, state,
                                      *session.cipher, session.identity.clientId, kLogoutTimeout);
        if (response.isFailure()) {
            TETHER_LOG_DEBUG_F("%slogout reply ignored: %s", prefix.c_str(),
                               errorText(response.error()).c_str());
        }
        TETHER_LOG_INFO(prefix + "log out request sent");
    }

    session.state = SessionState::LoggedOut;
}

// ============================================================================
// SessionEngine public interface
// ============================================================================

Result<std::unique_ptr<SessionEngine>> SessionEngine::create(
    const Config::KeeperConfig& config,
    std::unique_ptr<Network::HttpTransport> transport,
    CipherRegistry registry
) {
    Config::KeeperConfig normalized = config;
    normalized.normalize();

    auto valid = normalized.validate();
    if (valid.isFailure()) {
        TETHER_LOG_ERROR_F("construct failed: %s", errorText(valid.error()).c_str());
        return valid.error();
    }

    if (!transport) {
        Network::TransportOptions options;
        options.bindInterface = normalized.bindInterface;
        options.proxy = normalized.proxy;
        options.defaultTimeout = Milliseconds(normalized.requestTimeoutMs);

        auto built = Network::buildTransport(options);
        if (built.isFailure()) {
            TETHER_LOG_ERROR_F("construct failed: transport for %s: %s",
                               normalized.bindInterfaceDisplay().c_str(),
                               errorText(built.error()).c_str());
            return built.error();
        }
        transport = std::move(built.value());
    }

    auto clientId = Crypto::generateUuid();
    auto requestId = Crypto::randomToken(kRequestIdLength);
    if (clientId.isFailure() || requestId.isFailure()) {
        TETHER_LOG_ERROR("construct failed: no randomness for session ids");
        return ErrorCode::RandomGenerationFailed;
    }

    auto impl = std::make_unique<Impl>(normalized, std::move(transport), std::move(registry));
    impl->prefix = "[" + requestId.value() + "][user:" + normalized.username +
                   " bind_device:" + normalized.bindInterfaceDisplay() + "] ";

    SessionIdentity& identity = impl->session.identity;
    identity.clientId = clientId.value();

    if (!normalized.hostname.empty()) {
        identity.hostname = normalized.hostname;
    } else if (auto hostname = systemHostname(); hostname.isSuccess()) {
        identity.hostname = hostname.value();
    } else {
        TETHER_LOG_WARNING_F("%shost name unavailable: %s", impl->prefix.c_str(),
                             errorText(hostname.error()).c_str());
    }

    if (!normalized.macAddress.empty()) {
        identity.macAddress = normalized.macAddress;
    } else if (auto mac = macAddressFor(normalized.bindInterface); mac.isSuccess()) {
        identity.macAddress = mac.value();
    } else {
        TETHER_LOG_WARNING_F("%sMAC address unavailable: %s", impl->prefix.c_str(),
                             errorText(mac.error()).c_str());
    }

    std::unique_ptr<SessionEngine> engine(new SessionEngine(std::move(impl)));
    return Result<std::unique_ptr<SessionEngine>>(std::move(engine));
}

SessionEngine::SessionEngine(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl)) {}

SessionEngine::~SessionEngine() = default;

void SessionEngine::run() {
    m_impl->run();
}

Result<void> SessionEngine::checkNetwork() {
    return m_impl->checkNetwork();
}

Result<void> SessionEngine::handleRedirect(const std::string& location) {
    return m_impl->handleRedirect(location);
}

Result<void> SessionEngine::authenticate(const std::string& location) {
    return m_impl->authenticate(location);
}

Result<void> SessionEngine::sendHeartbeat() {
    return m_impl->sendHeartbeat();
}

void SessionEngine::logout() {
    m_impl->logout();
}

std::shared_ptr<Lifetime> SessionEngine::lifetime() const {
    return m_impl->lifetime;
}

const Session& SessionEngine::session() const noexcept {
    return m_impl->session;
}

SessionState SessionEngine::state() const noexcept {
    return m_impl->session.state;
}

const std::string& SessionEngine::logPrefix() const noexcept {
    return m_impl->prefix;
}

int SessionEngine::logoutAttempts() const noexcept {
    return m_impl->logoutAttempts;
}

bool SessionEngine::timersStopped() const noexcept {
    return !m_impl->pollArmed && !m_impl->session.heartbeat.isArmed();
}

} // namespace Tether::Portal
