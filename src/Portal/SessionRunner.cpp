/**
 * @file SessionRunner.cpp
 * @brief Background thread hosting one SessionEngine
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/SessionRunner.hpp>
#include <Tether/Core/Logger.hpp>

#include <exception>
#include <system_error>

namespace Tether::Portal {

SessionRunner::SessionRunner(std::unique_ptr<SessionEngine> engine)
    : m_engine(std::move(engine)) {}

SessionRunner::~SessionRunner() {
    stop();
}

Result<void> SessionRunner::start() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_started) {
        return ErrorCode::InvalidState;
    }
    if (!m_engine) {
        return ErrorCode::NullPointer;
    }

    m_running = true;
    try {
        m_thread = std::thread(&SessionRunner::threadMain, this);
    } catch (const std::system_error& e) {
        m_running = false;
        TETHER_LOG_ERROR_F("%ssession thread not started: %s", m_engine->logPrefix().c_str(), e.what());
        return ErrorCode::ThreadCreationFailed;
    }
    m_started = true;

    return Result<void>::Success();
}

void SessionRunner::stop() noexcept {
    if (m_engine) {
        m_engine->lifetime()->cancel();
    }
    join();
}

void SessionRunner::join() noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool SessionRunner::isRunning() const noexcept {
    return m_running;
}

void SessionRunner::threadMain() {
    try {
        m_engine->run();
    } catch (const std::exception& e) {
        // run() has already logged out through its teardown guard
        TETHER_LOG_CRITICAL_F("%ssession loop terminated: %s", m_engine->logPrefix().c_str(), e.what());
    }
    m_running = false;
}

} // namespace Tether::Portal
