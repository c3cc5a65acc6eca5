/**
 * @file SessionRunner.hpp
 * @brief Background thread hosting one SessionEngine
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#pragma once

#ifndef TETHER_PORTAL_SESSION_RUNNER_HPP
#define TETHER_PORTAL_SESSION_RUNNER_HPP

#include <Tether/Core/ErrorCodes.hpp>
#include <Tether/Portal/SessionEngine.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace Tether::Portal {

/**
 * @brief Runs SessionEngine::run() on its own thread
 *
 * A runner is single-use: once its engine has run it cannot be started
 * again. Destruction stops and joins.
 */
class SessionRunner {
public:
    explicit SessionRunner(std::unique_ptr<SessionEngine> engine);
    ~SessionRunner();

    SessionRunner(const SessionRunner&) = delete;
    SessionRunner& operator=(const SessionRunner&) = delete;

    /**
     * @brief Spawn the engine thread
     * @return InvalidState if already started, NullPointer without an engine,
     *         ThreadCreationFailed if the thread cannot be created
     */
    Result<void> start();

    /// Cancel the engine's lifetime and wait for logout to finish
    void stop() noexcept;

    /// Wait for the engine to return without cancelling it
    void join() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    SessionEngine& engine() noexcept { return *m_engine; }

private:
    void threadMain();

    std::unique_ptr<SessionEngine> m_engine;
    std::mutex m_mutex;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    bool m_started = false;
};

} // namespace Tether::Portal

#endif // TETHER_PORTAL_SESSION_RUNNER_HPP
