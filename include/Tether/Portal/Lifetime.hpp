/**
 * @file Lifetime.hpp
 * @brief Cancellation source shared between a session and its controller
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#pragma once

#ifndef TETHER_PORTAL_LIFETIME_HPP
#define TETHER_PORTAL_LIFETIME_HPP

#include <Tether/Core/Types.hpp>
#include <condition_variable>
#include <mutex>

namespace Tether::Portal {

/**
 * @brief One-way cancellation flag with an interruptible wait
 *
 * The only way another thread may influence a running session.
 * Cancellation cannot be undone.
 */
class Lifetime {
public:
    Lifetime() = default;

    Lifetime(const Lifetime&) = delete;
    Lifetime& operator=(const Lifetime&) = delete;

    /// Cancel and wake every waiter
    void cancel() noexcept;

    [[nodiscard]] bool isCancelled() const noexcept;

    /**
     * @brief Block until @p deadline or cancellation
     * @return true if cancelled
     */
    bool waitUntil(TimePoint deadline);

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_cancelled = false;
};

} // namespace Tether::Portal

#endif // TETHER_PORTAL_LIFETIME_HPP
