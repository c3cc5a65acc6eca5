/**
 * @file Lifetime.cpp
 * @brief Cancellation source implementation
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/Lifetime.hpp>

namespace Tether::Portal {

void Lifetime::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool Lifetime::isCancelled() const noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool Lifetime::waitUntil(TimePoint deadline) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_until(lock, deadline, [this] { return m_cancelled; });
}

} // namespace Tether::Portal
