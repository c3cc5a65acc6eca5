/**
 * @file HeartbeatSchedule.cpp
 * @brief Heartbeat timer state transitions
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/HeartbeatSchedule.hpp>

namespace Tether::Portal {

namespace {

/// now + interval, clamped to TimePoint::max() instead of overflowing
TimePoint saturatingDeadline(TimePoint now, Seconds interval) noexcept {
    auto headroom = std::chrono::duration_cast<Seconds>(TimePoint::max() - now);
    if (interval >= headroom) {
        return TimePoint::max();
    }
    return now + interval;
}

} // namespace

void HeartbeatSchedule::disable() noexcept {
    m_state = Disabled{};
}

void HeartbeatSchedule::arm(Seconds interval, TimePoint now) noexcept {
    if (interval <= Seconds::zero()) {
        m_state = Disabled{};
        return;
    }
    m_state = Armed{interval, saturatingDeadline(now, interval)};
}

bool HeartbeatSchedule::rearm(TimePoint now) noexcept {
    auto* armed = std::get_if<Armed>(&m_state);
    if (armed == nullptr) {
        return false;
    }
    armed->deadline = saturatingDeadline(now, armed->interval);
    return true;
}

bool HeartbeatSchedule::isArmed() const noexcept {
    return std::holds_alternative<Armed>(m_state);
}

bool HeartbeatSchedule::isDue(TimePoint now) const noexcept {
    const auto* armed = std::get_if<Armed>(&m_state);
    return armed != nullptr && now >= armed->deadline;
}

std::optional<Seconds> HeartbeatSchedule::interval() const noexcept {
    if (const auto* armed = std::get_if<Armed>(&m_state)) {
        return armed->interval;
    }
    return std::nullopt;
}

std::optional<TimePoint> HeartbeatSchedule::deadline() const noexcept {
    if (const auto* armed = std::get_if<Armed>(&m_state)) {
        return armed->deadline;
    }
    return std::nullopt;
}

} // namespace Tether::Portal
