/**
 * @file HeartbeatSchedule.hpp
 * @brief Heartbeat timer as a tagged disabled/armed state
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#pragma once

#ifndef TETHER_PORTAL_HEARTBEAT_SCHEDULE_HPP
#define TETHER_PORTAL_HEARTBEAT_SCHEDULE_HPP

#include <Tether/Core/Types.hpp>
#include <optional>
#include <variant>

namespace Tether::Portal {

/**
 * @brief When the next heartbeat is due, if at all
 *
 * Starts disabled. A disabled schedule contributes no deadline to the
 * engine's wait.
 */
class HeartbeatSchedule {
public:
    HeartbeatSchedule() = default;

    /// Stop firing until armed again
    void disable() noexcept;

    /**
     * @brief Fire every @p interval, first at @p now + @p interval
     *
     * A non-positive interval disables the schedule. A deadline beyond the
     * clock's range is held at TimePoint::max().
     */
    void arm(Seconds interval, TimePoint now) noexcept;

    /**
     * @brief Move the deadline one interval past @p now, keeping the interval
     * @return false when disabled
     */
    bool rearm(TimePoint now) noexcept;

    [[nodiscard]] bool isArmed() const noexcept;

    /// True when armed and @p now has reached the deadline
    [[nodiscard]] bool isDue(TimePoint now) const noexcept;

    [[nodiscard]] std::optional<Seconds> interval() const noexcept;
    [[nodiscard]] std::optional<TimePoint> deadline() const noexcept;

private:
    struct Disabled {};
    struct Armed {
        Seconds interval;
        TimePoint deadline;
    };

    std::variant<Disabled, Armed> m_state;
};

} // namespace Tether::Portal

#endif // TETHER_PORTAL_HEARTBEAT_SCHEDULE_HPP
