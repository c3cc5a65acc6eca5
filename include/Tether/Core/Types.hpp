/**
 * @file Types.hpp
 * @brief Core type definitions for Tether
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Tether codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef TETHER_CORE_TYPES_HPP
#define TETHER_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <memory>
#include <functional>
#include <chrono>

namespace Tether {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw buffers
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

// ============================================================================
// Time Types
// ============================================================================

/// Monotonic clock for scheduling (never jumps with wall-clock changes)
using Clock = std::chrono::steady_clock;

/// Time point type
using TimePoint = Clock::time_point;

/// Wall clock, used only for timestamps sent on the wire
using WallClock = std::chrono::system_clock;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

/// Duration in seconds
using Seconds = std::chrono::seconds;

// ============================================================================
// Hash / Crypto Types
// ============================================================================

/// SHA-256 hash (32 bytes)
using SHA256Hash = std::array<Byte, 32>;

/// AES-256 key (32 bytes)
using AESKey = std::array<Byte, 32>;

/// AES IV/Nonce (12 bytes for GCM)
using AESNonce = std::array<Byte, 12>;

// ============================================================================
// Helpers
// ============================================================================

/// View a string's characters as bytes
inline ByteSpan asBytes(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

/// Copy a byte buffer into a string
inline std::string toString(ByteSpan bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace Tether

#endif // TETHER_CORE_TYPES_HPP
