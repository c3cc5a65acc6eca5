/**
 * @file HostIdentity.hpp
 * @brief Host name and hardware address reported to the portal
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#pragma once

#ifndef TETHER_PORTAL_HOST_IDENTITY_HPP
#define TETHER_PORTAL_HOST_IDENTITY_HPP

#include <Tether/Core/ErrorCodes.hpp>
#include <string>

namespace Tether::Portal {

/**
 * @brief gethostname(), or SystemError
 */
Result<std::string> systemHostname();

/**
 * @brief Hardware address of @p interfaceName from /sys/class/net
 * @return Lowercase "aa:bb:cc:dd:ee:ff", or InterfaceNotFound
 */
Result<std::string> interfaceMacAddress(const std::string& interfaceName);

/**
 * @brief Hardware address of the first non-loopback interface (by name)
 * @return InterfaceNotFound when no interface has a usable address
 */
Result<std::string> defaultMacAddress();

/**
 * @brief Hardware address for a session bound to @p interfaceName
 *
 * Empty @p interfaceName selects defaultMacAddress().
 */
Result<std::string> macAddressFor(const std::string& interfaceName);

} // namespace Tether::Portal

#endif // TETHER_PORTAL_HOST_IDENTITY_HPP
