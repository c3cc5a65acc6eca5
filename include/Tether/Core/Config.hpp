/**
 * @file Config.hpp
 * @brief Configuration loading for Tether
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 *
 * A configuration file is a list of key=value lines. Lines starting with
 * '#' or ';' are comments. The loader refuses symlinks and files larger
 * than the configured limit.
 *
 * @code
 * username = alice
 * password = secret
 * bind_interface = eth0
 * check_interval = 10000
 * retry_interval = -1
 *
 * account2.username = bob
 * account2.password = hunter2
 * account2.bind_interface = eth1
 * @endcode
 */

#pragma once

#ifndef TETHER_CORE_CONFIG_HPP
#define TETHER_CORE_CONFIG_HPP

#include <Tether/Core/Types.hpp>
#include <Tether/Core/ErrorCodes.hpp>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Tether::Config {

using ConfigMap = std::map<std::string, std::string>;

/// Options for ConfigLoader (defined at namespace scope so it can be a default argument)
struct ConfigLoaderOptions {
    size_t max_file_size = 1024 * 1024;  // 1MB default
};

/**
 * @brief key=value configuration file loader
 */
class ConfigLoader {
public:
    using Options = ConfigLoaderOptions;

    explicit ConfigLoader(const Options& options = {});
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration, FileNotFound, FileTooLarge or IOError
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration already in memory
     */
    Result<ConfigMap> loadFromMemory(ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/// Default probe endpoint; answers 204 only on an open network
inline constexpr const char* kDefaultProbeUrl = "http://connect.rom.miui.com/generate_204";

/// Poll and retry intervals fall back to this when unset or zero
inline constexpr int32_t kDefaultIntervalMs = 10000;

/// Retry interval meaning "never retry"
inline constexpr int32_t kNeverRetryMs = std::numeric_limits<int32_t>::max();

/// Log display name for an unbound session
inline constexpr const char* kSystemDefaultInterface = "sys_default";

/**
 * @brief Settings for one portal session
 */
struct KeeperConfig {
    std::string username;
    std::string password;
    std::string bindInterface;     ///< Empty = system routing
    std::string proxy;             ///< Empty = no proxy

    int32_t checkIntervalMs = kDefaultIntervalMs;
    int32_t retryIntervalMs = kDefaultIntervalMs;
    int32_t requestTimeoutMs = 10000;
    Seconds heartbeatDefault{60};

    std::string probeUrl = kDefaultProbeUrl;
    std::string hostname;          ///< Empty = gethostname()
    std::string macAddress;        ///< Empty = read from sysfs

    std::string logLevel = "info";
    std::string logFile;

    /**
     * @brief Build a configuration from the top-level keys of @p map
     * @return ConfigInvalid when a numeric key does not hold an integer
     * that fits its field
     */
    static Result<KeeperConfig> fromMap(const ConfigMap& map);

    /**
     * @brief One configuration per accountN.* group
     *
     * Each account inherits every top-level setting and overrides
     * username, password and bind_interface with its own keys. Without
     * any accountN.* key the single top-level configuration is returned.
     */
    static Result<std::vector<KeeperConfig>> accountsFromMap(const ConfigMap& map);

    /**
     * @brief Apply interval defaults
     *
     * check_interval <= 0 and retry_interval == 0 become 10000 ms;
     * retry_interval < 0 becomes INT32_MAX.
     */
    void normalize() noexcept;

    /**
     * @brief ConfigMissing when username or password is empty
     */
    Result<void> validate() const;

    /**
     * @brief Interface name for log prefixes ("sys_default" when unbound)
     */
    std::string bindInterfaceDisplay() const;
};

} // namespace Tether::Config

#endif // TETHER_CORE_CONFIG_HPP
