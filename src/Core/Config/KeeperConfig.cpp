/**
 * @file KeeperConfig.cpp
 * @brief Conversion of a ConfigMap into per-account session settings
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Core/Config.hpp>

#include <charconv>
#include <set>

namespace Tether::Config {

namespace {

constexpr std::string_view kAccountPrefix = "account";

/// Parse a whole string as a signed 32-bit integer
Result<int32_t> parseInt32(const std::string& text) {
    int32_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        return ErrorCode::ConfigInvalid;
    }
    return value;
}

Result<void> readInt(const ConfigMap& map, const char* key, int32_t& out) {
    auto it = map.find(key);
    if (it == map.end()) {
        return Result<void>::Success();
    }
    auto parsed = parseInt32(it->second);
    if (parsed.isFailure()) {
        return parsed.error();
    }
    out = parsed.value();
    return Result<void>::Success();
}

void readString(const ConfigMap& map, const std::string& key, std::string& out) {
    auto it = map.find(key);
    if (it != map.end()) {
        out = it->second;
    }
}

/// Account number of an "accountN.field" key, or 0 when the key is not one
uint32_t accountIndex(const std::string& key) {
    if (key.compare(0, kAccountPrefix.size(), kAccountPrefix) != 0) {
        return 0;
    }
    size_t dot = key.find('.', kAccountPrefix.size());
    if (dot == std::string::npos || dot == kAccountPrefix.size()) {
        return 0;
    }
    uint32_t index = 0;
    const char* first = key.data() + kAccountPrefix.size();
    const char* last = key.data() + dot;
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc() || ptr != last) {
        return 0;
    }
    return index;
}

} // namespace

Result<KeeperConfig> KeeperConfig::fromMap(const ConfigMap& map) {
    KeeperConfig config;

    readString(map, "username", config.username);
    readString(map, "password", config.password);
    readString(map, "bind_interface", config.bindInterface);
    readString(map, "proxy", config.proxy);
    readString(map, "probe_url", config.probeUrl);
    readString(map, "hostname", config.hostname);
    readString(map, "mac_address", config.macAddress);
    readString(map, "log_level", config.logLevel);
    readString(map, "log_file", config.logFile);

    TETHER_TRY(readInt(map, "check_interval", config.checkIntervalMs));
    TETHER_TRY(readInt(map, "retry_interval", config.retryIntervalMs));
    TETHER_TRY(readInt(map, "request_timeout", config.requestTimeoutMs));

    int32_t heartbeatSeconds = static_cast<int32_t>(config.heartbeatDefault.count());
    TETHER_TRY(readInt(map, "heartbeat_default", heartbeatSeconds));
    if (heartbeatSeconds <= 0 || config.requestTimeoutMs <= 0) {
        return ErrorCode::ConfigInvalid;
    }
    config.heartbeatDefault = Seconds(heartbeatSeconds);

    if (config.probeUrl.empty()) {
        return ErrorCode::ConfigInvalid;
    }

    return config;
}

Result<std::vector<KeeperConfig>> KeeperConfig::accountsFromMap(const ConfigMap& map) {
    auto baseResult = fromMap(map);
    if (baseResult.isFailure()) {
        return baseResult.error();
    }
    const KeeperConfig& base = baseResult.value();

    std::set<uint32_t> indices;
    for (const auto& [key, value] : map) {
        uint32_t index = accountIndex(key);
        if (index != 0) {
            indices.insert(index);
        }
    }

    std::vector<KeeperConfig> accounts;
    if (indices.empty()) {
        accounts.push_back(base);
        return accounts;
    }

    for (uint32_t index : indices) {
        const std::string prefix = std::string(kAccountPrefix) + std::to_string(index) + ".";
        KeeperConfig account = base;
        readString(map, prefix + "username", account.username);
        readString(map, prefix + "password", account.password);
        readString(map, prefix + "bind_interface", account.bindInterface);
        accounts.push_back(std::move(account));
    }

    return accounts;
}

void KeeperConfig::normalize() noexcept {
    if (checkIntervalMs <= 0) {
        checkIntervalMs = kDefaultIntervalMs;
    }
    if (retryIntervalMs == 0) {
        retryIntervalMs = kDefaultIntervalMs;
    }
    if (retryIntervalMs < 0) {
        retryIntervalMs = kNeverRetryMs;
    }
}

Result<void> KeeperConfig::validate() const {
    if (username.empty() || password.empty()) {
        return ErrorCode::ConfigMissing;
    }
    return Result<void>::Success();
}

std::string KeeperConfig::bindInterfaceDisplay() const {
    return bindInterface.empty() ? std::string(kSystemDefaultInterface) : bindInterface;
}

} // namespace Tether::Config
