/**
 * @file HostIdentity.cpp
 * @brief Host name and MAC address discovery (Linux sysfs)
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/HostIdentity.hpp>

#include <unistd.h>
#include <climits>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <vector>

namespace Tether::Portal {

namespace {

const std::filesystem::path kNetClassDir = "/sys/class/net";
constexpr const char* kNullMac = "00:00:00:00:00:00";

std::string readAddressFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::string address;
    if (!file || !std::getline(file, address)) {
        return {};
    }
    address.erase(address.find_last_not_of(" \t\r\n") + 1);
    std::transform(address.begin(), address.end(), address.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return address;
}

} // namespace

Result<std::string> systemHostname() {
    char buffer[HOST_NAME_MAX + 1] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return ErrorCode::SystemError;
    }
    return std::string(buffer);
}

Result<std::string> interfaceMacAddress(const std::string& interfaceName) {
    if (interfaceName.empty() || interfaceName.find('/') != std::string::npos) {
        return ErrorCode::InvalidArgument;
    }

    std::string address = readAddressFile(kNetClassDir / interfaceName / "address");
    if (address.empty()) {
        return ErrorCode::InterfaceNotFound;
    }
    return address;
}

Result<std::string> defaultMacAddress() {
    std::error_code ec;
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(kNetClassDir, ec)) {
        names.push_back(entry.path().filename().string());
    }
    if (ec) {
        return ErrorCode::InterfaceNotFound;
    }

    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        if (name == "lo") {
            continue;
        }
        auto address = interfaceMacAddress(name);
        if (address.isSuccess() && address.value() != kNullMac) {
            return address;
        }
    }

    return ErrorCode::InterfaceNotFound;
}

Result<std::string> macAddressFor(const std::string& interfaceName) {
    if (interfaceName.empty()) {
        return defaultMacAddress();
    }
    return interfaceMacAddress(interfaceName);
}

} // namespace Tether::Portal
