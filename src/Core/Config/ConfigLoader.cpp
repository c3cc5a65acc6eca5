/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration file loading
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Core/Config.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <cerrno>
#include <sstream>

namespace Tether::Config {

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<ByteBuffer> readFile(const std::string& path) {
        if (path.empty()) {
            return ErrorCode::InvalidPath;
        }

        // O_NOFOLLOW refuses a symlink planted in place of the file
        int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            return errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::IOError;
        }

        // Size from the open descriptor, not the path
        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(st.st_size));
        size_t total = 0;
        while (total < data.size()) {
            ssize_t n = read(fd, data.data() + total, data.size() - total);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                close(fd);
                return ErrorCode::IOError;
            }
            if (n == 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::IOError;
        }

        return data;
    }

    Result<ConfigMap> parseConfig(ByteSpan data) {
        if (data.size() > options.max_file_size) {
            return ErrorCode::FileTooLarge;
        }

        ConfigMap config;

        std::istringstream stream(toString(data));
        std::string line;

        while (std::getline(stream, line)) {
            size_t start = line.find_first_not_of(" \t");
            if (start == std::string::npos) {
                continue;
            }

            if (line[start] == '#' || line[start] == ';') {
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);

            if (key.empty()) {
                continue;
            }

            // Later lines win
            config[key] = value;
        }

        return config;
    }
};

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFile(path);
    if (dataResult.isFailure()) {
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> ConfigLoader::loadFromMemory(ByteSpan data) {
    return m_impl->parseConfig(data);
}

} // namespace Tether::Config
