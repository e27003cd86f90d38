/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration loading
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 */

#include <JumpDash/Core/Config.hpp>

#ifdef _WIN32
#include <fstream>
#else
#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace JumpDash::Config {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

ConfigValue inferValue(const std::string& raw) {
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return raw.substr(1, raw.size() - 2);
    }
    if (raw == "true") {
        return true;
    }
    if (raw == "false") {
        return false;
    }

    const char* begin = raw.data();
    const char* end = raw.data() + raw.size();

    int64_t integer = 0;
    auto intResult = std::from_chars(begin, end, integer);
    if (intResult.ec == std::errc() && intResult.ptr == end) {
        return integer;
    }

    // strtod rather than from_chars(double): libstdc++ before 11 lacks it
    if (!raw.empty()) {
        char* parsedEnd = nullptr;
        errno = 0;
        double number = std::strtod(raw.c_str(), &parsedEnd);
        if (errno == 0 && parsedEnd == raw.c_str() + raw.size()) {
            return number;
        }
    }

    return raw;
}

} // namespace

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        std::error_code ec;
        auto canonical = std::filesystem::canonical(path, ec);
        if (ec) {
            return ec == std::errc::no_such_file_or_directory
                ? ErrorCode::ConfigFileNotFound
                : ErrorCode::InvalidPath;
        }
        return canonical.string();
    }

    Result<std::string> readFile(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        #ifdef _WIN32
        std::ifstream file(canonPath, std::ios::binary);
        if (!file.is_open()) {
            return ErrorCode::ConfigFileNotFound;
        }

        std::error_code ec;
        auto size = std::filesystem::file_size(canonPath, ec);
        if (ec) {
            return ErrorCode::FileReadError;
        }
        if (size > options.max_file_size) {
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(size), '\0');
        if (!file.read(data.data(), static_cast<std::streamsize>(data.size()))) {
            return ErrorCode::FileReadError;
        }
        return data;

        #else
        // O_NOFOLLOW: refuse a symlink swapped in after canonicalisation
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW);
        if (fd < 0) {
            return ErrorCode::ConfigFileNotFound;
        }

        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::FileReadError;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(st.st_size), '\0');
        size_t total = 0;
        while (total < data.size()) {
            ssize_t bytesRead = read(fd, data.data() + total, data.size() - total);
            if (bytesRead < 0 && errno == EINTR) {
                continue;
            }
            if (bytesRead <= 0) {
                break;
            }
            total += static_cast<size_t>(bytesRead);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::FileReadError;
        }

        return data;
        #endif
    }

    Result<ConfigMap> parseConfig(std::string_view text) {
        ConfigMap config;

        std::istringstream stream{std::string(text)};
        std::string line;

        while (std::getline(stream, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                continue;
            }

            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (key.empty()) {
                return ErrorCode::ConfigParseFailed;
            }

            config[key] = inferValue(value);
        }

        return config;
    }
};

ConfigLoader::ConfigLoader()
    : ConfigLoader(Options{}) {}

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

Result<ConfigMap> ConfigLoader::loadFromMemory(std::string_view text) {
    return m_impl->parseConfig(text);
}

// ============================================================================
// Typed accessors
// ============================================================================

Result<double> getNumber(const ConfigMap& config, const std::string& key, double fallback) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (const auto* integer = std::get_if<int64_t>(&it->second)) {
        return static_cast<double>(*integer);
    }
    if (const auto* number = std::get_if<double>(&it->second)) {
        return *number;
    }
    return ErrorCode::ConfigInvalid;
}

Result<bool> getBool(const ConfigMap& config, const std::string& key, bool fallback) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (const auto* flag = std::get_if<bool>(&it->second)) {
        return *flag;
    }
    if (const auto* integer = std::get_if<int64_t>(&it->second)) {
        if (*integer == 0 || *integer == 1) {
            return *integer == 1;
        }
    }
    return ErrorCode::ConfigInvalid;
}

std::string getString(const ConfigMap& config, const std::string& key, const std::string& fallback) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else {
            std::ostringstream out;
            out << value;
            return out.str();
        }
    }, it->second);
}

} // namespace JumpDash::Config
