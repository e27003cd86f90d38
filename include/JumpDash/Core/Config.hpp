/**
 * @file Config.hpp
 * @brief Configuration file loading for JumpDash
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 *
 * Loads `key = value` configuration files. Oversized files are refused,
 * and on POSIX the resolved path is opened with O_NOFOLLOW so a symlink
 * swapped in after resolution is not followed.
 *
 * Values are typed on load: `true`/`false` become bool, integers int64_t,
 * decimals double, everything else a string.
 */

#pragma once

#ifndef JUMPDASH_CORE_CONFIG_HPP
#define JUMPDASH_CORE_CONFIG_HPP

#include <JumpDash/Core/Types.hpp>
#include <JumpDash/Core/ErrorCodes.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace JumpDash::Config {

using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string
>;

using ConfigMap = std::map<std::string, ConfigValue>;

/**
 * @brief Configuration loader
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;
    };

    ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration text already in memory
     */
    Result<ConfigMap> loadFromMemory(std::string_view text);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Read a numeric value; integers are widened to double
 * @return @p fallback when the key is absent, ConfigInvalid when present
 *         but not numeric
 */
Result<double> getNumber(const ConfigMap& config, const std::string& key, double fallback);

/**
 * @brief Read a boolean value (`true`/`false`, or 0/1)
 */
Result<bool> getBool(const ConfigMap& config, const std::string& key, bool fallback);

/**
 * @brief Read a string value; numbers and booleans are rendered back to text
 */
std::string getString(const ConfigMap& config, const std::string& key, const std::string& fallback);

} // namespace JumpDash::Config

#endif // JUMPDASH_CORE_CONFIG_HPP
