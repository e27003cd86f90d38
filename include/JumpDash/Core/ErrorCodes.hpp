/**
 * @file ErrorCodes.hpp
 * @brief Failure codes for config loading and save-file persistence
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 *
 * Nothing in the game throws for an expected failure. A missing config,
 * a save file that was edited by hand or a full disk comes back as an
 * ErrorCode inside a Result, and the caller decides whether to fall back
 * to defaults or just log it.
 */

#pragma once

#ifndef JUMPDASH_CORE_ERROR_CODES_HPP
#define JUMPDASH_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <variant>

namespace JumpDash {

/**
 * @brief Why an operation failed
 *
 * The high byte groups the code by layer: 0x03 integrity tag,
 * 0x08 config, 0x09 file access, 0x0A save-file contents.
 */
enum class ErrorCode : uint16_t {
    Success            = 0x0000,

    HashFailed         = 0x0301,  ///< OpenSSL could not compute the MAC
    SignatureInvalid   = 0x0302,  ///< Save file tag does not match its entries
    InvalidKey         = 0x0303,  ///< Empty or oversized save key

    ConfigInvalid      = 0x0801,  ///< A value is out of range or the wrong type
    ConfigFileNotFound = 0x0802,
    ConfigParseFailed  = 0x0803,  ///< A line has `=` but no key

    FileNotFound       = 0x0901,
    FileReadError      = 0x0902,
    FileWriteError     = 0x0903,
    FileTooLarge       = 0x0904,
    InvalidPath        = 0x0905,  ///< Cannot be resolved, or is a symlink

    JsonParseFailed    = 0x0A01,  ///< Save file is not JSON at all
    JsonInvalid        = 0x0A02,  ///< JSON, but not the save layout or version
    InvalidFieldType   = 0x0A03,  ///< An entry value is not a string
    InvalidHexString   = 0x0A04   ///< Stored tag is not hex
};

/// Text for log lines; never empty
std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Value of type T, or the ErrorCode explaining its absence
 *
 * Failing functions simply `return ErrorCode::...;` and succeeding ones
 * return the value, so call sites read like plain returns.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : m_state(value) {}
    Result(T&& value) : m_state(std::move(value)) {}
    Result(ErrorCode error) : m_state(error) {}

    bool isSuccess() const noexcept { return m_state.index() == 0; }
    bool isFailure() const noexcept { return m_state.index() == 1; }

    /// Throws std::logic_error when called on a failure
    T& value() & { return std::get<0>(checked()); }
    const T& value() const & { return std::get<0>(checked()); }
    T&& value() && { return std::get<0>(std::move(checked())); }

    /// Throws std::logic_error when called on a success
    ErrorCode error() const {
        if (isSuccess()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(m_state);
    }

private:
    std::variant<T, ErrorCode>& checked() {
        if (isFailure()) {
            throw std::logic_error("Result holds an error, not a value");
        }
        return m_state;
    }

    const std::variant<T, ErrorCode>& checked() const {
        if (isFailure()) {
            throw std::logic_error("Result holds an error, not a value");
        }
        return m_state;
    }

    std::variant<T, ErrorCode> m_state;
};

/// Success or an ErrorCode, for operations with nothing to return
template<>
class Result<void> {
public:
    Result() = default;
    Result(ErrorCode error) : m_error(error) {}

    bool isSuccess() const noexcept { return m_error == ErrorCode::Success; }
    bool isFailure() const noexcept { return m_error != ErrorCode::Success; }
    ErrorCode error() const noexcept { return m_error; }

private:
    ErrorCode m_error = ErrorCode::Success;
};

using VoidResult = Result<void>;

/// Hand a failure from `expr` straight back to the caller
#define JUMPDASH_TRY(expr) \
    do { \
        auto jumpdashTryResult_ = (expr); \
        if (jumpdashTryResult_.isFailure()) return jumpdashTryResult_.error(); \
    } while (0)

} // namespace JumpDash

#endif // JUMPDASH_CORE_ERROR_CODES_HPP
