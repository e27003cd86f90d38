/**
 * @file ErrorCodes.cpp
 * @brief Log text for JumpDash error codes
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 */

#include <JumpDash/Core/ErrorCodes.hpp>

namespace JumpDash {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:            return "Success";

        case ErrorCode::HashFailed:         return "MAC computation failed";
        case ErrorCode::SignatureInvalid:   return "Save file integrity check failed";
        case ErrorCode::InvalidKey:         return "Save key is empty or too long";

        case ErrorCode::ConfigInvalid:      return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:  return "Malformed configuration line";

        case ErrorCode::FileNotFound:       return "File not found";
        case ErrorCode::FileReadError:      return "Could not read file";
        case ErrorCode::FileWriteError:     return "Could not write file";
        case ErrorCode::FileTooLarge:       return "File too large";
        case ErrorCode::InvalidPath:        return "Path cannot be used";

        case ErrorCode::JsonParseFailed:    return "Save file is not valid JSON";
        case ErrorCode::JsonInvalid:        return "Save file has an unexpected layout";
        case ErrorCode::InvalidFieldType:   return "Save entry is not a string";
        case ErrorCode::InvalidHexString:   return "Invalid hex string";
    }
    return "Unknown error";
}

} // namespace JumpDash
