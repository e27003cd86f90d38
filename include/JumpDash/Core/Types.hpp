/**
 * @file Types.hpp
 * @brief Byte buffers, clock aliases and the JumpDash version
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 */

#pragma once

#ifndef JUMPDASH_CORE_TYPES_HPP
#define JUMPDASH_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace JumpDash {

/// Printed in the startup banner
inline constexpr const char* VERSION_STRING = "1.0.0";

using Byte = uint8_t;

/// Read-only bytes handed to the save-file MAC
using ByteSpan = std::span<const Byte>;

/// MAC tags and decoded hex
using ByteBuffer = std::vector<Byte>;

/// Frame clock used when no other time source is injected
using Clock = std::chrono::steady_clock;
using FloatSeconds = std::chrono::duration<double>;

/// Bytes of a string (save payloads, keys) without copying
inline ByteSpan asBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const Byte*>(text.data()), text.size()};
}

} // namespace JumpDash

#endif // JUMPDASH_CORE_TYPES_HPP
