/**
 * @file Crypto.hpp
 * @brief Integrity tag for the save file
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 *
 * The save file stores an HMAC-SHA256 of its entries under a per-install
 * key, written as hex. A high score edited by hand no longer matches the
 * tag and the file is treated as absent.
 */

#pragma once

#ifndef JUMPDASH_CORE_CRYPTO_HPP
#define JUMPDASH_CORE_CRYPTO_HPP

#include <JumpDash/Core/Types.hpp>
#include <JumpDash/Core/ErrorCodes.hpp>
#include <cstddef>
#include <string>

namespace JumpDash::Crypto {

/**
 * @brief HMAC-SHA256 keyed once, applied to any number of payloads
 */
class HmacSha256 {
public:
    static constexpr size_t TAG_SIZE = 32;

    /// Longest key accepted; the save key comes from a config string
    static constexpr size_t MAX_KEY_SIZE = 1024;

    explicit HmacSha256(ByteSpan key);

    /**
     * @return TAG_SIZE bytes, InvalidKey for an empty or oversized key,
     *         HashFailed if OpenSSL refuses
     */
    Result<ByteBuffer> compute(ByteSpan data) const;

    /**
     * @brief Recompute the tag for @p data and compare in constant time
     * @return false on mismatch (including a tag of the wrong length);
     *         an error only when the tag cannot be computed
     */
    Result<bool> verify(ByteSpan data, ByteSpan tag) const;

private:
    ByteBuffer m_key;
};

/// Lowercase hex, two characters per byte
std::string toHex(ByteSpan data);

/// Either case accepted; InvalidHexString on odd length or a non-hex character
Result<ByteBuffer> fromHex(const std::string& hex);

/// CRYPTO_memcmp over equal lengths; different lengths compare unequal
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept;

} // namespace JumpDash::Crypto

#endif // JUMPDASH_CORE_CRYPTO_HPP
