/**
 * @file CryptoUtils.cpp
 * @brief Hex encoding and constant-time comparison
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 */

#include <JumpDash/Core/Crypto.hpp>
#include <openssl/crypto.h>
#include <iomanip>
#include <sstream>

namespace JumpDash::Crypto {

std::string toHex(ByteSpan data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (Byte b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }

    return oss.str();
}

Result<ByteBuffer> fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return ErrorCode::InvalidHexString;
    }

    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    ByteBuffer result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int highVal = hexValue(hex[i]);
        int lowVal = hexValue(hex[i + 1]);

        if (highVal == -1 || lowVal == -1) {
            return ErrorCode::InvalidHexString;
        }

        result.push_back(static_cast<Byte>((highVal << 4) | lowVal));
    }

    return result;
}

bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept {
    // Length is public for MAC tags
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }

    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace JumpDash::Crypto
