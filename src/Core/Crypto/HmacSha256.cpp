/**
 * @file HmacSha256.cpp
 * @brief HMAC-SHA256 through the OpenSSL 3 EVP_MAC interface
 * @author JumpDash Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 JumpDash. All rights reserved.
 */

#include <JumpDash/Core/Crypto.hpp>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <memory>

namespace JumpDash::Crypto {

namespace {

struct MacDeleter {
    void operator()(EVP_MAC* mac) const { EVP_MAC_free(mac); }
};

struct MacContextDeleter {
    void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
};

using MacPtr = std::unique_ptr<EVP_MAC, MacDeleter>;
using MacContextPtr = std::unique_ptr<EVP_MAC_CTX, MacContextDeleter>;

} // namespace

HmacSha256::HmacSha256(ByteSpan key)
    : m_key(key.begin(), key.end()) {
}

Result<ByteBuffer> HmacSha256::compute(ByteSpan data) const {
    if (m_key.empty() || m_key.size() > MAX_KEY_SIZE) {
        return ErrorCode::InvalidKey;
    }

    MacPtr mac(EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr));
    if (!mac) {
        return ErrorCode::HashFailed;
    }
    MacContextPtr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return ErrorCode::HashFailed;
    }

    char digest[] = "SHA256";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
        OSSL_PARAM_construct_end()
    };

    if (EVP_MAC_init(ctx.get(), m_key.data(), m_key.size(), params) != 1) {
        return ErrorCode::HashFailed;
    }
    if (!data.empty() && EVP_MAC_update(ctx.get(), data.data(), data.size()) != 1) {
        return ErrorCode::HashFailed;
    }

    ByteBuffer tag(TAG_SIZE);
    size_t written = 0;
    if (EVP_MAC_final(ctx.get(), tag.data(), &written, tag.size()) != 1 || written != TAG_SIZE) {
        return ErrorCode::HashFailed;
    }
    return tag;
}

Result<bool> HmacSha256::verify(ByteSpan data, ByteSpan tag) const {
    auto expected = compute(data);
    if (expected.isFailure()) {
        return expected.error();
    }
    return constantTimeCompare(expected.value(), tag);
}

} // namespace JumpDash::Crypto
