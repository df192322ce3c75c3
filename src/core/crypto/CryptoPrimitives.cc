// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "CryptoPrimitives.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <limits>
#include <stdexcept>

namespace ZeroVault {

bool CryptoPrimitives::pbkdf2_sha256(
    std::string_view secret,
    std::span<const uint8_t> salt,
    uint32_t iterations,
    SessionKey& out) {

    if (iterations == 0 ||
        iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        return false;
    }

    out.assign(KEY_LENGTH, 0);

    int result = PKCS5_PBKDF2_HMAC(
        secret.data(), static_cast<int>(secret.size()),
        salt.data(), static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha256(),
        static_cast<int>(KEY_LENGTH),
        out.data()
    );

    if (result != 1) {
        out.clear();
        return false;
    }
    return true;
}

bool CryptoPrimitives::aes_gcm_encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::vector<uint8_t>& ciphertext) {

    if (key.size() != KEY_LENGTH || nonce.size() != NONCE_LENGTH) {
        return false;
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return false;
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) != 1) {
        return false;
    }

    // GCM is a stream mode: output length equals input length, plus the tag
    ciphertext.resize(plaintext.size() + TAG_LENGTH);
    int len = 0;
    int ciphertext_len = 0;

    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return false;
    }
    ciphertext_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertext_len, &len) != 1) {
        return false;
    }
    ciphertext_len += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_LENGTH),
                            ciphertext.data() + ciphertext_len) != 1) {
        return false;
    }

    ciphertext.resize(static_cast<size_t>(ciphertext_len) + TAG_LENGTH);
    return true;
}

bool CryptoPrimitives::aes_gcm_decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    SecureVector<uint8_t>& plaintext) {

    if (key.size() != KEY_LENGTH || nonce.size() != NONCE_LENGTH) {
        return false;
    }
    if (ciphertext.size() < TAG_LENGTH) {
        return false;
    }

    const auto body = ciphertext.first(ciphertext.size() - TAG_LENGTH);
    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer
    SecureVector<uint8_t> tag(ciphertext.end() - TAG_LENGTH, ciphertext.end());

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return false;
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) != 1) {
        return false;
    }

    plaintext.assign(body.size() + 1, 0);  // +1 so data() is never null for empty input
    int len = 0;
    int plaintext_len = 0;

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          body.data(), static_cast<int>(body.size())) != 1) {
        plaintext.clear();
        return false;
    }
    plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_LENGTH),
                            tag.data()) != 1) {
        plaintext.clear();
        return false;
    }

    // Verifies the tag; nothing decrypted so far may be released on failure
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) != 1) {
        plaintext.clear();
        return false;
    }
    plaintext_len += len;

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return true;
}

std::vector<uint8_t> CryptoPrimitives::random_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (length == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        // Never hand out predictable data
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
    }
    return bytes;
}

uint32_t CryptoPrimitives::random_uniform(uint32_t upper_bound) {
    if (upper_bound == 0) {
        throw std::invalid_argument("random_uniform: upper_bound must be positive");
    }

    // Largest multiple of upper_bound that fits in 32 bits; values at or
    // above it are redrawn
    const uint64_t range = uint64_t{1} << 32;
    const uint64_t limit = range - (range % upper_bound);

    while (true) {
        uint32_t value = 0;
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
            throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
        }
        if (value < limit) {
            return value % upper_bound;
        }
    }
}

}  // namespace ZeroVault
