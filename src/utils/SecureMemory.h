// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file SecureMemory.h
 * @brief Zeroizing containers and RAII handles for key material
 *
 * Everything that holds a secret (derived keys, serialized plaintext,
 * master passphrases) lives in one of these types so that the bytes are
 * overwritten with OPENSSL_cleanse() before the memory is returned.
 */

#ifndef ZEROVAULT_SECURE_MEMORY_H
#define ZEROVAULT_SECURE_MEMORY_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <glibmm/ustring.h>

namespace ZeroVault {

/**
 * @brief Custom deleter for EVP_CIPHER_CTX
 */
struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 *
 * @code
 * EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
 * if (!ctx) {
 *     return std::unexpected(VaultError::EncryptionFailed);
 * }
 * @endcode
 */
using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;

/**
 * @brief Allocator that zeroes memory before releasing it
 *
 * @tparam T Element type (normally uint8_t)
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

/**
 * @brief std::vector whose storage is zeroized on deallocation
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief 256-bit symmetric key derived from the master secret
 *
 * Only SessionLifecycle keeps one of these alive beyond a single call.
 */
using SessionKey = SecureVector<uint8_t>;

/**
 * @brief Overwrite and empty a std::string holding sensitive text
 */
inline void secure_clear(std::string& str) noexcept {
    if (!str.empty()) {
        OPENSSL_cleanse(str.data(), str.size());
        str.clear();
    }
}

/**
 * @brief Overwrite and empty a Glib::ustring holding sensitive text
 */
inline void secure_clear_ustring(Glib::ustring& str) noexcept {
    if (!str.empty()) {
        OPENSSL_cleanse(const_cast<char*>(str.data()), str.bytes());
        str.clear();
    }
}

/**
 * @brief Move-only owner of a master passphrase
 *
 * The passphrase is wiped when the owner goes out of scope, including on
 * exception paths.
 *
 * @code
 * SecureString secret{Glib::ustring(entry_text)};
 * auto result = session.unlock(secret.get().raw());
 * // secret wiped on scope exit
 * @endcode
 */
class SecureString {
public:
    explicit SecureString(Glib::ustring str) : str_(std::move(str)) {}

    ~SecureString() {
        secure_clear_ustring(str_);
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept
        : str_(std::move(other.str_)) {
        secure_clear_ustring(other.str_);
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear_ustring(str_);
            str_ = std::move(other.str_);
            secure_clear_ustring(other.str_);
        }
        return *this;
    }

    [[nodiscard]] const Glib::ustring& get() const noexcept { return str_; }

    void clear() noexcept { secure_clear_ustring(str_); }

    [[nodiscard]] bool empty() const noexcept { return str_.empty(); }

    /// Length in code points
    [[nodiscard]] size_t length() const noexcept { return str_.length(); }

    /// Length in bytes
    [[nodiscard]] size_t bytes() const noexcept { return str_.bytes(); }

private:
    Glib::ustring str_;
};

} // namespace ZeroVault

#endif // ZEROVAULT_SECURE_MEMORY_H
