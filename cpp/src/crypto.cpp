/**
 * @file crypto.cpp
 * @brief Implementation of cryptographic primitives
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - SHA-256 and AES-256-GCM: OpenSSL EVP
 * - X25519, BLAKE2b, CSPRNG, encodings: libsodium
 */

#include "harbor/crypto.hpp"
#include "harbor/config.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <memory>

namespace harbor {

namespace {
    struct CipherContextDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };

    using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;
}

// ============================================================================
// Initialization
// ============================================================================

bool Crypto::initialize() {
    // Initialize libsodium (safe to call multiple times)
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Hashing
// ============================================================================

std::vector<uint8_t> Crypto::sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    unsigned int digest_len = 0;

    EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr);
    digest.resize(digest_len);

    return digest;
}

std::vector<uint8_t> Crypto::derive_pre_shared_key(const std::string& secret) {
    if (secret.empty()) {
        return {};
    }
    return sha256(std::vector<uint8_t>(secret.begin(), secret.end()));
}

std::optional<std::vector<uint8_t>> Crypto::keyed_hash(
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& key,
    size_t output_size
) {
    if (output_size < crypto_generichash_BYTES_MIN || output_size > crypto_generichash_BYTES_MAX) {
        return std::nullopt;
    }
    if (!key.empty() &&
        (key.size() < crypto_generichash_KEYBYTES_MIN || key.size() > crypto_generichash_KEYBYTES_MAX)) {
        return std::nullopt;
    }

    std::vector<uint8_t> digest(output_size);
    int result = crypto_generichash(
        digest.data(), digest.size(),
        data.data(), data.size(),
        key.empty() ? nullptr : key.data(), key.size()
    );

    if (result != 0) {
        return std::nullopt;
    }
    return digest;
}

// ============================================================================
// Encryption (AES-256-GCM)
// ============================================================================

std::optional<std::vector<uint8_t>> Crypto::aes_gcm_encrypt(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce
) {
    if (key.size() != config::AES_KEY_SIZE || nonce.size() != config::AES_NONCE_SIZE) {
        return std::nullopt;
    }

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) != 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + config::AES_TAG_SIZE);
    int len = 0;
    int total = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return std::nullopt;
        }
        total = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;

    // Append authentication tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(config::AES_TAG_SIZE), ciphertext.data() + total) != 1) {
        return std::nullopt;
    }

    ciphertext.resize(total + config::AES_TAG_SIZE);
    return ciphertext;
}

std::optional<std::vector<uint8_t>> Crypto::aes_gcm_decrypt(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce
) {
    if (key.size() != config::AES_KEY_SIZE || nonce.size() != config::AES_NONCE_SIZE) {
        return std::nullopt;
    }

    // Ciphertext must be at least as long as the authentication tag
    if (ciphertext.size() < config::AES_TAG_SIZE) {
        return std::nullopt;
    }

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) != 1) {
        return std::nullopt;
    }

    size_t body_size = ciphertext.size() - config::AES_TAG_SIZE;
    std::vector<uint8_t> plaintext(body_size);
    int len = 0;
    int total = 0;

    if (body_size > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext.data(), static_cast<int>(body_size)) != 1) {
            return std::nullopt;
        }
        total = len;
    }

    std::vector<uint8_t> tag(ciphertext.end() - config::AES_TAG_SIZE, ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1) {
        return std::nullopt;
    }

    // Fails if the tag doesn't match (tampering or wrong key)
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;

    plaintext.resize(total);
    return plaintext;
}

// ============================================================================
// Key Agreement (X25519)
// ============================================================================

ExchangeKeyPair Crypto::generate_exchange_keypair() {
    ExchangeKeyPair keypair;
    randombytes_buf(keypair.secret_key.data(), keypair.secret_key.size());
    crypto_scalarmult_base(keypair.public_key.data(), keypair.secret_key.data());
    return keypair;
}

std::optional<std::vector<uint8_t>> Crypto::key_agreement(
    const std::array<uint8_t, crypto_scalarmult_SCALARBYTES>& our_secret_key,
    const std::vector<uint8_t>& their_public_key
) {
    if (their_public_key.size() != crypto_scalarmult_BYTES) {
        return std::nullopt;
    }

    std::vector<uint8_t> shared(crypto_scalarmult_BYTES);
    if (crypto_scalarmult(shared.data(), our_secret_key.data(), their_public_key.data()) != 0) {
        return std::nullopt;
    }
    return shared;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<uint8_t> Crypto::generate_random_bytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    randombytes_buf(bytes.data(), size);
    return bytes;
}

bool Crypto::constant_time_compare(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b
) {
    // Must be same length
    if (a.size() != b.size()) {
        return false;
    }

    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Crypto::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::vector<char> hex(bytes.size() * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    return std::string(hex.data());
}

std::optional<std::vector<uint8_t>> Crypto::hex_to_bytes(const std::string& hex) {
    // Hex string must have even length
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.length() / 2);
    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_hex2bin(
        bytes.data(), bytes.size(),
        hex.c_str(), hex.length(),
        nullptr,
        &decoded_len,
        &end_ptr
    );

    // Reject trailing garbage that sodium_hex2bin stops at
    if (result != 0 || end_ptr != hex.c_str() + hex.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

std::string Crypto::bytes_to_base64(const std::vector<uint8_t>& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> Crypto::base64_to_bytes(const std::string& base64) {
    std::vector<uint8_t> bytes(base64.length());

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,  // No ignore characters
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0 || end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

void Crypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

} // namespace harbor
