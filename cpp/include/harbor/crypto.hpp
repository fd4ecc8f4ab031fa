/**
 * @file crypto.hpp
 * @brief Cryptographic primitives used by transforms and authenticators
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides SHA-256 key derivation, AES-256-GCM, X25519 and BLAKE2b
 * (libsodium + OpenSSL libcrypto).
 */

#pragma once

#include <array>
#include <vector>
#include <string>
#include <optional>
#include <sodium.h>

namespace harbor {

/**
 * @brief X25519 key pair used for handshake key agreement
 */
struct ExchangeKeyPair {
    std::array<uint8_t, crypto_scalarmult_BYTES> public_key;
    std::array<uint8_t, crypto_scalarmult_SCALARBYTES> secret_key;
};

/**
 * @brief Crypto - stateless cryptographic helpers
 *
 * Thread-safe; every method is static.
 */
class Crypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief SHA-256 digest
     * @param data Input bytes
     * @return 32-byte digest
     */
    static std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

    /**
     * @brief Derive a listener pre-shared key from an operator secret
     * @param secret Operator-supplied secret
     * @return SHA-256 of the secret, or an empty key when the secret is empty
     */
    static std::vector<uint8_t> derive_pre_shared_key(const std::string& secret);

    /**
     * @brief Keyed BLAKE2b hash
     * @param data Input bytes
     * @param key Hash key (empty for unkeyed; otherwise 16..64 bytes)
     * @param output_size Digest size (16..64 bytes)
     * @return Digest, or std::nullopt if key or output size is out of range
     */
    static std::optional<std::vector<uint8_t>> keyed_hash(
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& key,
        size_t output_size
    );

    // ========================================================================
    // Encryption (AES-256-GCM)
    // ========================================================================

    /**
     * @brief Encrypt with AES-256-GCM
     * @param plaintext Data to encrypt
     * @param key 32-byte key
     * @param nonce 12-byte nonce - must never be reused with same key
     * @return Ciphertext with 16-byte tag appended, or std::nullopt on error
     */
    static std::optional<std::vector<uint8_t>> aes_gcm_encrypt(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce
    );

    /**
     * @brief Decrypt with AES-256-GCM
     * @param ciphertext Ciphertext with tag appended
     * @param key 32-byte key
     * @param nonce 12-byte nonce used for encryption
     * @return Plaintext, or std::nullopt if authentication fails
     */
    static std::optional<std::vector<uint8_t>> aes_gcm_decrypt(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce
    );

    // ========================================================================
    // Key Agreement (X25519)
    // ========================================================================

    static ExchangeKeyPair generate_exchange_keypair();

    /**
     * @brief X25519 scalar multiplication
     * @return Shared point, or std::nullopt for a low-order peer key
     */
    static std::optional<std::vector<uint8_t>> key_agreement(
        const std::array<uint8_t, crypto_scalarmult_SCALARBYTES>& our_secret_key,
        const std::vector<uint8_t>& their_public_key
    );

    // ========================================================================
    // Utility Functions
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     * @param size Number of random bytes to generate
     * @return Vector of random bytes
     */
    static std::vector<uint8_t> generate_random_bytes(size_t size);

    /**
     * @brief Constant-time comparison of byte arrays (prevents timing attacks)
     * @return true if arrays are equal, false otherwise
     */
    static bool constant_time_compare(
        const std::vector<uint8_t>& a,
        const std::vector<uint8_t>& b
    );

    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert hexadecimal string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

    /**
     * @brief Convert base64 string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     */
    static void secure_zero(void* data, size_t size);
};

} // namespace harbor
