/**
 * @file test_crypto.cpp
 * @brief Unit tests for Crypto
 *
 * Tests cryptographic helpers including:
 * - SHA-256 and pre-shared key derivation
 * - Keyed BLAKE2b hashing
 * - AES-256-GCM encryption/decryption
 * - X25519 key agreement
 * - Encoding helpers and constant-time comparison
 */

#include <gtest/gtest.h>
#include "harbor/crypto.hpp"
#include "harbor/config.hpp"

#include <algorithm>
#include <thread>
#include <vector>

using namespace harbor;

class CryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(Crypto::initialize());
    }

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
};

// ============================================================================
// Hashing Tests
// ============================================================================

TEST_F(CryptoTest, Sha256KnownVector) {
    auto digest = Crypto::sha256(bytes("abc"));
    EXPECT_EQ(Crypto::bytes_to_hex(digest),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(CryptoTest, DerivePreSharedKeyIsSha256) {
    auto key = Crypto::derive_pre_shared_key("merlin");
    EXPECT_EQ(key.size(), config::PSK_DIGEST_SIZE);
    EXPECT_EQ(key, Crypto::sha256(bytes("merlin")));
}

TEST_F(CryptoTest, DerivePreSharedKeyEmptySecret) {
    EXPECT_TRUE(Crypto::derive_pre_shared_key("").empty());
}

TEST_F(CryptoTest, KeyedHashDependsOnKey) {
    auto data = bytes("transcript");
    auto a = Crypto::keyed_hash(data, Crypto::generate_random_bytes(32), 32);
    auto b = Crypto::keyed_hash(data, Crypto::generate_random_bytes(32), 32);

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->size(), 32u);
    EXPECT_NE(*a, *b);
}

TEST_F(CryptoTest, KeyedHashUnkeyedIsDeterministic) {
    auto a = Crypto::keyed_hash(bytes("data"), {}, 32);
    auto b = Crypto::keyed_hash(bytes("data"), {}, 32);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, *b);
}

TEST_F(CryptoTest, KeyedHashRejectsShortKey) {
    EXPECT_FALSE(Crypto::keyed_hash(bytes("data"), std::vector<uint8_t>(4, 1), 32).has_value());
}

TEST_F(CryptoTest, KeyedHashRejectsOutputSize) {
    EXPECT_FALSE(Crypto::keyed_hash(bytes("data"), {}, 8).has_value());
    EXPECT_FALSE(Crypto::keyed_hash(bytes("data"), {}, 128).has_value());
}

// ============================================================================
// AES-256-GCM Tests
// ============================================================================

TEST_F(CryptoTest, AesEncryptDecrypt) {
    auto key = Crypto::generate_random_bytes(config::AES_KEY_SIZE);
    auto nonce = Crypto::generate_random_bytes(config::AES_NONCE_SIZE);
    auto plaintext = bytes("agent check in");

    auto ciphertext = Crypto::aes_gcm_encrypt(plaintext, key, nonce);
    ASSERT_TRUE(ciphertext.has_value());
    EXPECT_EQ(ciphertext->size(), plaintext.size() + config::AES_TAG_SIZE);

    auto decrypted = Crypto::aes_gcm_decrypt(*ciphertext, key, nonce);
    ASSERT_TRUE(decrypted.has_value());
    EXPECT_EQ(*decrypted, plaintext);
}

TEST_F(CryptoTest, AesEncryptEmptyPlaintext) {
    auto key = Crypto::generate_random_bytes(config::AES_KEY_SIZE);
    auto nonce = Crypto::generate_random_bytes(config::AES_NONCE_SIZE);

    auto ciphertext = Crypto::aes_gcm_encrypt({}, key, nonce);
    ASSERT_TRUE(ciphertext.has_value());
    EXPECT_EQ(ciphertext->size(), config::AES_TAG_SIZE);

    auto decrypted = Crypto::aes_gcm_decrypt(*ciphertext, key, nonce);
    ASSERT_TRUE(decrypted.has_value());
    EXPECT_TRUE(decrypted->empty());
}

TEST_F(CryptoTest, AesDecryptModifiedCiphertext) {
    auto key = Crypto::generate_random_bytes(config::AES_KEY_SIZE);
    auto nonce = Crypto::generate_random_bytes(config::AES_NONCE_SIZE);

    auto ciphertext = Crypto::aes_gcm_encrypt(bytes("payload"), key, nonce);
    ASSERT_TRUE(ciphertext.has_value());
    (*ciphertext)[0] ^= 0xFF;

    EXPECT_FALSE(Crypto::aes_gcm_decrypt(*ciphertext, key, nonce).has_value());
}

TEST_F(CryptoTest, AesDecryptWrongKey) {
    auto nonce = Crypto::generate_random_bytes(config::AES_NONCE_SIZE);
    auto ciphertext = Crypto::aes_gcm_encrypt(
        bytes("payload"), Crypto::generate_random_bytes(config::AES_KEY_SIZE), nonce);
    ASSERT_TRUE(ciphertext.has_value());

    EXPECT_FALSE(Crypto::aes_gcm_decrypt(
        *ciphertext, Crypto::generate_random_bytes(config::AES_KEY_SIZE), nonce).has_value());
}

TEST_F(CryptoTest, AesRejectsBadKeyAndNonceSizes) {
    auto nonce = Crypto::generate_random_bytes(config::AES_NONCE_SIZE);
    auto key = Crypto::generate_random_bytes(config::AES_KEY_SIZE);

    EXPECT_FALSE(Crypto::aes_gcm_encrypt(bytes("x"), std::vector<uint8_t>(16, 0), nonce).has_value());
    EXPECT_FALSE(Crypto::aes_gcm_encrypt(bytes("x"), key, std::vector<uint8_t>(8, 0)).has_value());
    EXPECT_FALSE(Crypto::aes_gcm_decrypt(std::vector<uint8_t>(4, 0), key, nonce).has_value());
}

// ============================================================================
// Key Agreement Tests
// ============================================================================

TEST_F(CryptoTest, KeyAgreementSharedSecretMatches) {
    auto alice = Crypto::generate_exchange_keypair();
    auto bob = Crypto::generate_exchange_keypair();

    auto alice_shared = Crypto::key_agreement(
        alice.secret_key, std::vector<uint8_t>(bob.public_key.begin(), bob.public_key.end()));
    auto bob_shared = Crypto::key_agreement(
        bob.secret_key, std::vector<uint8_t>(alice.public_key.begin(), alice.public_key.end()));

    ASSERT_TRUE(alice_shared.has_value());
    ASSERT_TRUE(bob_shared.has_value());
    EXPECT_EQ(*alice_shared, *bob_shared);
}

TEST_F(CryptoTest, KeyAgreementRejectsLowOrderPoint) {
    auto keypair = Crypto::generate_exchange_keypair();
    EXPECT_FALSE(Crypto::key_agreement(keypair.secret_key, std::vector<uint8_t>(32, 0)).has_value());
}

TEST_F(CryptoTest, KeyAgreementRejectsWrongSize) {
    auto keypair = Crypto::generate_exchange_keypair();
    EXPECT_FALSE(Crypto::key_agreement(keypair.secret_key, std::vector<uint8_t>(16, 9)).has_value());
}

// ============================================================================
// Utility Function Tests
// ============================================================================

TEST_F(CryptoTest, GenerateRandomBytesUniqueness) {
    auto a = Crypto::generate_random_bytes(32);
    auto b = Crypto::generate_random_bytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
}

TEST_F(CryptoTest, ConstantTimeCompare) {
    EXPECT_TRUE(Crypto::constant_time_compare({1, 2, 3}, {1, 2, 3}));
    EXPECT_FALSE(Crypto::constant_time_compare({1, 2, 3}, {1, 2, 4}));
    EXPECT_FALSE(Crypto::constant_time_compare({1, 2, 3}, {1, 2}));
    EXPECT_TRUE(Crypto::constant_time_compare({}, {}));
}

TEST_F(CryptoTest, HexConversion) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(Crypto::bytes_to_hex(data), "000fabff");

    auto decoded = Crypto::hex_to_bytes("000fabff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

TEST_F(CryptoTest, HexRejectsInvalidInput) {
    EXPECT_FALSE(Crypto::hex_to_bytes("abc").has_value());
    EXPECT_FALSE(Crypto::hex_to_bytes("zz").has_value());
}

TEST_F(CryptoTest, Base64Conversion) {
    EXPECT_EQ(Crypto::bytes_to_base64(bytes("merlin")), "bWVybGlu");

    auto decoded = Crypto::base64_to_bytes("bWVybGlu");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes("merlin"));
}

TEST_F(CryptoTest, Base64RejectsInvalidInput) {
    EXPECT_FALSE(Crypto::base64_to_bytes("not base64!").has_value());
}

TEST_F(CryptoTest, SecureZeroMemory) {
    std::vector<uint8_t> secret = {1, 2, 3, 4};
    Crypto::secure_zero(secret.data(), secret.size());
    EXPECT_TRUE(std::all_of(secret.begin(), secret.end(), [](uint8_t b) { return b == 0; }));
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(CryptoTest, ConcurrentEncryptDecrypt) {
    auto key = Crypto::generate_random_bytes(config::AES_KEY_SIZE);
    std::vector<std::thread> threads;
    std::vector<int> results(8, 0);

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            auto nonce = Crypto::generate_random_bytes(config::AES_NONCE_SIZE);
            auto plaintext = bytes("message " + std::to_string(i));
            auto ciphertext = Crypto::aes_gcm_encrypt(plaintext, key, nonce);
            if (!ciphertext) {
                return;
            }
            auto decrypted = Crypto::aes_gcm_decrypt(*ciphertext, key, nonce);
            results[i] = decrypted && *decrypted == plaintext ? 1 : 0;
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    for (int result : results) {
        EXPECT_EQ(result, 1);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
