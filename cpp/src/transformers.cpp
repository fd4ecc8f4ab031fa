/**
 * @file transformers.cpp
 * @brief Implementation of encoding and encryption stages
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/transformers.hpp"
#include "harbor/config.hpp"
#include "harbor/crypto.hpp"
#include "harbor/errors.hpp"

namespace harbor {

namespace {

// Byte stages cannot encode a structured message directly
const std::vector<uint8_t>& require_bytes(const TransformData& input, const std::string& stage) {
    const auto* bytes = std::get_if<std::vector<uint8_t>>(&input);
    if (!bytes) {
        throw TransformError(stage + " requires byte input; configure a message encoder after it");
    }
    return *bytes;
}

std::vector<uint8_t> xor_bytes(const std::vector<uint8_t>& data, const std::vector<uint8_t>& key) {
    std::vector<uint8_t> out(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = static_cast<uint8_t>(data[i] ^ key[i % key.size()]);
    }
    return out;
}

} // namespace

// ============================================================================
// MessageEncoder (gob-base)
// ============================================================================

std::vector<uint8_t> MessageEncoder::construct(const TransformData& input, const std::vector<uint8_t>&) const {
    const auto* message = std::get_if<Message>(&input);
    if (!message) {
        throw TransformError(name() + " requires a structured message as input");
    }
    return message->to_msgpack();
}

TransformData MessageEncoder::deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>&) const {
    auto message = Message::from_msgpack(input);
    if (!message) {
        throw TransformError(name() + " unable to decode a message from " +
                             std::to_string(input.size()) + " bytes");
    }
    return std::move(*message);
}

// ============================================================================
// Base64Encoder
// ============================================================================

std::vector<uint8_t> Base64Encoder::construct(const TransformData& input, const std::vector<uint8_t>&) const {
    std::string encoded = Crypto::bytes_to_base64(require_bytes(input, name()));
    return std::vector<uint8_t>(encoded.begin(), encoded.end());
}

TransformData Base64Encoder::deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>&) const {
    auto decoded = Crypto::base64_to_bytes(std::string(input.begin(), input.end()));
    if (!decoded) {
        throw TransformError(name() + " input is not valid base64");
    }
    return std::move(*decoded);
}

// ============================================================================
// HexEncoder
// ============================================================================

std::vector<uint8_t> HexEncoder::construct(const TransformData& input, const std::vector<uint8_t>&) const {
    std::string encoded = Crypto::bytes_to_hex(require_bytes(input, name()));
    return std::vector<uint8_t>(encoded.begin(), encoded.end());
}

TransformData HexEncoder::deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>&) const {
    auto decoded = Crypto::hex_to_bytes(std::string(input.begin(), input.end()));
    if (!decoded) {
        throw TransformError(name() + " input is not valid hex");
    }
    return std::move(*decoded);
}

// ============================================================================
// AesEncrypter
// ============================================================================

std::vector<uint8_t> AesEncrypter::construct(const TransformData& input, const std::vector<uint8_t>& key) const {
    const auto& plaintext = require_bytes(input, name());

    if (key.size() != config::AES_KEY_SIZE) {
        throw TransformError(name() + " requires a " + std::to_string(config::AES_KEY_SIZE) +
                             "-byte key, got " + std::to_string(key.size()));
    }

    auto nonce = Crypto::generate_random_bytes(config::AES_NONCE_SIZE);
    auto ciphertext = Crypto::aes_gcm_encrypt(plaintext, key, nonce);
    if (!ciphertext) {
        throw TransformError(name() + " encryption failed");
    }

    std::vector<uint8_t> out;
    out.reserve(nonce.size() + ciphertext->size());
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), ciphertext->begin(), ciphertext->end());
    return out;
}

TransformData AesEncrypter::deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>& key) const {
    if (key.size() != config::AES_KEY_SIZE) {
        throw TransformError(name() + " requires a " + std::to_string(config::AES_KEY_SIZE) +
                             "-byte key, got " + std::to_string(key.size()));
    }
    if (input.size() < config::AES_NONCE_SIZE + config::AES_TAG_SIZE) {
        throw TransformError(name() + " ciphertext too short: " + std::to_string(input.size()) + " bytes");
    }

    std::vector<uint8_t> nonce(input.begin(), input.begin() + config::AES_NONCE_SIZE);
    std::vector<uint8_t> ciphertext(input.begin() + config::AES_NONCE_SIZE, input.end());

    auto plaintext = Crypto::aes_gcm_decrypt(ciphertext, key, nonce);
    if (!plaintext) {
        throw TransformError(name() + " decryption failed (wrong key or tampered data)");
    }
    return std::move(*plaintext);
}

// ============================================================================
// XorEncrypter
// ============================================================================

std::vector<uint8_t> XorEncrypter::construct(const TransformData& input, const std::vector<uint8_t>& key) const {
    const auto& data = require_bytes(input, name());
    if (key.empty()) {
        throw TransformError(name() + " requires a non-empty key");
    }
    return xor_bytes(data, key);
}

TransformData XorEncrypter::deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>& key) const {
    if (key.empty()) {
        throw TransformError(name() + " requires a non-empty key");
    }
    return xor_bytes(input, key);
}

} // namespace harbor
