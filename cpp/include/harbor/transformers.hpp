/**
 * @file transformers.hpp
 * @brief Concrete encoding and encryption stages
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - gob-base:    structured Message <-> MessagePack bytes
 * - base64-byte: bytes <-> base64 text bytes
 * - hex-byte:    bytes <-> hex text bytes
 * - aes:         AES-256-GCM, random 12-byte nonce prepended to ciphertext
 * - xor:         repeating-key XOR
 */

#pragma once

#include "harbor/transformer.hpp"

namespace harbor {

/**
 * @brief Encodes the structured message; must be the last configured stage
 */
class MessageEncoder : public Transformer {
public:
    std::vector<uint8_t> construct(const TransformData& input, const std::vector<uint8_t>& key) const override;
    TransformData deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>& key) const override;
    std::string name() const override { return "gob-base"; }
};

class Base64Encoder : public Transformer {
public:
    std::vector<uint8_t> construct(const TransformData& input, const std::vector<uint8_t>& key) const override;
    TransformData deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>& key) const override;
    std::string name() const override { return "base64-byte"; }
};

class HexEncoder : public Transformer {
public:
    std::vector<uint8_t> construct(const TransformData& input, const std::vector<uint8_t>& key) const override;
    TransformData deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>& key) const override;
    std::string name() const override { return "hex-byte"; }
};

/**
 * @brief AES-256-GCM; requires a 32-byte key
 *
 * Output layout: nonce (12) || ciphertext || tag (16)
 */
class AesEncrypter : public Transformer {
public:
    std::vector<uint8_t> construct(const TransformData& input, const std::vector<uint8_t>& key) const override;
    TransformData deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>& key) const override;
    std::string name() const override { return "aes"; }
};

/**
 * @brief Repeating-key XOR; obfuscation only, requires a non-empty key
 */
class XorEncrypter : public Transformer {
public:
    std::vector<uint8_t> construct(const TransformData& input, const std::vector<uint8_t>& key) const override;
    TransformData deconstruct(const std::vector<uint8_t>& input, const std::vector<uint8_t>& key) const override;
    std::string name() const override { return "xor"; }
};

} // namespace harbor
