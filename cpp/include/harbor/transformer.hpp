/**
 * @file transformer.hpp
 * @brief Transform stage interface and the ordered transform chain
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Chain composition:
 *
 *   construct():    Message -> [Tn] -> ... -> [T2] -> [T1] -> wire bytes
 *   deconstruct():  wire bytes -> [T1] -> [T2] -> ... -> [Tn] -> Message
 *
 * where T1..Tn are the stages in configured order. With every stage's
 * construct/deconstruct mutually inverse, the chain is exactly invertible
 * for a fixed key.
 */

#pragma once

#include "harbor/message.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace harbor {

/**
 * @brief Input to construct / output of deconstruct: raw bytes or the final message
 */
using TransformData = std::variant<std::vector<uint8_t>, Message>;

/**
 * @brief Transformer - one encode/encrypt stage
 *
 * Implementations hold no mutable state and are safe to share between threads.
 */
class Transformer {
public:
    virtual ~Transformer() = default;

    /**
     * @brief Encode or encrypt
     * @param input Structured message (last stage) or bytes from the previous stage
     * @param key Key material (ignored by encoders)
     * @return Encoded bytes
     * @throws TransformError on failure or unsupported input
     */
    virtual std::vector<uint8_t> construct(
        const TransformData& input,
        const std::vector<uint8_t>& key
    ) const = 0;

    /**
     * @brief Decode or decrypt
     * @param input Bytes from the wire or the previous stage
     * @param key Key material (ignored by encoders)
     * @return Intermediate bytes, or the recovered message
     * @throws TransformError on failure
     */
    virtual TransformData deconstruct(
        const std::vector<uint8_t>& input,
        const std::vector<uint8_t>& key
    ) const = 0;

    /**
     * @brief Configuration name of this stage (e.g., "aes")
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Create a transform stage by configuration name
 * @param name Stage name, case-insensitive
 * @return Stage instance
 * @throws ValidationError for an unrecognized name
 */
std::shared_ptr<const Transformer> make_transformer(const std::string& name);

/**
 * @brief Names accepted by make_transformer()
 */
std::vector<std::string> transformer_names();

/**
 * @brief TransformChain - ordered, immutable sequence of stages
 */
class TransformChain {
public:
    TransformChain() = default;

    explicit TransformChain(std::vector<std::shared_ptr<const Transformer>> stages);

    /**
     * @brief Parse a comma-separated list of stage names
     * @param transforms e.g. "aes,gob-base"
     * @return Chain in configured order
     * @throws ValidationError if any name is unrecognized (no partial chain)
     */
    static TransformChain parse(const std::string& transforms);

    /**
     * @brief Encode a message for the wire (stages in reverse configured order)
     * @throws TransformError if the chain is empty or any stage fails
     */
    std::vector<uint8_t> construct(const Message& message, const std::vector<uint8_t>& key) const;

    /**
     * @brief Decode wire bytes into a message (stages in configured order)
     * @throws TransformError if the chain is empty, any stage fails,
     *         or the final stage does not yield a message
     */
    Message deconstruct(const std::vector<uint8_t>& data, const std::vector<uint8_t>& key) const;

    std::vector<std::string> names() const;

    /**
     * @brief Stage names joined with commas, in configured order
     */
    std::string to_string() const;

    size_t size() const { return stages_.size(); }
    bool empty() const { return stages_.empty(); }

private:
    std::vector<std::shared_ptr<const Transformer>> stages_;
};

} // namespace harbor
