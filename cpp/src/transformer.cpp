/**
 * @file transformer.cpp
 * @brief Implementation of the transform chain and stage registry
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/transformer.hpp"
#include "harbor/transformers.hpp"
#include "harbor/errors.hpp"
#include "harbor/utilities.hpp"

#include <functional>
#include <map>

namespace harbor {

namespace {

using TransformerFactory = std::function<std::shared_ptr<const Transformer>()>;

const std::map<std::string, TransformerFactory>& registry() {
    static const std::map<std::string, TransformerFactory> factories = {
        {"gob-base",    [] { return std::make_shared<MessageEncoder>(); }},
        {"base64-byte", [] { return std::make_shared<Base64Encoder>(); }},
        {"hex-byte",    [] { return std::make_shared<HexEncoder>(); }},
        {"aes",         [] { return std::make_shared<AesEncrypter>(); }},
        {"xor",         [] { return std::make_shared<XorEncrypter>(); }},
    };
    return factories;
}

} // namespace

// ============================================================================
// Stage Registry
// ============================================================================

std::shared_ptr<const Transformer> make_transformer(const std::string& name) {
    auto it = registry().find(utilities::to_lowercase(utilities::trim_string(name)));
    if (it == registry().end()) {
        throw ValidationError("unhandled transform type: " + name);
    }
    return it->second();
}

std::vector<std::string> transformer_names() {
    std::vector<std::string> names;
    for (const auto& [name, factory] : registry()) {
        names.push_back(name);
    }
    return names;
}

// ============================================================================
// TransformChain
// ============================================================================

TransformChain::TransformChain(std::vector<std::shared_ptr<const Transformer>> stages)
    : stages_(std::move(stages))
{
}

TransformChain TransformChain::parse(const std::string& transforms) {
    std::vector<std::shared_ptr<const Transformer>> stages;

    // Any unknown name throws before a chain exists
    for (const auto& name : utilities::split_string(transforms, ',')) {
        stages.push_back(make_transformer(name));
    }

    return TransformChain(std::move(stages));
}

std::vector<uint8_t> TransformChain::construct(
    const Message& message,
    const std::vector<uint8_t>& key
) const {
    if (stages_.empty()) {
        throw TransformError("construct: no transforms configured");
    }

    utilities::log_debug("Constructing " + MessageHelpers::message_type_to_string(message.type) +
                         " message for agent " + message.agent_id + " with transforms " + to_string());

    TransformData data = message;

    for (size_t i = stages_.size(); i > 0; --i) {
        const auto& stage = stages_[i - 1];
        try {
            data = stage->construct(data, key);
        } catch (const TransformError& e) {
            throw TransformError("construct failed at stage " + std::to_string(i) +
                                 " (" + stage->name() + "): " + e.what());
        }
    }

    return std::get<std::vector<uint8_t>>(std::move(data));
}

Message TransformChain::deconstruct(
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& key
) const {
    if (stages_.empty()) {
        throw TransformError("deconstruct: no transforms configured");
    }

    utilities::log_debug("Deconstructing " + std::to_string(data.size()) +
                         " bytes with transforms " + to_string());

    std::vector<uint8_t> current = data;

    for (size_t i = 0; i < stages_.size(); ++i) {
        const auto& stage = stages_[i];
        TransformData result;
        try {
            result = stage->deconstruct(current, key);
        } catch (const TransformError& e) {
            throw TransformError("deconstruct failed at stage " + std::to_string(i + 1) +
                                 " (" + stage->name() + "): " + e.what());
        }

        if (auto* message = std::get_if<Message>(&result)) {
            if (i + 1 != stages_.size()) {
                throw TransformError("deconstruct: stage " + std::to_string(i + 1) + " (" +
                                     stage->name() + ") produced a message before the end of the chain");
            }
            return std::move(*message);
        }

        current = std::get<std::vector<uint8_t>>(std::move(result));
    }

    throw TransformError("deconstruct: unable to transform data into a message");
}

std::vector<std::string> TransformChain::names() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.push_back(stage->name());
    }
    return names;
}

std::string TransformChain::to_string() const {
    return utilities::join_strings(names(), ",");
}

} // namespace harbor
