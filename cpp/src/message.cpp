/**
 * @file message.cpp
 * @brief Implementation of message serialization
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/message.hpp"
#include "harbor/crypto.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace harbor {

namespace {

json message_to_json(const Message& message) {
    json j;
    j["version"] = message.version;
    j["agent_id"] = message.agent_id;
    j["type"] = MessageHelpers::message_type_to_string(message.type);
    j["payload"] = Crypto::bytes_to_base64(message.payload);
    j["padding"] = message.padding;
    j["token"] = message.token;

    json delegates = json::array();
    for (const auto& delegate : message.delegates) {
        json d;
        d["listener_id"] = delegate.listener_id;
        d["agent_id"] = delegate.agent_id;
        d["payload"] = Crypto::bytes_to_base64(delegate.payload);
        delegates.push_back(d);
    }
    j["delegates"] = delegates;

    return j;
}

std::optional<Message> message_from_json(const json& j) {
    try {
        Message message;
        message.version = j.at("version").get<uint32_t>();
        message.agent_id = j.at("agent_id").get<std::string>();

        auto type = MessageHelpers::string_to_message_type(j.at("type").get<std::string>());
        if (!type) {
            return std::nullopt;
        }
        message.type = *type;

        auto payload = Crypto::base64_to_bytes(j.at("payload").get<std::string>());
        if (!payload) {
            return std::nullopt;
        }
        message.payload = *payload;

        message.padding = j.at("padding").get<std::string>();
        message.token = j.at("token").get<std::string>();

        for (const auto& d : j.at("delegates")) {
            Delegate delegate;
            delegate.listener_id = d.at("listener_id").get<std::string>();
            delegate.agent_id = d.at("agent_id").get<std::string>();

            auto delegate_payload = Crypto::base64_to_bytes(d.at("payload").get<std::string>());
            if (!delegate_payload) {
                return std::nullopt;
            }
            delegate.payload = *delegate_payload;
            message.delegates.push_back(std::move(delegate));
        }

        return message;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace

// ============================================================================
// Message Type String Conversion
// ============================================================================

std::string MessageHelpers::message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::UNDEFINED: return "UNDEFINED";
        case MessageType::CHECKIN: return "CHECKIN";
        case MessageType::JOBS: return "JOBS";
        case MessageType::IDLE: return "IDLE";
        case MessageType::OPAQUE: return "OPAQUE";
        default: return "UNKNOWN";
    }
}

std::optional<MessageType> MessageHelpers::string_to_message_type(const std::string& str) {
    if (str == "UNDEFINED") return MessageType::UNDEFINED;
    if (str == "CHECKIN") return MessageType::CHECKIN;
    if (str == "JOBS") return MessageType::JOBS;
    if (str == "IDLE") return MessageType::IDLE;
    if (str == "OPAQUE") return MessageType::OPAQUE;
    return std::nullopt;
}

Message MessageHelpers::idle(const std::string& agent_id) {
    Message message;
    message.agent_id = agent_id;
    message.type = MessageType::IDLE;
    return message;
}

// ============================================================================
// Equality
// ============================================================================

bool Delegate::operator==(const Delegate& other) const {
    return listener_id == other.listener_id &&
           agent_id == other.agent_id &&
           payload == other.payload;
}

bool Message::operator==(const Message& other) const {
    return version == other.version &&
           agent_id == other.agent_id &&
           type == other.type &&
           payload == other.payload &&
           padding == other.padding &&
           token == other.token &&
           delegates == other.delegates;
}

// ============================================================================
// Serialization
// ============================================================================

std::optional<std::string> Message::to_json() const {
    try {
        return message_to_json(*this).dump();
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<Message> Message::from_json(const std::string& json_str) {
    try {
        return message_from_json(json::parse(json_str));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::vector<uint8_t> Message::to_msgpack() const {
    return json::to_msgpack(message_to_json(*this));
}

std::optional<Message> Message::from_msgpack(const std::vector<uint8_t>& data) {
    try {
        return message_from_json(json::from_msgpack(data));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

} // namespace harbor
