/**
 * @file message.hpp
 * @brief Structured agent message exchanged through listeners
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The structured form every transform chain decodes to and encodes from.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace harbor {

/**
 * @brief Message types carried between agents and listeners
 */
enum class MessageType {
    UNDEFINED = 0,           ///< Not set
    CHECKIN = 1,             ///< Agent check in
    JOBS = 2,                ///< Jobs for or results from an agent
    IDLE = 3,                ///< Nothing to do (acknowledgement)
    OPAQUE = 4               ///< Authentication handshake round
};

/**
 * @brief Message from a peer-to-peer agent forwarded by its parent
 */
struct Delegate {
    std::string listener_id;        ///< Listener the child agent belongs to
    std::string agent_id;           ///< Child agent ID
    std::vector<uint8_t> payload;   ///< Still-encoded child message

    bool operator==(const Delegate& other) const;
    bool operator!=(const Delegate& other) const { return !(*this == other); }
};

/**
 * @brief Base message structure for all agent traffic
 */
struct Message {
    uint32_t version = 1;               ///< Message format version
    std::string agent_id;               ///< Agent UUID
    MessageType type = MessageType::UNDEFINED;
    std::vector<uint8_t> payload;       ///< Type-specific payload
    std::string padding;                ///< Random padding to vary message size
    std::string token;                  ///< Agent bearer token (may be empty)
    std::vector<Delegate> delegates;    ///< Forwarded peer-to-peer messages

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }

    /**
     * @brief Serialize message to JSON
     * @return JSON string, or std::nullopt if padding or token is not valid UTF-8
     */
    std::optional<std::string> to_json() const;

    /**
     * @brief Deserialize message from JSON
     * @param json JSON string
     * @return Message or std::nullopt if invalid
     */
    static std::optional<Message> from_json(const std::string& json);

    /**
     * @brief Serialize message to MessagePack bytes
     */
    std::vector<uint8_t> to_msgpack() const;

    /**
     * @brief Deserialize message from MessagePack bytes
     * @return Message or std::nullopt if invalid
     */
    static std::optional<Message> from_msgpack(const std::vector<uint8_t>& data);
};

/**
 * @brief Helper functions for message handling
 */
class MessageHelpers {
public:
    static std::string message_type_to_string(MessageType type);

    /**
     * @brief Convert string to MessageType enum
     * @return MessageType or std::nullopt if invalid
     */
    static std::optional<MessageType> string_to_message_type(const std::string& str);

    /**
     * @brief Build an IDLE acknowledgement for an agent
     */
    static Message idle(const std::string& agent_id);
};

} // namespace harbor
