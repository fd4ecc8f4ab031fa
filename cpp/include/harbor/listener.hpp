/**
 * @file listener.hpp
 * @brief Listener abstraction shared by every protocol variant
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A listener is a configured endpoint for agent traffic. It owns the
 * transform chain that turns wire bytes into messages and back, the
 * pre-shared key used before an agent authenticates, and the authenticator
 * that runs the handshake. Network-facing variants (HTTP) also own an
 * infrastructure server.
 */

#pragma once

#include "harbor/authenticator.hpp"
#include "harbor/config.hpp"
#include "harbor/message.hpp"
#include "harbor/server.hpp"
#include "harbor/transformer.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace harbor {

/**
 * @brief Listener protocol families
 */
enum class Protocol {
    UNKNOWN = 0,
    HTTP = 1,
    SMB = 2,
    TCP = 3,
    UDP = 4
};

/**
 * @brief Map a Protocol option value to a protocol family
 *
 * Case-insensitive. http, https, h2c, http2 and http3 all map to HTTP.
 *
 * @return Protocol, or Protocol::UNKNOWN if not recognized
 */
Protocol protocol_from_string(const std::string& protocol);

std::string protocol_to_string(Protocol protocol);

/**
 * @brief Protocol families in lookup order (HTTP, SMB, TCP, UDP)
 */
const std::vector<Protocol>& listener_protocols();

/**
 * @brief Agent-processing callback for messages from authenticated agents
 * @return Reply message for the agent
 */
using MessageHandler = std::function<Message(const Message&)>;

/**
 * @brief Validated settings common to every listener
 */
struct ListenerConfig {
    std::string name;
    std::string description;
    std::vector<uint8_t> pre_shared_key;
    TransformChain transformers;
    std::shared_ptr<Authenticator> authenticator;

    /**
     * @brief Validate the common options
     *
     * Name is required. PSK is hashed into the pre-shared key (empty PSK
     * yields an empty key). Transforms is parsed into the chain, and
     * Authenticator selects the handshake strategy.
     *
     * @throws ValidationError with the offending key or value
     */
    static ListenerConfig parse(const Options& options);
};

/**
 * @brief Listener - base class for protocol variants
 *
 * Thread-safe. Only name and description change after construction.
 */
class Listener {
public:
    virtual ~Listener() = default;

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // ========================================================================
    // Agent Traffic
    // ========================================================================

    /**
     * @brief Run one handshake round for an agent
     * @throws AuthenticationError if the round fails
     */
    Message authenticate(const std::string& agent_id, const Message& message);

    /**
     * @brief Encode a message for the wire
     * @param key Key material; empty uses the pre-shared key
     * @throws TransformError if any stage fails
     */
    std::vector<uint8_t> construct(const Message& message, const std::vector<uint8_t>& key = {}) const;

    /**
     * @brief Decode wire bytes into a message
     * @param key Key material; empty uses the pre-shared key
     * @throws TransformError if any stage fails
     */
    Message deconstruct(const std::vector<uint8_t>& data, const std::vector<uint8_t>& key = {}) const;

    /**
     * @brief Process one encoded message from an agent
     *
     * Unauthenticated agents (and OPAQUE messages) go to the authenticator
     * under the pre-shared key. Authenticated agents go to the message
     * handler under their session key, or the pre-shared key when the
     * authenticator negotiated none. Without its session key an
     * authenticated agent may only send handshake rounds.
     *
     * @param agent_id Agent identifier reported by the transport
     * @param data Encoded message
     * @return Encoded reply
     * @throws TransformError, AuthenticationError
     */
    std::vector<uint8_t> handle(const std::string& agent_id, const std::vector<uint8_t>& data);

    /**
     * @brief Set the agent-processing callback (nullptr replies IDLE)
     */
    void set_message_handler(MessageHandler handler);

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::string& id() const { return id_; }
    std::string name() const;
    std::string description() const;

    /**
     * @brief Options supplied at creation, unmodified
     */
    const Options& options() const { return options_; }

    /**
     * @brief Normalized view of the listener's current configuration
     */
    virtual Options configured_options() const;

    virtual Protocol protocol() const = 0;

    /**
     * @brief Address agents reach this listener on
     */
    virtual std::string addr() const = 0;

    /**
     * @brief Hex encoding of the derived pre-shared key
     */
    std::string pre_shared_key_secret() const;

    /**
     * @brief Embedded infrastructure server (nullptr for peer-to-peer protocols)
     */
    virtual std::shared_ptr<Server> server() const { return nullptr; }

    /**
     * @brief "Created" without a server, otherwise the server's state
     */
    virtual std::string status() const { return "Created"; }

    std::string transforms() const { return transformers_.to_string(); }
    std::string authenticator_name() const { return authenticator_->name(); }

    /**
     * @brief Change a mutable option (Name or Description, case-insensitive)
     * @throws UnhandledError for any other option
     * @throws ValidationError for an empty Name
     */
    void set_option(const std::string& option, const std::string& value);

protected:
    Listener(std::string id, Options options, ListenerConfig settings);

private:
    const std::string id_;
    const Options options_;
    const std::vector<uint8_t> pre_shared_key_;
    const TransformChain transformers_;
    const std::shared_ptr<Authenticator> authenticator_;

    mutable std::mutex mutex_;
    std::string name_;
    std::string description_;
    MessageHandler handler_;
};

} // namespace harbor
