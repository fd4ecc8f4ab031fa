/**
 * @file listener.cpp
 * @brief Implementation of the listener base class and protocol helpers
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/listener.hpp"
#include "harbor/crypto.hpp"
#include "harbor/errors.hpp"
#include "harbor/utilities.hpp"

namespace harbor {

// ============================================================================
// Protocol Helpers
// ============================================================================

Protocol protocol_from_string(const std::string& protocol) {
    std::string lowered = utilities::to_lowercase(utilities::trim_string(protocol));

    if (lowered == "http" || lowered == "https" || lowered == "h2c" ||
        lowered == "http2" || lowered == "http3") {
        return Protocol::HTTP;
    }
    if (lowered == "smb") {
        return Protocol::SMB;
    }
    if (lowered == "tcp") {
        return Protocol::TCP;
    }
    if (lowered == "udp") {
        return Protocol::UDP;
    }
    return Protocol::UNKNOWN;
}

std::string protocol_to_string(Protocol protocol) {
    switch (protocol) {
        case Protocol::HTTP: return "HTTP";
        case Protocol::SMB: return "SMB";
        case Protocol::TCP: return "TCP";
        case Protocol::UDP: return "UDP";
        default: return "UNKNOWN";
    }
}

const std::vector<Protocol>& listener_protocols() {
    static const std::vector<Protocol> protocols = {
        Protocol::HTTP, Protocol::SMB, Protocol::TCP, Protocol::UDP
    };
    return protocols;
}

// ============================================================================
// ListenerConfig
// ============================================================================

ListenerConfig ListenerConfig::parse(const Options& options) {
    ListenerConfig parsed;

    auto name = config::get_option(options, config::OPTION_NAME);
    if (!name || utilities::trim_string(*name).empty()) {
        throw ValidationError("a listener name must be provided");
    }
    parsed.name = *name;

    parsed.description = config::get_option(options, config::OPTION_DESCRIPTION).value_or("");

    parsed.pre_shared_key = Crypto::derive_pre_shared_key(
        config::get_option(options, config::OPTION_PSK).value_or(""));

    auto transforms = config::get_option(options, config::OPTION_TRANSFORMS);
    if (!transforms || utilities::trim_string(*transforms).empty()) {
        throw ValidationError("a " + std::string(config::OPTION_TRANSFORMS) + " list must be provided");
    }
    parsed.transformers = TransformChain::parse(*transforms);

    parsed.authenticator = make_authenticator(
        config::get_option(options, config::OPTION_AUTHENTICATOR), parsed.pre_shared_key);

    return parsed;
}

// ============================================================================
// Listener
// ============================================================================

Listener::Listener(std::string id, Options options, ListenerConfig settings)
    : id_(std::move(id))
    , options_(std::move(options))
    , pre_shared_key_(std::move(settings.pre_shared_key))
    , transformers_(std::move(settings.transformers))
    , authenticator_(std::move(settings.authenticator))
    , name_(std::move(settings.name))
    , description_(std::move(settings.description))
{
}

Message Listener::authenticate(const std::string& agent_id, const Message& message) {
    return authenticator_->authenticate(agent_id, message);
}

std::vector<uint8_t> Listener::construct(const Message& message, const std::vector<uint8_t>& key) const {
    return transformers_.construct(message, key.empty() ? pre_shared_key_ : key);
}

Message Listener::deconstruct(const std::vector<uint8_t>& data, const std::vector<uint8_t>& key) const {
    return transformers_.deconstruct(data, key.empty() ? pre_shared_key_ : key);
}

std::vector<uint8_t> Listener::handle(const std::string& agent_id, const std::vector<uint8_t>& data) {
    if (data.size() > config::MAX_MESSAGE_SIZE) {
        throw TransformError("message from agent " + agent_id + " exceeds the maximum size");
    }

    std::vector<uint8_t> key = authenticator_->session_key(agent_id).value_or(std::vector<uint8_t>{});

    Message message;
    try {
        message = deconstruct(data, key);
    } catch (const TransformError&) {
        if (key.empty()) {
            throw;
        }
        // Agent restarted its handshake under the pre-shared key; the
        // established session stays until the new handshake completes
        message = deconstruct(data);
        if (message.type != MessageType::OPAQUE) {
            throw AuthenticationError("agent " + agent_id +
                                      " sent non-handshake traffic without its session key");
        }
        key.clear();
    }

    if (!message.agent_id.empty() && message.agent_id != agent_id) {
        throw AuthenticationError("message for agent " + message.agent_id +
                                  " arrived as agent " + agent_id);
    }

    if (!authenticator_->is_authenticated(agent_id) || message.type == MessageType::OPAQUE) {
        return construct(authenticate(agent_id, message));
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }

    Message reply = handler ? handler(message) : MessageHelpers::idle(agent_id);
    return construct(reply, key);
}

void Listener::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

std::string Listener::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

std::string Listener::description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return description_;
}

Options Listener::configured_options() const {
    Options configured;
    configured["ID"] = id_;
    configured[config::OPTION_NAME] = name();
    configured[config::OPTION_DESCRIPTION] = description();
    configured[config::OPTION_PROTOCOL] = protocol_to_string(protocol());
    configured[config::OPTION_PSK] = config::get_option(options_, config::OPTION_PSK).value_or("");
    configured[config::OPTION_TRANSFORMS] = transformers_.to_string();
    configured[config::OPTION_AUTHENTICATOR] = authenticator_->name();
    return configured;
}

std::string Listener::pre_shared_key_secret() const {
    return Crypto::bytes_to_hex(pre_shared_key_);
}

void Listener::set_option(const std::string& option, const std::string& value) {
    std::string lowered = utilities::to_lowercase(option);

    if (lowered == "name") {
        if (utilities::trim_string(value).empty()) {
            throw ValidationError("a listener name must be provided");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        name_ = value;
        return;
    }

    if (lowered == "description") {
        std::lock_guard<std::mutex> lock(mutex_);
        description_ = value;
        return;
    }

    throw UnhandledError("the " + option + " option can not be changed on an existing " +
                         protocol_to_string(protocol()) + " listener");
}

} // namespace harbor
