/**
 * @file authenticator.hpp
 * @brief Agent authentication strategies selected per listener
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * An authenticator runs the handshake rounds for agents that have not yet
 * authenticated. Handshake state is per agent and guarded internally, so
 * one authenticator may serve concurrent agents.
 */

#pragma once

#include "harbor/message.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace harbor {

/**
 * @brief Authenticator - agent authentication strategy
 */
class Authenticator {
public:
    virtual ~Authenticator() = default;

    /**
     * @brief Process one handshake round
     * @param agent_id Agent performing the handshake
     * @param message Decoded handshake message
     * @return Reply to send back to the agent
     * @throws AuthenticationError if the round is invalid or out of sequence
     */
    virtual Message authenticate(const std::string& agent_id, const Message& message) = 0;

    /**
     * @brief Check whether an agent completed the handshake
     */
    virtual bool is_authenticated(const std::string& agent_id) const = 0;

    /**
     * @brief Key negotiated for an authenticated agent
     * @return Session key, or std::nullopt if none was negotiated
     */
    virtual std::optional<std::vector<uint8_t>> session_key(const std::string& agent_id) const = 0;

    /**
     * @brief Forget an agent's handshake state
     */
    virtual void reset(const std::string& agent_id) = 0;

    /**
     * @brief Configuration name (e.g., "opaque")
     */
    virtual std::string name() const = 0;
};

/**
 * @brief NoneAuthenticator - accepts every agent on first contact
 *
 * No session key is negotiated; traffic stays under the pre-shared key.
 */
class NoneAuthenticator : public Authenticator {
public:
    Message authenticate(const std::string& agent_id, const Message& message) override;
    bool is_authenticated(const std::string& agent_id) const override;
    std::optional<std::vector<uint8_t>> session_key(const std::string& agent_id) const override;
    void reset(const std::string& agent_id) override;
    std::string name() const override { return "none"; }

private:
    std::set<std::string> authenticated_;
    mutable std::mutex mutex_;
};

/**
 * @brief Select an authenticator from the Authenticator option
 * @param selection Option value ("none", "opaque"); case-insensitive, absent means none
 * @param pre_shared_key Listener's derived pre-shared key (may be empty)
 * @return Authenticator instance owned by one listener
 * @throws ValidationError if the authenticator cannot be constructed
 */
std::shared_ptr<Authenticator> make_authenticator(
    const std::optional<std::string>& selection,
    const std::vector<uint8_t>& pre_shared_key
);

/**
 * @brief Names accepted by make_authenticator()
 */
std::vector<std::string> authenticator_names();

} // namespace harbor
