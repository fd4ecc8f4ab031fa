/**
 * @file pake_authenticator.hpp
 * @brief Pre-shared-key authenticated key exchange ("opaque" authenticator)
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Two-round handshake over X25519, keyed with the listener's pre-shared key:
 *
 *   agent  -> INIT       client ephemeral public key
 *   server -> CHALLENGE  server ephemeral public key || server proof
 *   agent  -> PROOF      client proof
 *   server -> SUCCESS
 *
 *   session_key  = BLAKE2b(key = psk, "harbor-session" || shared || transcript)
 *   server proof = BLAKE2b(key = session_key, "server" || transcript)
 *   client proof = BLAKE2b(key = session_key, "client" || transcript)
 *
 * with transcript = client public key || server public key. Both proofs bind
 * the session key to the pre-shared key, so an agent holding a different
 * secret fails at the first proof it checks.
 */

#pragma once

#include "harbor/authenticator.hpp"
#include "harbor/crypto.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harbor {

/**
 * @brief Handshake round identifiers
 */
enum class HandshakeStep {
    INIT = 1,
    CHALLENGE = 2,
    PROOF = 3,
    SUCCESS = 4
};

/**
 * @brief One handshake round, carried as the payload of an OPAQUE message
 */
struct HandshakeMessage {
    HandshakeStep step = HandshakeStep::INIT;
    std::vector<uint8_t> data;

    /**
     * @brief Wrap in an OPAQUE message addressed to/from an agent
     */
    Message to_message(const std::string& agent_id) const;

    /**
     * @brief Extract from an OPAQUE message
     * @return Handshake round, or std::nullopt if the message is not a valid round
     */
    static std::optional<HandshakeMessage> from_message(const Message& message);
};

/**
 * @brief PakeAuthenticator - server side of the handshake
 *
 * Malformed or out-of-sequence rounds never touch an established session.
 */
class PakeAuthenticator : public Authenticator {
public:
    /**
     * @param secret Listener's derived pre-shared key (empty, or 16..64 bytes)
     * @throws std::invalid_argument if the secret length is unusable as a hash key
     */
    explicit PakeAuthenticator(std::vector<uint8_t> secret);
    ~PakeAuthenticator() override;

    PakeAuthenticator(const PakeAuthenticator&) = delete;
    PakeAuthenticator& operator=(const PakeAuthenticator&) = delete;

    Message authenticate(const std::string& agent_id, const Message& message) override;
    bool is_authenticated(const std::string& agent_id) const override;
    std::optional<std::vector<uint8_t>> session_key(const std::string& agent_id) const override;
    void reset(const std::string& agent_id) override;
    std::string name() const override { return "opaque"; }

    /**
     * @brief Number of agents with handshake state (pending or complete)
     */
    size_t agent_count() const;

private:
    struct PendingHandshake {
        std::vector<uint8_t> transcript;
        std::vector<uint8_t> session_key;
    };

    Message handle_init(const std::string& agent_id, const HandshakeMessage& round);
    Message handle_proof(const std::string& agent_id, const HandshakeMessage& round);
    void discard_pending(const std::string& agent_id);

    const std::vector<uint8_t> secret_;

    // An established session survives until a new handshake completes
    std::map<std::string, PendingHandshake> pending_;
    std::map<std::string, std::vector<uint8_t>> sessions_;
    mutable std::mutex mutex_;
};

/**
 * @brief PakeClient - agent side of the handshake
 *
 * Used by agents and by tests that drive a listener end to end.
 */
class PakeClient {
public:
    /**
     * @param agent_id Agent identifier placed in every handshake message
     * @param secret Derived pre-shared key (same derivation as the listener)
     */
    PakeClient(std::string agent_id, std::vector<uint8_t> secret);
    ~PakeClient();

    PakeClient(const PakeClient&) = delete;
    PakeClient& operator=(const PakeClient&) = delete;

    /**
     * @brief Start (or restart) the handshake
     * @return INIT message
     */
    Message begin();

    /**
     * @brief Verify the server's challenge and answer it
     * @return PROOF message
     * @throws AuthenticationError if the challenge is malformed or the server proof is wrong
     */
    Message respond(const Message& challenge);

    /**
     * @brief Accept the server's final reply
     * @throws AuthenticationError unless the reply is SUCCESS for a pending proof
     */
    void complete(const Message& result);

    bool is_authenticated() const { return authenticated_; }

    /**
     * @return Session key once the server proof verified, std::nullopt before
     */
    std::optional<std::vector<uint8_t>> session_key() const;

private:
    const std::string agent_id_;
    const std::vector<uint8_t> secret_;
    std::optional<ExchangeKeyPair> keypair_;
    std::vector<uint8_t> session_key_;
    bool proof_sent_ = false;
    bool authenticated_ = false;
};

} // namespace harbor
