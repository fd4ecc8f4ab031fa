/**
 * @file pake_authenticator.cpp
 * @brief Implementation of the pre-shared-key authenticated key exchange
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/pake_authenticator.hpp"
#include "harbor/config.hpp"
#include "harbor/errors.hpp"
#include "harbor/utilities.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace harbor {

namespace {

const std::string SESSION_LABEL = "harbor-session";
const std::string SERVER_LABEL = "server";
const std::string CLIENT_LABEL = "client";

std::vector<uint8_t> concat(const std::string& label, std::initializer_list<const std::vector<uint8_t>*> parts) {
    std::vector<uint8_t> out(label.begin(), label.end());
    for (const auto* part : parts) {
        out.insert(out.end(), part->begin(), part->end());
    }
    return out;
}

std::vector<uint8_t> derive_session_key(
    const std::vector<uint8_t>& shared,
    const std::vector<uint8_t>& transcript,
    const std::vector<uint8_t>& secret
) {
    auto input = concat(SESSION_LABEL, {&shared, &transcript});
    auto key = Crypto::keyed_hash(input, secret, config::SESSION_KEY_SIZE);
    Crypto::secure_zero(input.data(), input.size());
    if (!key) {
        throw AuthenticationError("failed to derive session key");
    }
    return *key;
}

std::vector<uint8_t> compute_proof(
    const std::string& label,
    const std::vector<uint8_t>& transcript,
    const std::vector<uint8_t>& session_key
) {
    auto proof = Crypto::keyed_hash(concat(label, {&transcript}), session_key, config::SESSION_KEY_SIZE);
    if (!proof) {
        throw AuthenticationError("failed to compute " + label + " proof");
    }
    return *proof;
}

std::vector<uint8_t> to_bytes(const std::array<uint8_t, crypto_scalarmult_BYTES>& key) {
    return std::vector<uint8_t>(key.begin(), key.end());
}

std::string step_name(HandshakeStep step) {
    switch (step) {
        case HandshakeStep::INIT: return "INIT";
        case HandshakeStep::CHALLENGE: return "CHALLENGE";
        case HandshakeStep::PROOF: return "PROOF";
        case HandshakeStep::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

} // namespace

// ============================================================================
// HandshakeMessage
// ============================================================================

Message HandshakeMessage::to_message(const std::string& agent_id) const {
    json j;
    j["step"] = static_cast<int>(step);
    j["data"] = Crypto::bytes_to_base64(data);

    std::string payload = j.dump();

    Message message;
    message.agent_id = agent_id;
    message.type = MessageType::OPAQUE;
    message.payload.assign(payload.begin(), payload.end());
    return message;
}

std::optional<HandshakeMessage> HandshakeMessage::from_message(const Message& message) {
    if (message.type != MessageType::OPAQUE) {
        return std::nullopt;
    }

    try {
        json j = json::parse(message.payload.begin(), message.payload.end());

        int step = j.at("step").get<int>();
        if (step < static_cast<int>(HandshakeStep::INIT) || step > static_cast<int>(HandshakeStep::SUCCESS)) {
            return std::nullopt;
        }

        auto data = Crypto::base64_to_bytes(j.at("data").get<std::string>());
        if (!data) {
            return std::nullopt;
        }

        HandshakeMessage round;
        round.step = static_cast<HandshakeStep>(step);
        round.data = std::move(*data);
        return round;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// PakeAuthenticator
// ============================================================================

PakeAuthenticator::PakeAuthenticator(std::vector<uint8_t> secret)
    : secret_(std::move(secret))
{
    if (!secret_.empty() &&
        (secret_.size() < crypto_generichash_KEYBYTES_MIN || secret_.size() > crypto_generichash_KEYBYTES_MAX)) {
        throw std::invalid_argument("pre-shared key must be empty or between " +
                                    std::to_string(crypto_generichash_KEYBYTES_MIN) + " and " +
                                    std::to_string(crypto_generichash_KEYBYTES_MAX) + " bytes");
    }
    if (!Crypto::initialize()) {
        throw std::runtime_error("failed to initialize libsodium");
    }
}

PakeAuthenticator::~PakeAuthenticator() {
    for (auto& [agent_id, handshake] : pending_) {
        Crypto::secure_zero(handshake.session_key.data(), handshake.session_key.size());
    }
    for (auto& [agent_id, key] : sessions_) {
        Crypto::secure_zero(key.data(), key.size());
    }
}

Message PakeAuthenticator::authenticate(const std::string& agent_id, const Message& message) {
    auto round = HandshakeMessage::from_message(message);
    if (!round) {
        throw AuthenticationError("agent " + agent_id + " sent a message that is not a handshake round");
    }

    switch (round->step) {
        case HandshakeStep::INIT:
            return handle_init(agent_id, *round);
        case HandshakeStep::PROOF:
            return handle_proof(agent_id, *round);
        default:
            throw AuthenticationError("agent " + agent_id + " sent unexpected handshake step " +
                                      step_name(round->step));
    }
}

Message PakeAuthenticator::handle_init(const std::string& agent_id, const HandshakeMessage& round) {
    if (round.data.size() != crypto_scalarmult_BYTES) {
        discard_pending(agent_id);
        throw AuthenticationError("agent " + agent_id + " sent an invalid public key");
    }

    ExchangeKeyPair keypair = Crypto::generate_exchange_keypair();
    auto shared = Crypto::key_agreement(keypair.secret_key, round.data);
    Crypto::secure_zero(keypair.secret_key.data(), keypair.secret_key.size());
    if (!shared) {
        discard_pending(agent_id);
        throw AuthenticationError("key agreement with agent " + agent_id + " failed");
    }

    std::vector<uint8_t> server_public = to_bytes(keypair.public_key);

    PendingHandshake handshake;
    handshake.transcript = round.data;
    handshake.transcript.insert(handshake.transcript.end(), server_public.begin(), server_public.end());
    handshake.session_key = derive_session_key(*shared, handshake.transcript, secret_);
    Crypto::secure_zero(shared->data(), shared->size());

    HandshakeMessage challenge;
    challenge.step = HandshakeStep::CHALLENGE;
    challenge.data = server_public;
    auto proof = compute_proof(SERVER_LABEL, handshake.transcript, handshake.session_key);
    challenge.data.insert(challenge.data.end(), proof.begin(), proof.end());

    {
        // A new INIT replaces an earlier pending handshake only
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(agent_id);
        if (it != pending_.end()) {
            Crypto::secure_zero(it->second.session_key.data(), it->second.session_key.size());
        }
        pending_[agent_id] = std::move(handshake);
    }

    utilities::log_debug("Sent handshake challenge to agent " + agent_id);
    return challenge.to_message(agent_id);
}

Message PakeAuthenticator::handle_proof(const std::string& agent_id, const HandshakeMessage& round) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pending_.find(agent_id);
    if (it == pending_.end()) {
        throw AuthenticationError("agent " + agent_id + " sent a proof without a pending handshake");
    }

    auto expected = compute_proof(CLIENT_LABEL, it->second.transcript, it->second.session_key);
    if (!Crypto::constant_time_compare(expected, round.data)) {
        Crypto::secure_zero(it->second.session_key.data(), it->second.session_key.size());
        pending_.erase(it);
        utilities::log_warn("Agent " + agent_id + " failed authentication");
        throw AuthenticationError("agent " + agent_id + " proof did not verify");
    }

    auto& session = sessions_[agent_id];
    Crypto::secure_zero(session.data(), session.size());
    session = std::move(it->second.session_key);
    pending_.erase(it);
    utilities::log_info("Agent " + agent_id + " authenticated");

    HandshakeMessage success;
    success.step = HandshakeStep::SUCCESS;
    return success.to_message(agent_id);
}

void PakeAuthenticator::discard_pending(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(agent_id);
    if (it != pending_.end()) {
        Crypto::secure_zero(it->second.session_key.data(), it->second.session_key.size());
        pending_.erase(it);
    }
}

bool PakeAuthenticator::is_authenticated(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(agent_id) > 0;
}

std::optional<std::vector<uint8_t>> PakeAuthenticator::session_key(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(agent_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PakeAuthenticator::reset(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto pending = pending_.find(agent_id);
    if (pending != pending_.end()) {
        Crypto::secure_zero(pending->second.session_key.data(), pending->second.session_key.size());
        pending_.erase(pending);
    }
    auto session = sessions_.find(agent_id);
    if (session != sessions_.end()) {
        Crypto::secure_zero(session->second.data(), session->second.size());
        sessions_.erase(session);
    }
}

size_t PakeAuthenticator::agent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = sessions_.size();
    for (const auto& [agent_id, handshake] : pending_) {
        if (sessions_.count(agent_id) == 0) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// PakeClient
// ============================================================================

PakeClient::PakeClient(std::string agent_id, std::vector<uint8_t> secret)
    : agent_id_(std::move(agent_id))
    , secret_(std::move(secret))
{
    if (!Crypto::initialize()) {
        throw std::runtime_error("failed to initialize libsodium");
    }
}

PakeClient::~PakeClient() {
    if (keypair_) {
        Crypto::secure_zero(keypair_->secret_key.data(), keypair_->secret_key.size());
    }
    Crypto::secure_zero(session_key_.data(), session_key_.size());
}

Message PakeClient::begin() {
    keypair_ = Crypto::generate_exchange_keypair();
    session_key_.clear();
    proof_sent_ = false;
    authenticated_ = false;

    HandshakeMessage init;
    init.step = HandshakeStep::INIT;
    init.data = to_bytes(keypair_->public_key);
    return init.to_message(agent_id_);
}

Message PakeClient::respond(const Message& challenge) {
    if (!keypair_) {
        throw AuthenticationError("handshake has not been started");
    }

    auto round = HandshakeMessage::from_message(challenge);
    if (!round || round->step != HandshakeStep::CHALLENGE ||
        round->data.size() != crypto_scalarmult_BYTES + config::SESSION_KEY_SIZE) {
        throw AuthenticationError("server sent an invalid challenge");
    }

    std::vector<uint8_t> server_public(round->data.begin(), round->data.begin() + crypto_scalarmult_BYTES);
    std::vector<uint8_t> server_proof(round->data.begin() + crypto_scalarmult_BYTES, round->data.end());

    auto shared = Crypto::key_agreement(keypair_->secret_key, server_public);
    if (!shared) {
        throw AuthenticationError("key agreement with server failed");
    }

    std::vector<uint8_t> transcript = to_bytes(keypair_->public_key);
    transcript.insert(transcript.end(), server_public.begin(), server_public.end());

    std::vector<uint8_t> session_key = derive_session_key(*shared, transcript, secret_);
    Crypto::secure_zero(shared->data(), shared->size());

    if (!Crypto::constant_time_compare(compute_proof(SERVER_LABEL, transcript, session_key), server_proof)) {
        throw AuthenticationError("server proof did not verify");
    }

    session_key_ = std::move(session_key);
    proof_sent_ = true;

    HandshakeMessage proof;
    proof.step = HandshakeStep::PROOF;
    proof.data = compute_proof(CLIENT_LABEL, transcript, session_key_);
    return proof.to_message(agent_id_);
}

void PakeClient::complete(const Message& result) {
    auto round = HandshakeMessage::from_message(result);
    if (!proof_sent_ || !round || round->step != HandshakeStep::SUCCESS) {
        throw AuthenticationError("server did not confirm the handshake");
    }
    authenticated_ = true;
}

std::optional<std::vector<uint8_t>> PakeClient::session_key() const {
    if (session_key_.empty()) {
        return std::nullopt;
    }
    return session_key_;
}

} // namespace harbor
