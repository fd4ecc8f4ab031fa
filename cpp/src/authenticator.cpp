/**
 * @file authenticator.cpp
 * @brief Implementation of authenticator selection and the none strategy
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/authenticator.hpp"
#include "harbor/pake_authenticator.hpp"
#include "harbor/errors.hpp"
#include "harbor/utilities.hpp"

namespace harbor {

// ============================================================================
// NoneAuthenticator
// ============================================================================

Message NoneAuthenticator::authenticate(const std::string& agent_id, const Message&) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        authenticated_.insert(agent_id);
    }
    utilities::log_debug("Agent " + agent_id + " accepted without authentication");
    return MessageHelpers::idle(agent_id);
}

bool NoneAuthenticator::is_authenticated(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return authenticated_.count(agent_id) > 0;
}

std::optional<std::vector<uint8_t>> NoneAuthenticator::session_key(const std::string&) const {
    return std::nullopt;
}

void NoneAuthenticator::reset(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    authenticated_.erase(agent_id);
}

// ============================================================================
// Selection
// ============================================================================

std::shared_ptr<Authenticator> make_authenticator(
    const std::optional<std::string>& selection,
    const std::vector<uint8_t>& pre_shared_key
) {
    std::string name = selection ? utilities::to_lowercase(utilities::trim_string(*selection)) : "";

    if (name == "opaque") {
        try {
            return std::make_shared<PakeAuthenticator>(pre_shared_key);
        } catch (const std::exception& e) {
            throw ValidationError(std::string("there was an error getting the authenticator: ") + e.what());
        }
    }

    if (!name.empty() && name != "none") {
        utilities::log_warn("Unrecognized authenticator " + *selection + " (supported: " +
                            utilities::join_strings(authenticator_names(), ",") + "), falling back to none");
    }
    return std::make_shared<NoneAuthenticator>();
}

std::vector<std::string> authenticator_names() {
    return {"none", "opaque"};
}

} // namespace harbor
