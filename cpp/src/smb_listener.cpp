/**
 * @file smb_listener.cpp
 * @brief Implementation of the SMB listener
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/smb_listener.hpp"
#include "harbor/errors.hpp"
#include "harbor/utilities.hpp"

namespace harbor {

SmbListenerConfig SmbListenerConfig::parse(const Options& options) {
    SmbListenerConfig parsed;
    parsed.common = ListenerConfig::parse(options);

    auto pipe = config::get_option(options, config::OPTION_PIPE);
    if (!pipe || utilities::trim_string(*pipe).empty()) {
        throw ValidationError("a named pipe must be provided");
    }
    parsed.pipe = utilities::trim_string(*pipe);
    return parsed;
}

std::shared_ptr<SmbListener> SmbListener::create(const std::string& id, const Options& options) {
    SmbListenerConfig settings = SmbListenerConfig::parse(options);
    return std::make_shared<SmbListener>(PrivateTag{}, id, options, std::move(settings));
}

Options SmbListener::default_options() {
    return {
        {config::OPTION_NAME, "My SMB Listener"},
        {config::OPTION_DESCRIPTION, "Default SMB Listener"},
        {config::OPTION_PIPE, config::DEFAULT_SMB_PIPE},
        {config::OPTION_PSK, "merlin"},
        {config::OPTION_TRANSFORMS, "aes,gob-base"},
        {config::OPTION_PROTOCOL, "SMB"},
        {config::OPTION_AUTHENTICATOR, "OPAQUE"}
    };
}

SmbListener::SmbListener(PrivateTag, std::string id, Options options, SmbListenerConfig settings)
    : Listener(std::move(id), std::move(options), std::move(settings.common))
    , pipe_(std::move(settings.pipe))
{
}

Options SmbListener::configured_options() const {
    Options configured = Listener::configured_options();
    configured[config::OPTION_PIPE] = pipe_;
    return configured;
}

} // namespace harbor
