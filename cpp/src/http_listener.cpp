/**
 * @file http_listener.cpp
 * @brief Implementation of the HTTP listener
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/http_listener.hpp"
#include "harbor/errors.hpp"

namespace harbor {

std::shared_ptr<HttpListener> HttpListener::create(
    const std::string& id,
    const Options& options,
    std::shared_ptr<Server> server
) {
    if (!server) {
        throw ValidationError("an HTTP listener requires a server");
    }

    ListenerConfig settings = ListenerConfig::parse(options);
    auto listener = std::make_shared<HttpListener>(PrivateTag{}, id, options, std::move(settings), server);

    // Weak reference avoids a listener <-> server ownership cycle
    std::weak_ptr<HttpListener> weak = listener;
    server->set_handler([weak](const std::string& agent_id, const std::vector<uint8_t>& body) {
        auto owner = weak.lock();
        if (!owner) {
            throw LifecycleError("listener for agent " + agent_id + " no longer exists");
        }
        return owner->handle(agent_id, body);
    });

    return listener;
}

Options HttpListener::default_options() {
    return {
        {config::OPTION_NAME, "My HTTP Listener"},
        {config::OPTION_DESCRIPTION, "Default HTTP Listener"},
        {config::OPTION_PSK, "merlin"},
        {config::OPTION_TRANSFORMS, "aes,gob-base"},
        {config::OPTION_AUTHENTICATOR, "OPAQUE"}
    };
}

HttpListener::HttpListener(PrivateTag, std::string id, Options options, ListenerConfig settings, std::shared_ptr<Server> server)
    : Listener(std::move(id), std::move(options), std::move(settings))
    , server_(std::move(server))
{
}

HttpListener::~HttpListener() {
    server_->set_handler(nullptr);
}

Options HttpListener::configured_options() const {
    Options configured = Listener::configured_options();
    for (const auto& [key, value] : server_->configured_options()) {
        configured[key] = value;
    }
    return configured;
}

std::string HttpListener::status() const {
    return server_state_to_string(server_->state());
}

} // namespace harbor
