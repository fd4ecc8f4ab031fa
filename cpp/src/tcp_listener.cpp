/**
 * @file tcp_listener.cpp
 * @brief Implementation of the TCP listener
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/tcp_listener.hpp"

namespace harbor {

TcpListenerConfig TcpListenerConfig::parse(const Options& options) {
    TcpListenerConfig parsed;
    parsed.common = ListenerConfig::parse(options);
    parsed.iface = config::parse_interface(options);
    parsed.port = config::parse_port(options);
    return parsed;
}

std::shared_ptr<TcpListener> TcpListener::create(const std::string& id, const Options& options) {
    TcpListenerConfig settings = TcpListenerConfig::parse(options);
    return std::make_shared<TcpListener>(PrivateTag{}, id, options, std::move(settings));
}

Options TcpListener::default_options() {
    return {
        {config::OPTION_NAME, "My TCP Listener"},
        {config::OPTION_DESCRIPTION, "Default TCP Listener"},
        {config::OPTION_INTERFACE, config::DEFAULT_INTERFACE},
        {config::OPTION_PORT, std::to_string(config::DEFAULT_PEER_PORT)},
        {config::OPTION_PSK, "merlin"},
        {config::OPTION_TRANSFORMS, "aes,gob-base"},
        {config::OPTION_PROTOCOL, "TCP"},
        {config::OPTION_AUTHENTICATOR, "OPAQUE"}
    };
}

TcpListener::TcpListener(PrivateTag, std::string id, Options options, TcpListenerConfig settings)
    : Listener(std::move(id), std::move(options), std::move(settings.common))
    , interface_(std::move(settings.iface))
    , port_(settings.port)
{
}

std::string TcpListener::addr() const {
    return config::format_address(interface_, port_);
}

Options TcpListener::configured_options() const {
    Options configured = Listener::configured_options();
    configured[config::OPTION_INTERFACE] = interface_;
    configured[config::OPTION_PORT] = std::to_string(port_);
    return configured;
}

} // namespace harbor
