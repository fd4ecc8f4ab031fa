/**
 * @file udp_listener.cpp
 * @brief Implementation of the UDP listener
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/udp_listener.hpp"

namespace harbor {

UdpListenerConfig UdpListenerConfig::parse(const Options& options) {
    UdpListenerConfig parsed;
    parsed.common = ListenerConfig::parse(options);
    parsed.iface = config::parse_interface(options);
    parsed.port = config::parse_port(options);
    return parsed;
}

std::shared_ptr<UdpListener> UdpListener::create(const std::string& id, const Options& options) {
    UdpListenerConfig settings = UdpListenerConfig::parse(options);
    return std::make_shared<UdpListener>(PrivateTag{}, id, options, std::move(settings));
}

Options UdpListener::default_options() {
    return {
        {config::OPTION_NAME, "My UDP Listener"},
        {config::OPTION_DESCRIPTION, "Default UDP Listener"},
        {config::OPTION_INTERFACE, config::DEFAULT_INTERFACE},
        {config::OPTION_PORT, std::to_string(config::DEFAULT_PEER_PORT)},
        {config::OPTION_PSK, "merlin"},
        {config::OPTION_TRANSFORMS, "aes,gob-base"},
        {config::OPTION_PROTOCOL, "UDP"},
        {config::OPTION_AUTHENTICATOR, "OPAQUE"}
    };
}

UdpListener::UdpListener(PrivateTag, std::string id, Options options, UdpListenerConfig settings)
    : Listener(std::move(id), std::move(options), std::move(settings.common))
    , interface_(std::move(settings.iface))
    , port_(settings.port)
{
}

std::string UdpListener::addr() const {
    return config::format_address(interface_, port_);
}

Options UdpListener::configured_options() const {
    Options configured = Listener::configured_options();
    configured[config::OPTION_INTERFACE] = interface_;
    configured[config::OPTION_PORT] = std::to_string(port_);
    return configured;
}

} // namespace harbor
