/**
 * @file tcp_listener.hpp
 * @brief Peer-to-peer TCP listener (bind or reverse agents)
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * TCP listeners own no socket. Their traffic arrives as delegate messages
 * forwarded by a parent agent, and the interface/port describe where the
 * child agent binds or connects.
 */

#pragma once

#include "harbor/listener.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace harbor {

/**
 * @brief Validated TCP listener settings
 */
struct TcpListenerConfig {
    ListenerConfig common;
    std::string iface;
    uint16_t port = 0;

    /**
     * @throws ValidationError for a missing or invalid option
     */
    static TcpListenerConfig parse(const Options& options);
};

/**
 * @brief TcpListener - TCP protocol variant
 */
class TcpListener : public Listener {
    struct PrivateTag {};

public:
    /**
     * @brief Validate options and construct a listener
     * @param id Listener identifier assigned by the service
     * @param options Name, Description, Interface, Port, PSK, Transforms, Authenticator
     * @throws ValidationError for invalid options
     */
    static std::shared_ptr<TcpListener> create(const std::string& id, const Options& options);

    // Use create()
    TcpListener(PrivateTag, std::string id, Options options, TcpListenerConfig settings);

    static Options default_options();

    Protocol protocol() const override { return Protocol::TCP; }
    std::string addr() const override;
    Options configured_options() const override;

    const std::string& iface() const { return interface_; }
    uint16_t port() const { return port_; }

private:
    const std::string interface_;
    const uint16_t port_;
};

} // namespace harbor
