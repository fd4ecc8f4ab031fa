/**
 * @file udp_listener.hpp
 * @brief Peer-to-peer UDP listener (bind or reverse agents)
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Like TCP, traffic is forwarded by a parent agent; no socket is opened here.
 */

#pragma once

#include "harbor/listener.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace harbor {

/**
 * @brief Validated UDP listener settings
 */
struct UdpListenerConfig {
    ListenerConfig common;
    std::string iface;
    uint16_t port = 0;

    static UdpListenerConfig parse(const Options& options);
};

/**
 * @brief UdpListener - UDP protocol variant
 */
class UdpListener : public Listener {
    struct PrivateTag {};

public:
    /**
     * @brief Validate options and construct a listener
     * @param id Listener identifier assigned by the service
     * @param options Name, Description, Interface, Port, PSK, Transforms, Authenticator
     * @throws ValidationError for invalid options
     */
    static std::shared_ptr<UdpListener> create(const std::string& id, const Options& options);

    // Use create()
    UdpListener(PrivateTag, std::string id, Options options, UdpListenerConfig settings);

    static Options default_options();

    Protocol protocol() const override { return Protocol::UDP; }
    std::string addr() const override;
    Options configured_options() const override;

    const std::string& iface() const { return interface_; }
    uint16_t port() const { return port_; }

private:
    const std::string interface_;
    const uint16_t port_;
};

} // namespace harbor
