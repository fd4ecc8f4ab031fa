/**
 * @file http_listener.hpp
 * @brief HTTP listener backed by an infrastructure server
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The listener and its server share an ID. The server feeds every request
 * body through Listener::handle() and returns the encoded reply.
 */

#pragma once

#include "harbor/listener.hpp"
#include "harbor/server.hpp"

#include <memory>
#include <string>

namespace harbor {

/**
 * @brief HttpListener - network-facing protocol variant
 */
class HttpListener : public Listener {
    struct PrivateTag {};

public:
    /**
     * @brief Validate listener options and attach the server
     * @param id Listener identifier (same as the server's)
     * @param options Name, Description, PSK, Transforms, Authenticator
     * @param server Server created from the same options
     * @throws ValidationError for invalid options
     */
    static std::shared_ptr<HttpListener> create(
        const std::string& id,
        const Options& options,
        std::shared_ptr<Server> server
    );

    // Use create()
    HttpListener(PrivateTag, std::string id, Options options, ListenerConfig settings, std::shared_ptr<Server> server);

    /**
     * @brief Listener-level defaults (server defaults are merged by the service)
     */
    static Options default_options();

    ~HttpListener() override;

    Protocol protocol() const override { return Protocol::HTTP; }
    std::string addr() const override { return server_->addr(); }
    Options configured_options() const override;
    std::shared_ptr<Server> server() const override { return server_; }

    /**
     * @brief Server state as "Created", "Starting", "Running" or "Stopped"
     */
    std::string status() const override;

private:
    const std::shared_ptr<Server> server_;
};

} // namespace harbor
