/**
 * @file smb_listener.hpp
 * @brief Peer-to-peer SMB named pipe listener
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "harbor/listener.hpp"

#include <memory>
#include <string>

namespace harbor {

struct SmbListenerConfig {
    ListenerConfig common;
    std::string pipe;

    /**
     * @throws ValidationError for a missing option
     */
    static SmbListenerConfig parse(const Options& options);
};

/**
 * @brief SmbListener - named pipe protocol variant
 *
 * Child agents listen on (or connect to) the named pipe; their traffic is
 * forwarded by a parent agent.
 */
class SmbListener : public Listener {
    struct PrivateTag {};

public:
    /**
     * @param options Name, Description, Pipe, PSK, Transforms, Authenticator
     * @throws ValidationError for invalid options
     */
    static std::shared_ptr<SmbListener> create(const std::string& id, const Options& options);

    // Use create()
    SmbListener(PrivateTag, std::string id, Options options, SmbListenerConfig settings);

    static Options default_options();

    Protocol protocol() const override { return Protocol::SMB; }

    /**
     * @brief Pipe name (e.g., "merlinpipe")
     */
    std::string addr() const override { return pipe_; }

    Options configured_options() const override;

    const std::string& pipe() const { return pipe_; }

private:
    const std::string pipe_;
};

} // namespace harbor
