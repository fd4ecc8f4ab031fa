/**
 * @file server.hpp
 * @brief Infrastructure servers that carry agent traffic for listeners
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A server owns the network endpoint (socket, accept loop). Listeners own
 * the agent-facing configuration and hand request bodies to the transform
 * chain. Only HTTP listeners are backed by a server.
 */

#pragma once

#include "harbor/cancellation.hpp"
#include "harbor/config.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace harbor {

/**
 * @brief Server lifecycle state
 */
enum class ServerState {
    CREATED,    ///< Constructed, never started
    STARTING,   ///< start() called, endpoint not yet bound
    RUNNING,    ///< Accepting connections
    STOPPED     ///< Stopped or failed to start
};

std::string server_state_to_string(ServerState state);

/**
 * @brief Callback invoked with (agent ID, request body); returns the response body
 *
 * Throwing marks the request as failed.
 */
using RequestHandler = std::function<std::vector<uint8_t>(
    const std::string& agent_id,
    const std::vector<uint8_t>& body
)>;

/**
 * @brief Server - infrastructure server abstraction
 */
class Server {
public:
    virtual ~Server() = default;

    virtual std::string id() const = 0;

    /**
     * @brief Bind and serve until stopped (blocks the calling thread)
     * @throws LifecycleError if already running or the endpoint cannot be bound
     */
    virtual void start() = 0;

    /**
     * @brief Stop a running server and wait for the serve loop to exit
     * @throws LifecycleError if not running or the loop does not exit in time
     */
    virtual void stop() = 0;

    virtual ServerState state() const = 0;

    bool is_running() const {
        ServerState current = state();
        return current == ServerState::STARTING || current == ServerState::RUNNING;
    }

    /**
     * @brief Bound address ("interface:port")
     */
    virtual std::string addr() const = 0;

    /**
     * @brief Wire protocol name (e.g., "HTTP")
     */
    virtual std::string protocol_string() const = 0;

    /**
     * @brief Options this server was created with, normalized
     */
    virtual Options configured_options() const = 0;

    virtual void set_handler(RequestHandler handler) = 0;
};

/**
 * @brief HttpServer - HTTP/1.1 POST endpoint on standalone asio
 *
 * Agents POST encoded messages to one of the configured URL paths and
 * identify themselves with the X-Agent-ID header. Every request is answered
 * on its own connection (Connection: close). Serving runs on the thread
 * that called start().
 */
class HttpServer : public Server {
    struct PrivateTag {};

public:
    /**
     * @brief Validate options and construct a server
     * @param id Identifier shared with the owning listener
     * @param options Interface, Port, Protocol, URLS
     * @throws ValidationError for invalid or unsupported options
     */
    static std::shared_ptr<HttpServer> create(const std::string& id, const Options& options);

    // Use create()
    HttpServer(PrivateTag, std::string id, std::string iface, uint16_t port, std::vector<std::string> urls);

    /**
     * @brief Default server options (Interface, Port, Protocol, URLS)
     */
    static Options default_options();

    /**
     * @brief Protocol strings accepted in the Protocol option
     */
    static std::vector<std::string> supported_protocols();

    ~HttpServer() override;

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    std::string id() const override { return id_; }
    void start() override;
    void stop() override;
    ServerState state() const override;
    std::string addr() const override;
    std::string protocol_string() const override { return "HTTP"; }
    Options configured_options() const override;
    void set_handler(RequestHandler handler) override;

    /**
     * @brief Actual bound port (differs from the configured one when Port is 0)
     * @return Bound port, or 0 if the server has not bound yet
     */
    uint16_t bound_port() const { return bound_port_.load(); }

    const std::vector<std::string>& urls() const { return urls_; }

    /**
     * @brief Dispatch one request body to the handler
     * @return Response body
     */
    std::vector<uint8_t> dispatch(const std::string& agent_id, const std::vector<uint8_t>& body) const;

    bool serves_path(const std::string& path) const;

private:
    void serve(CancellationToken token);
    void set_state(ServerState state);

    const std::string id_;
    const std::string interface_;
    const uint16_t port_;
    const std::vector<std::string> urls_;
    std::atomic<uint16_t> bound_port_{0};

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ServerState state_ = ServerState::CREATED;
    CancellationToken token_;

    mutable std::mutex handler_mutex_;
    RequestHandler handler_;
};

} // namespace harbor
