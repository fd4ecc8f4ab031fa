/**
 * @file listener_service.hpp
 * @brief Entry point for creating, querying and controlling listeners
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Usage:
 *   ListenerService service;
 *   auto listener = service.new_listener({
 *       {"Protocol", "http"}, {"Name", "Web"}, {"Interface", "0.0.0.0"},
 *       {"Port", "8080"}, {"PSK", "secret"}, {"Transforms", "aes,gob-base"}
 *   });
 *   service.start(listener->id());
 *   ...
 *   service.stop(listener->id());
 */

#pragma once

#include "harbor/listener.hpp"
#include "harbor/listener_repository.hpp"
#include "harbor/server_repository.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace harbor {

/**
 * @brief ListenerService - façade over every protocol repository
 *
 * Lookups and enumerations scan repositories in the order HTTP, SMB, TCP,
 * UDP. Only HTTP listeners do work on start/stop/restart; the others are
 * no-ops. Thread-safe.
 */
class ListenerService {
public:
    /**
     * @param agent_handler Callback for messages from authenticated agents,
     *                      installed on every listener this service creates
     */
    explicit ListenerService(MessageHandler agent_handler = nullptr);

    /**
     * @brief Stops running servers and joins their threads
     */
    ~ListenerService();

    ListenerService(const ListenerService&) = delete;
    ListenerService& operator=(const ListenerService&) = delete;

    // ========================================================================
    // Creation
    // ========================================================================

    /**
     * @brief Create and store a listener
     * @param options Option bag; Protocol selects the variant (case-insensitive)
     * @return The stored listener
     * @throws ValidationError if Protocol is missing or unknown, or the variant rejects the options
     */
    std::shared_ptr<Listener> new_listener(const Options& options);

    /**
     * @brief Default option bag for a protocol (listener and server defaults merged)
     * @throws UnhandledError for an unknown protocol
     */
    Options default_options(const std::string& protocol) const;

    /**
     * @brief Protocol names accepted by new_listener() (for completion)
     */
    std::vector<std::string> supported_protocols() const;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @throws NotFoundError after every repository misses
     */
    std::shared_ptr<Listener> listener(const std::string& id) const;

    /**
     * @brief First listener with the name, HTTP before SMB before TCP before UDP
     * @throws NotFoundError after every repository misses
     */
    std::shared_ptr<Listener> listener_by_name(const std::string& name) const;

    std::vector<std::shared_ptr<Listener>> listeners() const;

    std::vector<std::string> listener_names() const;

    /**
     * @throws UnhandledError for Protocol::UNKNOWN
     */
    std::vector<std::shared_ptr<Listener>> listeners_by_type(Protocol protocol) const;

    // ========================================================================
    // Control
    // ========================================================================

    /**
     * @brief Remove a listener (an HTTP listener's running server is stopped first)
     * @throws NotFoundError
     */
    void remove(const std::string& id);

    /**
     * @brief Launch the listener's server on its own thread and return
     * @throws NotFoundError, LifecycleError if the server is already running
     */
    void start(const std::string& id);

    /**
     * @brief Stop the listener's server and wait for it to exit
     * @throws NotFoundError, LifecycleError if the server is not running
     */
    void stop(const std::string& id);

    /**
     * @brief stop() then start(); a failed start leaves the listener stopped
     * @throws NotFoundError, LifecycleError
     */
    void restart(const std::string& id);

    /**
     * @throws NotFoundError, UnhandledError, ValidationError
     */
    void set_option(const std::string& id, const std::string& option, const std::string& value);

private:
    struct ServerTask {
        std::shared_ptr<Server> server;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    ListenerRepository& repository(Protocol protocol);
    const ListenerRepository& repository(Protocol protocol) const;

    std::string generate_listener_id() const;

    void launch(const std::string& id, std::shared_ptr<Server> server);

    // Wait until a launched task has reached Server::start() or exited
    void await_task(const std::string& id, const Server& server);
    void join(const std::string& id);

    ListenerRepository http_listeners_;
    ListenerRepository smb_listeners_;
    ListenerRepository tcp_listeners_;
    ListenerRepository udp_listeners_;
    ServerRepository http_servers_;

    const MessageHandler agent_handler_;

    std::mutex tasks_mutex_;
    std::map<std::string, ServerTask> tasks_;
};

} // namespace harbor
