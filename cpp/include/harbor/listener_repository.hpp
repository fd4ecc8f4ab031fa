/**
 * @file listener_repository.hpp
 * @brief In-memory store of listeners for one protocol family
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "harbor/listener.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace harbor {

/**
 * @brief ListenerRepository - thread-safe listener store
 *
 * Keyed by listener ID; enumeration follows creation order. Operator
 * commands and live agent traffic may use it concurrently.
 */
class ListenerRepository {
public:
    explicit ListenerRepository(Protocol protocol);

    Protocol protocol() const { return protocol_; }

    /**
     * @brief Store a listener
     * @throws ValidationError if the ID exists or the protocol does not match
     */
    void add(std::shared_ptr<Listener> listener);

    /**
     * @throws NotFoundError if no listener has the ID
     */
    std::shared_ptr<Listener> listener(const std::string& id) const;

    /**
     * @brief First listener (in creation order) with the name
     * @throws NotFoundError if no listener has the name
     */
    std::shared_ptr<Listener> listener_by_name(const std::string& name) const;

    bool contains(const std::string& id) const;

    /**
     * @brief Snapshot in creation order
     */
    std::vector<std::shared_ptr<Listener>> listeners() const;

    /**
     * @throws NotFoundError if no listener has the ID
     */
    void remove(const std::string& id);

    /**
     * @brief Change a mutable option on a stored listener
     * @throws NotFoundError, UnhandledError, ValidationError
     */
    void set_option(const std::string& id, const std::string& option, const std::string& value);

    size_t size() const;

private:
    const Protocol protocol_;
    std::map<std::string, std::shared_ptr<Listener>> listeners_;
    std::vector<std::string> order_;
    mutable std::mutex mutex_;
};

} // namespace harbor
