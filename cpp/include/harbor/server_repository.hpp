/**
 * @file server_repository.hpp
 * @brief In-memory store of infrastructure servers keyed by ID
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "harbor/server.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace harbor {

/**
 * @brief ServerRepository - thread-safe server store
 *
 * A server shares its ID with the listener that owns it.
 */
class ServerRepository {
public:
    /**
     * @throws ValidationError if the ID is already stored
     */
    void add(std::shared_ptr<Server> server);

    /**
     * @throws NotFoundError if no server has the ID
     */
    std::shared_ptr<Server> server(const std::string& id) const;

    bool contains(const std::string& id) const;

    /**
     * @throws NotFoundError if no server has the ID
     */
    void remove(const std::string& id);

    size_t size() const;

private:
    std::map<std::string, std::shared_ptr<Server>> servers_;
    mutable std::mutex mutex_;
};

} // namespace harbor
