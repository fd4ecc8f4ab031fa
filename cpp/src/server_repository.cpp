/**
 * @file server_repository.cpp
 * @brief Implementation of the server store
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/server_repository.hpp"
#include "harbor/errors.hpp"

namespace harbor {

void ServerRepository::add(std::shared_ptr<Server> server) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = server->id();
    if (servers_.count(id) > 0) {
        throw ValidationError("a server with ID " + id + " already exists");
    }
    servers_.emplace(id, std::move(server));
}

std::shared_ptr<Server> ServerRepository::server(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        throw NotFoundError("a server with ID " + id + " does not exist");
    }
    return it->second;
}

bool ServerRepository::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(id) > 0;
}

void ServerRepository::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.erase(id) == 0) {
        throw NotFoundError("a server with ID " + id + " does not exist");
    }
}

size_t ServerRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.size();
}

} // namespace harbor
