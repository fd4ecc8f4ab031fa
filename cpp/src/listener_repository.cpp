/**
 * @file listener_repository.cpp
 * @brief Implementation of the listener store
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/listener_repository.hpp"
#include "harbor/errors.hpp"

#include <algorithm>

namespace harbor {

ListenerRepository::ListenerRepository(Protocol protocol)
    : protocol_(protocol)
{
}

void ListenerRepository::add(std::shared_ptr<Listener> listener) {
    if (listener->protocol() != protocol_) {
        throw ValidationError("a " + protocol_to_string(listener->protocol()) +
                              " listener can not be stored with " + protocol_to_string(protocol_) + " listeners");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string& id = listener->id();
    if (listeners_.count(id) > 0) {
        throw ValidationError("a listener with ID " + id + " already exists");
    }
    order_.push_back(id);
    listeners_.emplace(id, std::move(listener));
}

std::shared_ptr<Listener> ListenerRepository::listener(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(id);
    if (it == listeners_.end()) {
        throw NotFoundError("a " + protocol_to_string(protocol_) + " listener with ID " + id + " does not exist");
    }
    return it->second;
}

std::shared_ptr<Listener> ListenerRepository::listener_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : order_) {
        const auto& candidate = listeners_.at(id);
        if (candidate->name() == name) {
            return candidate;
        }
    }
    throw NotFoundError("a " + protocol_to_string(protocol_) + " listener named " + name + " does not exist");
}

bool ListenerRepository::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.count(id) > 0;
}

std::vector<std::shared_ptr<Listener>> ListenerRepository::listeners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Listener>> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(listeners_.at(id));
    }
    return result;
}

void ListenerRepository::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listeners_.erase(id) == 0) {
        throw NotFoundError("a " + protocol_to_string(protocol_) + " listener with ID " + id + " does not exist");
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
}

void ListenerRepository::set_option(const std::string& id, const std::string& option, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(id);
    if (it == listeners_.end()) {
        throw NotFoundError("a " + protocol_to_string(protocol_) + " listener with ID " + id + " does not exist");
    }
    it->second->set_option(option, value);
}

size_t ListenerRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

} // namespace harbor
