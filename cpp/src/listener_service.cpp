/**
 * @file listener_service.cpp
 * @brief Implementation of the listener service
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/listener_service.hpp"
#include "harbor/errors.hpp"
#include "harbor/http_listener.hpp"
#include "harbor/smb_listener.hpp"
#include "harbor/tcp_listener.hpp"
#include "harbor/udp_listener.hpp"
#include "harbor/utilities.hpp"

#include <chrono>

namespace harbor {

namespace {

// A freshly launched thread has not reached Server::start() yet
void await_launch(const Server& server, const std::atomic<bool>& finished) {
    while (!finished.load() && !server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

ListenerService::ListenerService(MessageHandler agent_handler)
    : http_listeners_(Protocol::HTTP)
    , smb_listeners_(Protocol::SMB)
    , tcp_listeners_(Protocol::TCP)
    , udp_listeners_(Protocol::UDP)
    , agent_handler_(std::move(agent_handler))
{
}

ListenerService::~ListenerService() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);

    for (auto& [id, task] : tasks_) {
        await_launch(*task.server, *task.finished);
        if (task.server->is_running()) {
            try {
                task.server->stop();
            } catch (const std::exception& e) {
                utilities::log_error("Failed to stop server for listener " + id + ": " + e.what());
            }
        }
    }

    for (auto& [id, task] : tasks_) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
    tasks_.clear();
}

// ============================================================================
// Creation
// ============================================================================

std::shared_ptr<Listener> ListenerService::new_listener(const Options& options) {
    auto protocol_option = config::get_option(options, config::OPTION_PROTOCOL);
    if (!protocol_option) {
        throw ValidationError("the options did not contain the \"Protocol\" key");
    }

    Protocol protocol = protocol_from_string(*protocol_option);
    std::string id = generate_listener_id();
    std::shared_ptr<Listener> listener;

    switch (protocol) {
        case Protocol::HTTP: {
            auto server = HttpServer::create(id, options);
            http_servers_.add(server);
            try {
                listener = HttpListener::create(id, options, server);
            } catch (const std::exception&) {
                http_servers_.remove(id);
                throw;
            }
            break;
        }
        case Protocol::SMB:
            listener = SmbListener::create(id, options);
            break;
        case Protocol::TCP:
            listener = TcpListener::create(id, options);
            break;
        case Protocol::UDP:
            listener = UdpListener::create(id, options);
            break;
        default:
            throw ValidationError("unhandled listener protocol: " + *protocol_option);
    }

    if (agent_handler_) {
        listener->set_message_handler(agent_handler_);
    }

    try {
        repository(protocol).add(listener);
    } catch (const std::exception&) {
        if (protocol == Protocol::HTTP) {
            http_servers_.remove(id);
        }
        throw;
    }

    std::string protocol_name = listener->server() ? listener->server()->protocol_string()
                                                   : protocol_to_string(protocol);
    utilities::log_info("Created " + protocol_name + " listener on " + listener->addr() +
                        " with name: " + listener->name() + ", ID: " + id +
                        ", Authenticator: " + listener->authenticator_name() +
                        ", Transforms: " + listener->transforms());
    return listener;
}

Options ListenerService::default_options(const std::string& protocol) const {
    Options options;

    switch (protocol_from_string(protocol)) {
        case Protocol::HTTP:
            options = HttpListener::default_options();
            // Server keys win on conflict
            for (const auto& [key, value] : HttpServer::default_options()) {
                options[key] = value;
            }
            break;
        case Protocol::SMB:
            options = SmbListener::default_options();
            break;
        case Protocol::TCP:
            options = TcpListener::default_options();
            break;
        case Protocol::UDP:
            options = UdpListener::default_options();
            break;
        default:
            throw UnhandledError("unhandled listener protocol: " + protocol);
    }

    return options;
}

std::vector<std::string> ListenerService::supported_protocols() const {
    std::vector<std::string> protocols;
    for (Protocol protocol : listener_protocols()) {
        if (protocol == Protocol::HTTP) {
            for (const auto& name : HttpServer::supported_protocols()) {
                protocols.push_back(name);
            }
        } else {
            protocols.push_back(protocol_to_string(protocol));
        }
    }
    return protocols;
}

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<Listener> ListenerService::listener(const std::string& id) const {
    for (Protocol protocol : listener_protocols()) {
        try {
            return repository(protocol).listener(id);
        } catch (const NotFoundError&) {
            // Try the next protocol
        }
    }
    throw NotFoundError("a listener with ID " + id + " does not exist");
}

std::shared_ptr<Listener> ListenerService::listener_by_name(const std::string& name) const {
    for (Protocol protocol : listener_protocols()) {
        try {
            return repository(protocol).listener_by_name(name);
        } catch (const NotFoundError&) {
            // Try the next protocol
        }
    }
    throw NotFoundError("a listener named " + name + " does not exist");
}

std::vector<std::shared_ptr<Listener>> ListenerService::listeners() const {
    std::vector<std::shared_ptr<Listener>> all;
    for (Protocol protocol : listener_protocols()) {
        auto stored = repository(protocol).listeners();
        all.insert(all.end(), stored.begin(), stored.end());
    }
    return all;
}

std::vector<std::string> ListenerService::listener_names() const {
    std::vector<std::string> names;
    for (const auto& listener : listeners()) {
        names.push_back(listener->name());
    }
    return names;
}

std::vector<std::shared_ptr<Listener>> ListenerService::listeners_by_type(Protocol protocol) const {
    if (protocol == Protocol::UNKNOWN) {
        throw UnhandledError("unhandled listener protocol: " + protocol_to_string(protocol));
    }
    return repository(protocol).listeners();
}

// ============================================================================
// Control
// ============================================================================

void ListenerService::remove(const std::string& id) {
    auto target = listener(id);

    if (auto server = target->server()) {
        await_task(id, *server);
        if (server->is_running()) {
            utilities::log_info("Stopping " + server->protocol_string() + " server on " + server->addr() +
                                " before removing listener " + target->name());
            server->stop();
        }
        join(id);
        if (http_servers_.contains(id)) {
            http_servers_.remove(id);
        }
    }

    repository(target->protocol()).remove(id);
    utilities::log_info("Removed " + protocol_to_string(target->protocol()) + " listener " +
                        target->name() + " (" + id + ")");
}

void ListenerService::start(const std::string& id) {
    auto target = listener(id);
    auto server = target->server();
    if (!server) {
        utilities::log_debug(protocol_to_string(target->protocol()) + " listener " + target->name() +
                             " has no server to start");
        return;
    }

    launch(id, server);
    utilities::log_info("Started " + server->protocol_string() + " listener " + target->name() +
                        " on " + server->addr());
}

void ListenerService::stop(const std::string& id) {
    auto target = listener(id);
    auto server = target->server();
    if (!server) {
        utilities::log_debug(protocol_to_string(target->protocol()) + " listener " + target->name() +
                             " has no server to stop");
        return;
    }

    await_task(id, *server);
    server->stop();
    join(id);
    utilities::log_info("Stopped " + server->protocol_string() + " listener " + target->name() +
                        " on " + server->addr());
}

void ListenerService::restart(const std::string& id) {
    auto target = listener(id);
    if (!target->server()) {
        return;
    }

    utilities::log_info("Restarting " + protocol_to_string(target->protocol()) + " listener " + target->name());

    // No lock spans the two calls; a failed start leaves the listener stopped
    stop(id);
    start(id);
}

void ListenerService::set_option(const std::string& id, const std::string& option, const std::string& value) {
    auto target = listener(id);
    repository(target->protocol()).set_option(id, option, value);
}

// ============================================================================
// Internals
// ============================================================================

ListenerRepository& ListenerService::repository(Protocol protocol) {
    switch (protocol) {
        case Protocol::HTTP: return http_listeners_;
        case Protocol::SMB: return smb_listeners_;
        case Protocol::TCP: return tcp_listeners_;
        case Protocol::UDP: return udp_listeners_;
        default:
            throw UnhandledError("unhandled listener protocol: " + protocol_to_string(protocol));
    }
}

const ListenerRepository& ListenerService::repository(Protocol protocol) const {
    switch (protocol) {
        case Protocol::HTTP: return http_listeners_;
        case Protocol::SMB: return smb_listeners_;
        case Protocol::TCP: return tcp_listeners_;
        case Protocol::UDP: return udp_listeners_;
        default:
            throw UnhandledError("unhandled listener protocol: " + protocol_to_string(protocol));
    }
}

std::string ListenerService::generate_listener_id() const {
    for (;;) {
        std::string id = utilities::generate_uuid();
        bool taken = http_servers_.contains(id);
        for (Protocol protocol : listener_protocols()) {
            taken = taken || repository(protocol).contains(id);
        }
        if (!taken) {
            return id;
        }
    }
}

void ListenerService::launch(const std::string& id, std::shared_ptr<Server> server) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);

    auto it = tasks_.find(id);
    if (it != tasks_.end()) {
        if (!it->second.finished->load() || server->is_running()) {
            throw LifecycleError("the " + server->protocol_string() + " server on " + server->addr() +
                                 " is already running");
        }
        if (it->second.thread.joinable()) {
            it->second.thread.join();
        }
        tasks_.erase(it);
    } else if (server->is_running()) {
        throw LifecycleError("the " + server->protocol_string() + " server on " + server->addr() +
                             " is already running");
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([server, finished, id]() {
        try {
            server->start();
        } catch (const std::exception& e) {
            utilities::log_error("Server for listener " + id + " exited: " + e.what());
        }
        finished->store(true);
    });

    tasks_.emplace(id, ServerTask{server, std::move(thread), finished});
}

void ListenerService::await_task(const std::string& id, const Server& server) {
    std::shared_ptr<std::atomic<bool>> finished;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return;
        }
        finished = it->second.finished;
    }
    await_launch(server, *finished);
}

void ListenerService::join(const std::string& id) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);

    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return;
    }
    if (it->second.thread.joinable()) {
        it->second.thread.join();
    }
    tasks_.erase(it);
}

} // namespace harbor
