/**
 * @file listener_server.cpp
 * @brief Example server that runs listeners from a JSON definition file
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates basic ListenerService usage:
 * - Load listener definitions
 * - Create and start listeners
 * - Print the listener table
 * - Stop cleanly on SIGINT/SIGTERM
 */

#include "harbor/config.hpp"
#include "harbor/crypto.hpp"
#include "harbor/listener_service.hpp"
#include "harbor/utilities.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

using namespace harbor;
using namespace harbor::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int) {
    g_shutdown = true;
}

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <listeners.json>\n\n";
    std::cout << "The file holds a JSON array of listener option objects, e.g.\n";
    std::cout << "  [{\"Protocol\": \"http\", \"Name\": \"Web\", \"Interface\": \"127.0.0.1\",\n";
    std::cout << "    \"Port\": \"8080\", \"PSK\": \"secret\", \"Transforms\": \"aes,gob-base\",\n";
    std::cout << "    \"Authenticator\": \"opaque\"}]\n\n";
    std::cout << "Environment:\n";
    std::cout << "  HARBOR_LOG_LEVEL   debug, info, warn, error, critical (default: info)\n";
    std::cout << "  HARBOR_LOG_FILE    Rotating log file (default: console only)\n\n";
}

void print_listeners(const ListenerService& service) {
    std::cout << "\n"
              << std::left << std::setw(24) << "NAME"
              << std::setw(8) << "PROTOCOL"
              << std::setw(38) << "ID"
              << std::setw(10) << "STATUS"
              << "ADDRESS\n";

    for (const auto& listener : service.listeners()) {
        std::cout << std::left << std::setw(24) << listener->name()
                  << std::setw(8) << protocol_to_string(listener->protocol())
                  << std::setw(38) << listener->id()
                  << std::setw(10) << listener->status()
                  << listener->addr() << "\n";
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        print_usage(argv[0]);
        return 1;
    }

    initialize_logging(config::get_log_file(), config::get_log_level());

    if (!Crypto::initialize()) {
        log_critical("Failed to initialize libsodium");
        return 1;
    }

    std::vector<Options> definitions;
    try {
        definitions = config::load_listener_definitions(argv[1]);
    } catch (const std::exception& e) {
        log_critical(std::string("Failed to load listener definitions: ") + e.what());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ListenerService service;

    for (const auto& options : definitions) {
        try {
            auto listener = service.new_listener(options);
            service.start(listener->id());
        } catch (const std::exception& e) {
            log_error(std::string("Skipping listener definition: ") + e.what());
        }
    }

    if (service.listeners().empty()) {
        log_critical("No listeners were created");
        return 1;
    }

    // Give servers a moment to bind before printing their status
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    print_listeners(service);

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log_info("Shutting down");
    for (const auto& listener : service.listeners()) {
        if (listener->server() && listener->server()->is_running()) {
            try {
                service.stop(listener->id());
            } catch (const std::exception& e) {
                log_error("Failed to stop listener " + listener->name() + ": " + e.what());
            }
        }
    }

    return 0;
}
