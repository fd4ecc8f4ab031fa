/**
 * @file config.cpp
 * @brief Implementation of configuration and option parsing
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/config.hpp"
#include "harbor/errors.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>

using json = nlohmann::json;

namespace harbor {
namespace config {

// ============================================================================
// Environment
// ============================================================================

utilities::LogLevel get_log_level() {
    std::string value = utilities::get_env("HARBOR_LOG_LEVEL");
    if (value.empty()) {
        return utilities::LogLevel::INFO;
    }

    auto level = utilities::parse_log_level(value);
    if (!level) {
        utilities::log_warn("Ignoring unrecognized HARBOR_LOG_LEVEL: " + value);
        return utilities::LogLevel::INFO;
    }
    return *level;
}

std::string get_log_file() {
    return utilities::get_env("HARBOR_LOG_FILE");
}

// ============================================================================
// Option Parsing
// ============================================================================

std::optional<std::string> get_option(const Options& options, const std::string& key) {
    auto it = options.find(key);
    if (it == options.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_ip_address(const std::string& value) {
    asio::error_code ec;
    asio::ip::make_address(value, ec);
    return !ec;
}

std::string parse_interface(const Options& options) {
    auto iface = get_option(options, OPTION_INTERFACE);
    if (!iface || iface->empty()) {
        throw ValidationError("a network interface address must be provided");
    }
    if (!is_ip_address(*iface)) {
        throw ValidationError(*iface + " is not a valid network interface");
    }
    return *iface;
}

uint16_t parse_port(const Options& options) {
    auto port = get_option(options, OPTION_PORT);
    if (!port || port->empty()) {
        throw ValidationError("a network interface port must be provided");
    }

    bool numeric = std::all_of(port->begin(), port->end(),
        [](unsigned char c) { return std::isdigit(c); });

    // At most 5 digits keeps stoul within range before the bounds check
    if (!numeric || port->size() > 5) {
        throw ValidationError("there was an error converting the port number to an integer: " + *port);
    }

    unsigned long value = std::stoul(*port);
    if (value > 65535) {
        throw ValidationError("port " + *port + " is outside the range 0-65535");
    }
    return static_cast<uint16_t>(value);
}

std::string format_address(const std::string& host, uint16_t port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// ============================================================================
// Listener Definitions
// ============================================================================

std::vector<Options> load_listener_definitions(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open listener definitions: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ValidationError("listener definitions " + path.string() + " are not valid JSON: " + e.what());
    }

    if (!document.is_array()) {
        throw ValidationError("listener definitions " + path.string() + " must be a JSON array");
    }

    std::vector<Options> definitions;
    definitions.reserve(document.size());

    for (size_t i = 0; i < document.size(); ++i) {
        const json& entry = document[i];
        if (!entry.is_object()) {
            throw ValidationError("listener definition " + std::to_string(i) + " is not an object");
        }

        Options options;
        for (auto it = entry.begin(); it != entry.end(); ++it) {
            if (!it.value().is_string()) {
                throw ValidationError("listener definition " + std::to_string(i) +
                                      ": option " + it.key() + " must be a string");
            }
            options[it.key()] = it.value().get<std::string>();
        }
        definitions.push_back(std::move(options));
    }

    return definitions;
}

} // namespace config
} // namespace harbor
