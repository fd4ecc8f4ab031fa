/**
 * @file config.hpp
 * @brief Configuration constants, option parsing and listener definition loading
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "harbor/utilities.hpp"

#include <cstdint>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace harbor {

/**
 * @brief Configuration bag passed to listener factories (key -> value)
 *
 * std::map keeps keys in ascending lexical order for display.
 */
using Options = std::map<std::string, std::string>;

namespace config {

// ============================================================================
// Size Limits
// ============================================================================

/// Maximum encoded agent message accepted by a listener (10MB)
constexpr size_t MAX_MESSAGE_SIZE = 10 * 1024 * 1024;

/// Maximum HTTP request header block
constexpr size_t MAX_HTTP_HEADER_SIZE = 16 * 1024;

// ============================================================================
// Cryptographic Configuration
// ============================================================================

/// SHA-256 digest size (derived pre-shared key)
constexpr size_t PSK_DIGEST_SIZE = 32;

/// AES-256-GCM key size
constexpr size_t AES_KEY_SIZE = 32;

/// AES-256-GCM nonce size
constexpr size_t AES_NONCE_SIZE = 12;

/// AES-256-GCM tag size
constexpr size_t AES_TAG_SIZE = 16;

/// Per-agent session key size produced by the PAKE handshake
constexpr size_t SESSION_KEY_SIZE = 32;

// ============================================================================
// Network Configuration
// ============================================================================

constexpr const char DEFAULT_INTERFACE[] = "127.0.0.1";

constexpr uint16_t DEFAULT_HTTP_PORT = 80;

/// Port compiled into peer-to-peer (tcp-bind / udp-bind) agents
constexpr uint16_t DEFAULT_PEER_PORT = 7777;

constexpr const char DEFAULT_SMB_PIPE[] = "merlinpipe";

/// Read timeout for a single HTTP request
constexpr auto READ_TIMEOUT = std::chrono::seconds(30);

/// Upper bound on a synchronous server stop
constexpr auto SERVER_STOP_TIMEOUT = std::chrono::seconds(10);

// ============================================================================
// Recognized Option Keys
// ============================================================================

constexpr const char OPTION_PROTOCOL[] = "Protocol";
constexpr const char OPTION_NAME[] = "Name";
constexpr const char OPTION_DESCRIPTION[] = "Description";
constexpr const char OPTION_INTERFACE[] = "Interface";
constexpr const char OPTION_PORT[] = "Port";
constexpr const char OPTION_PSK[] = "PSK";
constexpr const char OPTION_TRANSFORMS[] = "Transforms";
constexpr const char OPTION_AUTHENTICATOR[] = "Authenticator";
constexpr const char OPTION_PIPE[] = "Pipe";
constexpr const char OPTION_URLS[] = "URLS";

// ============================================================================
// Environment
// ============================================================================

/**
 * @brief Log level from HARBOR_LOG_LEVEL (default: info)
 */
utilities::LogLevel get_log_level();

/**
 * @brief Log file path from HARBOR_LOG_FILE (empty for console only)
 */
std::string get_log_file();

// ============================================================================
// Option Parsing
// ============================================================================

/**
 * @brief Look up an option value
 * @return Value if the key is present (possibly empty), std::nullopt otherwise
 */
std::optional<std::string> get_option(const Options& options, const std::string& key);

/**
 * @brief Check whether a string is an IPv4 or IPv6 literal
 */
bool is_ip_address(const std::string& value);

/**
 * @brief Validate the Interface option
 * @return The interface address
 * @throws ValidationError if absent, empty or not an IP literal
 */
std::string parse_interface(const Options& options);

/**
 * @brief Validate the Port option
 * @return Port number in 0..65535
 * @throws ValidationError if absent, empty or not numeric
 */
uint16_t parse_port(const Options& options);

/**
 * @brief Format host and port for display ("[::1]:80" for IPv6)
 */
std::string format_address(const std::string& host, uint16_t port);

// ============================================================================
// Listener Definitions
// ============================================================================

/**
 * @brief Load listener definitions from a JSON file
 *
 * The file holds an array of objects; every member value must be a string.
 * Each object is one option bag for ListenerService::new_listener().
 *
 * @param path Path to JSON file
 * @return Option bags in file order
 * @throws ValidationError if the file is malformed, std::runtime_error if unreadable
 */
std::vector<Options> load_listener_definitions(const std::filesystem::path& path);

} // namespace config
} // namespace harbor
