/**
 * @file utilities.hpp
 * @brief Common utility functions for Harbor
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout Harbor:
 * - Logging and error reporting
 * - String manipulation
 * - Identifier generation
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace harbor {
namespace utilities {

/**
 * @brief Log levels for Harbor logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if the name is not recognized
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Split string by delimiter
 * @param str String to split
 * @param delimiter Delimiter character
 * @return Vector of split strings (an empty input yields one empty element)
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Join strings with a separator
 */
std::string join_strings(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Trim whitespace from string
 * @param str String to trim
 * @return Trimmed string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 * @param str String to convert
 * @return Lowercase string
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Generate UUID v4 string from the libsodium CSPRNG
 * @return UUID string (e.g., "550e8400-e29b-41d4-a716-446655440000")
 */
std::string generate_uuid();

} // namespace utilities
} // namespace harbor
