#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the console renderer and the launcher.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON file / environment) in real deployments.
 */

#include <chrono>
#include <cstdint>

namespace ignite::config::constants {

// =====================
// Console Block geometry
// =====================
/// Smallest usable block width: two edge glyphs plus a two-column interior.
inline constexpr int CONSOLE_MIN_WIDTH       = 4;
/// Width used when neither the terminal nor $COLUMNS reports one.
inline constexpr int CONSOLE_FALLBACK_WIDTH  = 80;
/// Lower bound applied to a $COLUMNS override.
inline constexpr int CONSOLE_COLUMNS_FLOOR   = 20;

// =====================
// Console labels and glyphs
// =====================
inline constexpr const char* CONSOLE_SUCCESS_LABEL = "success";
inline constexpr char        CONSOLE_CORNER        = '+';
inline constexpr char        CONSOLE_HLINE         = '-';
inline constexpr char        CONSOLE_VLINE         = '|';

// =====================
// Registry (Consul agent) Defaults
// =====================
inline constexpr const char* REGISTRY_REGISTER_ADDRESS =
    "http://localhost:8500/v1/agent/service/register";   ///< Service registration endpoint
inline constexpr const char* REGISTRY_PASS_ADDRESS =
    "http://localhost:8500/v1/agent/check/pass/";        ///< Prefix of the TTL pass endpoint
inline constexpr const char* REGISTRY_CHECK_INTERVAL = "30s"; ///< Agent polling interval
inline constexpr const char* REGISTRY_CHECK_TIMEOUT  = "3s";  ///< Agent check timeout
inline constexpr int         REGISTRY_HTTP_OK        = 200;   ///< Only status accepted as success

// =====================
// Launcher / runner Defaults
// =====================
inline constexpr const char* LAUNCH_DEFAULT_HOST     = "127.0.0.1";
inline constexpr const char* LAUNCH_HEALTH_PATH      = "/health";
inline constexpr const char* LAUNCH_COMMAND_PROGRAM  = "gunicorn";
inline constexpr int         LAUNCH_COMMAND_WORKERS  = 1;
/// Exit status reported when the runner program cannot be executed.
inline constexpr int         LAUNCH_EXEC_FAILED      = 127;

// =====================
// HTTP Defaults
// =====================
inline constexpr uint16_t    HTTP_DEFAULT_PORT       = 80;
inline constexpr int         HTTP_VERSION_11         = 11;   ///< Beast encodes HTTP/1.1 as 11
inline constexpr const char* HTTP_SERVER_NAME        = "ignite";
/// Deadline for one outbound exchange (connect, write, read).
inline constexpr std::chrono::seconds HTTP_REQUEST_TIMEOUT{5};
/// Server side: a connection with no complete request for this long is closed.
inline constexpr std::chrono::seconds HTTP_IDLE_TIMEOUT{30};

// =====================
// Logging Defaults
// =====================
inline constexpr const char* LOG_LOGGER_NAME         = "ignite";
inline constexpr const char* LOG_DEFAULT_LEVEL       = "info";

} // namespace ignite::config::constants
