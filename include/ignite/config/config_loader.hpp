#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overridden by a JSON file, then by the environment.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ignite/compat/expected.hpp"
#include "ignite/config/constants.hpp"

namespace ignite::config {

    /** @struct ConsoleConfig
     *  @brief Block rendering overrides.
     */
    struct ConsoleConfig {
        std::optional<int> width; ///< Fixed block width; terminal width when unset
    };

    /** @struct RegistryConfig
     *  @brief Consul agent registration settings.
     */
    struct RegistryConfig {
        bool        enabled{false};                             ///< Register on launch
        std::string address{constants::REGISTRY_REGISTER_ADDRESS}; ///< Registration endpoint
        std::string pass_address{constants::REGISTRY_PASS_ADDRESS}; ///< Check pass prefix
        std::string check_path;                                 ///< Empty: use the runner's health path
        std::string check_interval{constants::REGISTRY_CHECK_INTERVAL};
        std::string check_timeout{constants::REGISTRY_CHECK_TIMEOUT};
    };

    /** @struct TracingConfig
     *  @brief Tracing switch.
     */
    struct TracingConfig {
        bool enabled{false}; ///< Attach the log tracer
    };

    /// Which AppRunner the launcher starts.
    enum class RunnerKind : std::uint8_t {
        Http,    ///< Built-in HTTP application server
        Command  ///< External program (gunicorn-style command line)
    };

    /** @struct RunnerConfig
     *  @brief Application runner settings.
     */
    struct RunnerConfig {
        RunnerKind  kind{RunnerKind::Http};
        std::string program{constants::LAUNCH_COMMAND_PROGRAM}; ///< Command runner executable
        std::string app_path;                                   ///< Command runner application argument
        int         workers{constants::LAUNCH_COMMAND_WORKERS}; ///< Command runner worker count
        std::string health_path{constants::LAUNCH_HEALTH_PATH}; ///< Http runner health route
    };

    /** @struct LauncherConfig
     *  @brief Aggregate of sub-configs required by the launcher.
     */
    struct LauncherConfig {
        std::string                  service_name;                             ///< Required
        std::string                  host{constants::LAUNCH_DEFAULT_HOST};     ///< Advertised address
        std::optional<std::uint16_t> port;                                     ///< Ephemeral when unset
        std::string                  log_level{constants::LOG_DEFAULT_LEVEL};  ///< spdlog level name
        ConsoleConfig                console;
        RegistryConfig               registry;
        TracingConfig                tracing;
        RunnerConfig                 runner;
    };

    /// Config loading failures.
    enum class ConfigError : std::uint8_t {
        Unreadable = 1, ///< File missing or unreadable
        Malformed,      ///< Not JSON, or a field has the wrong type
        Invalid         ///< Parsed but semantically wrong (range, enum name)
    };

    std::string_view to_string(ConfigError e) noexcept;

    struct ConfigFailure {
        ConfigError code;
        std::string detail;
    };

    std::optional<RunnerKind> runner_kind_from_name(std::string_view name);

    /** @class Loader
     *  @brief Source of launcher configuration.
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from a JSON file, or return defaults.
         * @param path File path; empty means defaults only.
         */
        static ignite_detail::expected<LauncherConfig, ConfigFailure>
        load_from_file(const std::string& path);

        /// Parse a JSON document over the defaults.
        static ignite_detail::expected<LauncherConfig, ConfigFailure>
        load_from_string(std::string_view json);

        /**
         * @brief Apply IGNITE_SERVICE_NAME, IGNITE_HOST, IGNITE_PORT,
         *        IGNITE_LOG_LEVEL and IGNITE_CONSOLE_WIDTH when set.
         */
        static ignite_detail::expected<void, ConfigFailure> apply_env(LauncherConfig& cfg);
    };

} // namespace ignite::config
