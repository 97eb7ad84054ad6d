#pragma once
/**
 * @file launcher.hpp
 * @brief Composition root: port reservation, registry, tracing, application start.
 *
 * Typical flow (each step narrated by a console Block):
 * @code
 *   auto launcher = Launcher::prepare(cfg, make_runner(cfg.runner));   // Header block
 *   launcher->enable_tracing(obs::make_log_tracer(cfg.service_name)); // Body block
 *   launcher->register_in_consul(http::make_beast_transport());       // Body block
 *   return launcher->run();                                           // Footer block, blocks
 * @endcode
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "ignite/compat/expected.hpp"
#include "ignite/config/config_loader.hpp"
#include "ignite/http/transport.hpp"
#include "ignite/launch/app_runner.hpp"
#include "ignite/net/listen_socket.hpp"
#include "ignite/obs/tracing.hpp"
#include "ignite/registry/consul_registrar.hpp"

namespace ignite::launch {

/// Reasons prepare() can refuse to build a Launcher.
enum class LaunchError : std::uint8_t {
    MissingServiceName = 1, ///< cfg.service_name is empty
    MissingRunner,          ///< No AppRunner supplied
    SocketFailed            ///< Port reservation failed
};

std::string_view to_string(LaunchError e) noexcept;

struct LaunchFailure {
    LaunchError code;
    std::string detail;
};

/// Runner selected by @p cfg: an HttpApp with its health route, or a CommandRunner.
std::unique_ptr<AppRunner> make_runner(const config::RunnerConfig& cfg,
                                       std::ostream* out = nullptr,
                                       std::optional<int> width = std::nullopt);

/** @class Launcher
 *  @brief Owns the reserved port and the runner for one service process.
 */
class Launcher {
public:
    /**
     * @brief Reserve the port and print the setup header.
     * @param cfg Launcher configuration (service name required).
     * @param runner Application runner started by run().
     * @param out Console destination (std::cout when null).
     */
    static ignite_detail::expected<Launcher, LaunchFailure>
    prepare(config::LauncherConfig cfg, std::unique_ptr<AppRunner> runner, std::ostream* out = nullptr);

    Launcher(Launcher&&) noexcept            = default;
    Launcher& operator=(Launcher&&) noexcept = default;

    /// Attach @p tracer to the launcher and the runner.
    void enable_tracing(std::shared_ptr<obs::Tracer> tracer);

    /**
     * @brief Register with the Consul agent using cfg.registry.
     * @details The check path falls back to the runner's health path.
     */
    ignite_detail::expected<void, registry::RegistryFailure>
    register_in_consul(std::shared_ptr<http::Transport> transport);

    /// Release the port and run the application; returns its exit status.
    int run();

    std::uint16_t                 port() const noexcept { return port_; }
    const config::LauncherConfig& config() const noexcept { return cfg_; }
    AppRunner&                    runner() noexcept { return *runner_; }
    obs::Tracer*                  tracer() const noexcept { return tracer_.get(); }

    /// Registration descriptor derived from config and the reserved port.
    registry::Registration registration() const;

private:
    Launcher(config::LauncherConfig cfg, net::ListeningSocket socket,
             std::unique_ptr<AppRunner> runner, std::ostream* out) noexcept;

    config::LauncherConfig       cfg_;
    net::ListeningSocket         socket_;
    std::uint16_t                port_{0};
    std::unique_ptr<AppRunner>   runner_;
    std::shared_ptr<obs::Tracer> tracer_;
    std::ostream*                out_{nullptr};
};

} // namespace ignite::launch
