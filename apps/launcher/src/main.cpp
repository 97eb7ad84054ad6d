/**
 * @file main.cpp
 * @brief ignite_launcher: reserve a port, optionally trace and register, then run the app.
 *
 * Usage:
 *   ./ignite_launcher [config.json]
 *
 * Configuration comes from the JSON file (when given) and the IGNITE_*
 * environment variables, in that order. Setup steps are narrated on stdout as
 * console Blocks; diagnostics go to stderr through the "ignite" logger.
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include "ignite/config/config_loader.hpp"
#include "ignite/http/transport.hpp"
#include "ignite/launch/launcher.hpp"
#include "ignite/obs/log.hpp"
#include "ignite/obs/tracing.hpp"
#include "ignite/version.hpp"

using namespace ignite;

int main(int argc, char** argv) {
    const std::string path = (argc > 1) ? argv[1] : std::string{};

    auto cfg = config::Loader::load_from_file(path);
    if (!cfg) {
        std::cerr << "ignite_launcher: " << config::to_string(cfg.error().code)
                  << ": " << cfg.error().detail << std::endl;
        return EXIT_FAILURE;
    }
    if (auto env = config::Loader::apply_env(*cfg); !env) {
        std::cerr << "ignite_launcher: " << config::to_string(env.error().code)
                  << ": " << env.error().detail << std::endl;
        return EXIT_FAILURE;
    }
    if (!obs::set_level(cfg->log_level))
        obs::logger()->warn("unknown log level '{}', keeping {}", cfg->log_level, config::constants::LOG_DEFAULT_LEVEL);

    obs::logger()->info("ignite_launcher {} starting {}", version_string, cfg->service_name);

    auto runner = launch::make_runner(cfg->runner, nullptr, cfg->console.width);
    auto launcher = launch::Launcher::prepare(*cfg, std::move(runner));
    if (!launcher) {
        obs::logger()->error("{}: {}", launch::to_string(launcher.error().code), launcher.error().detail);
        return EXIT_FAILURE;
    }

    if (cfg->tracing.enabled) launcher->enable_tracing(obs::make_log_tracer(cfg->service_name));

    if (cfg->registry.enabled) {
        auto registered = launcher->register_in_consul(http::make_beast_transport());
        if (!registered) {
            obs::logger()->error("{}: {}", registry::to_string(registered.error().code), registered.error().detail);
            return EXIT_FAILURE;
        }
    }

    return launcher->run();
}
