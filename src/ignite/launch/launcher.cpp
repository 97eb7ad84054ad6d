/**
 * @file launcher.cpp
 * @brief Launcher steps and runner selection.
 */
#include "ignite/launch/launcher.hpp"
#include "ignite/console/block_decorator.hpp"
#include "ignite/launch/command_runner.hpp"
#include "ignite/launch/http_app.hpp"
#include "ignite/obs/log.hpp"

#include <utility>

namespace ignite::launch {

std::string_view to_string(LaunchError e) noexcept {
    switch (e) {
        case LaunchError::MissingServiceName: return "service name is required";
        case LaunchError::MissingRunner:      return "no application runner";
        case LaunchError::SocketFailed:       return "port reservation failed";
    }
    return "unknown launch error";
}

std::unique_ptr<AppRunner> make_runner(const config::RunnerConfig& cfg,
                                       std::ostream* out,
                                       std::optional<int> width) {
    switch (cfg.kind) {
        case config::RunnerKind::Http: {
            auto app = std::make_unique<HttpApp>();
            app->set_console(out, width);
            app->add_health_route(cfg.health_path);
            return app;
        }
        case config::RunnerKind::Command:
            return std::make_unique<CommandRunner>(
                CommandSpec{.program = cfg.program, .app_path = cfg.app_path, .workers = cfg.workers});
    }
    return nullptr;
}

Launcher::Launcher(config::LauncherConfig cfg, net::ListeningSocket socket,
                   std::unique_ptr<AppRunner> runner, std::ostream* out) noexcept
    : cfg_(std::move(cfg)),
      socket_(std::move(socket)),
      port_(socket_.port()),
      runner_(std::move(runner)),
      out_(out) {}

ignite_detail::expected<Launcher, LaunchFailure>
Launcher::prepare(config::LauncherConfig cfg, std::unique_ptr<AppRunner> runner, std::ostream* out) {
    if (cfg.service_name.empty())
        return ignite_detail::unexpected(LaunchFailure{LaunchError::MissingServiceName, {}});
    if (!runner)
        return ignite_detail::unexpected(LaunchFailure{LaunchError::MissingRunner, {}});

    auto socket = net::ListeningSocket::bind(cfg.port);
    if (!socket) {
        const auto& err = socket.error();
        obs::logger()->error("cannot reserve port {}: {} ({})",
                             cfg.port.value_or(0), net::to_string(err.code), err.detail);
        return ignite_detail::unexpected(LaunchFailure{
            LaunchError::SocketFailed, std::string(net::to_string(err.code)) + ": " + err.detail});
    }

    Launcher launcher(std::move(cfg), std::move(*socket), std::move(runner), out);
    const auto& c = launcher.cfg_;
    console::Block<> header(console::BlockSpec{
        .lines = {
            "App Launcher: Start setting up",
            c.host + ":" + std::to_string(launcher.port_) + "/" + c.service_name,
        },
        .variant = console::Variant::Header,
        .width = c.console.width,
        .out = out,
    });
    header.render();
    obs::logger()->info("{} reserved port {}", c.service_name, launcher.port_);
    return launcher;
}

void Launcher::enable_tracing(std::shared_ptr<obs::Tracer> tracer) {
    console::BlockDecorator(console::BlockSpec{
        .lines = {"Connecting to tracing"},
        .width = cfg_.console.width,
        .out = out_,
    })([this](std::shared_ptr<obs::Tracer> t) {
        tracer_ = std::move(t);
        runner_->attach_tracer(tracer_);
    })(std::move(tracer));
}

registry::Registration Launcher::registration() const {
    registry::Registration r;
    r.service_name = cfg_.service_name;
    r.host = cfg_.host;
    r.port = port_;
    r.check_path = cfg_.registry.check_path;
    if (r.check_path.empty()) r.check_path = runner_->health_path().value_or(std::string{});
    r.check_interval = cfg_.registry.check_interval;
    r.check_timeout = cfg_.registry.check_timeout;
    return r;
}

ignite_detail::expected<void, registry::RegistryFailure>
Launcher::register_in_consul(std::shared_ptr<http::Transport> transport) {
    const auto reg = registration();
    obs::ScopedSpan span(tracer_.get(), "registry.register");
    span.set_attribute("service.id", registry::service_id(reg));

    registry::ConsulRegistrar registrar(std::move(transport),
        registry::Endpoints{.register_address = cfg_.registry.address,
                            .pass_address = cfg_.registry.pass_address});
    registrar.set_console(out_, cfg_.console.width);

    auto result = registrar.register_service(reg);
    if (!result) span.fail(std::string(registry::to_string(result.error().code)));
    return result;
}

int Launcher::run() {
    const std::uint16_t port = socket_.close();

    obs::ScopedSpan span(tracer_.get(), "launcher.run");
    span.set_attribute("runner", runner_->name());

    const int status = console::BlockDecorator(console::BlockSpec{
        .lines = {"App Launcher: The setup is completed successfully", runner_->name() + " run"},
        .variant = console::Variant::Footer,
        .width = cfg_.console.width,
        .out = out_,
    })([this](const std::string& host, std::uint16_t p) {
        return runner_->run(host, p);
    })(cfg_.host, port);

    span.set_attribute("exit_status", std::to_string(status));
    if (status != 0) {
        span.fail(runner_->name() + " exited with " + std::to_string(status));
        obs::logger()->warn("{} exited with status {}", runner_->name(), status);
    }
    return status;
}

} // namespace ignite::launch
