/**
 * @file consul_registrar.cpp
 * @brief Registration payload and the two-step agent exchange.
 */
#include "ignite/registry/consul_registrar.hpp"
#include "ignite/console/block.hpp"
#include "ignite/obs/log.hpp"

#include <utility>

namespace ignite::registry {

using namespace ignite::config::constants;

std::string_view to_string(RegistryError e) noexcept {
    switch (e) {
        case RegistryError::MissingCheckPath: return "missing health check path";
        case RegistryError::TransportFailed:  return "registry unreachable";
        case RegistryError::Rejected:         return "registration rejected";
    }
    return "unknown registry error";
}

std::string service_id(const Registration& r) {
    return r.service_name + ":" + std::to_string(r.port);
}

std::string check_url(const Registration& r) {
    return "http://" + r.host + ":" + std::to_string(r.port) + r.check_path;
}

nlohmann::json make_payload(const Registration& r) {
    return nlohmann::json{
        {"Name",    r.service_name},
        {"ID",      service_id(r)},
        {"Port",    r.port},
        {"Address", r.host},
        {"Check",   {
            {"http",     check_url(r)},
            {"interval", r.check_interval},
            {"timeout",  r.check_timeout}
        }}
    };
}

ConsulRegistrar::ConsulRegistrar(std::shared_ptr<http::Transport> transport, Endpoints endpoints)
    : transport_(std::move(transport)), endpoints_(std::move(endpoints)) {}

ignite_detail::expected<void, RegistryFailure>
ConsulRegistrar::register_service(const Registration& r) const {
    if (r.check_path.empty()) {
        obs::logger()->error("registration of {} needs a health check path", r.service_name);
        return ignite_detail::unexpected(RegistryFailure{
            RegistryError::MissingCheckPath,
            "define a health route before registering or pass the check path explicitly"});
    }

    const std::string id = service_id(r);
    const std::string body = make_payload(r).dump();

    auto block = console::make_block(
        console::BlockSpec{
            .lines = {
                "Registration in Consul",
                endpoints_.register_address,
                "service_id=" + id + ", port=" + std::to_string(r.port) + ", host=" + r.host,
                "check_interval=" + r.check_interval + ", check_timeout=" + r.check_timeout,
                "check path: " + check_url(r),
            },
            .width = width_,
            .out = out_,
        },
        [&] { return transport_->put(endpoints_.register_address, body); });

    auto response = block.render();
    if (!response) {
        return ignite_detail::unexpected(RegistryFailure{
            RegistryError::TransportFailed,
            std::string(http::to_string(response.error().code)) + ": " + response.error().detail});
    }
    if (response->status != REGISTRY_HTTP_OK) {
        obs::logger()->error("registry rejected {} with status {}: {}", id, response->status, response->body);
        return ignite_detail::unexpected(RegistryFailure{RegistryError::Rejected, response->body});
    }

    auto pass = transport_->put(endpoints_.pass_address + id, std::string{});
    if (!pass) {
        obs::logger()->warn("check pass for {} not delivered: {}", id, pass.error().detail);
    } else if (pass->status != REGISTRY_HTTP_OK) {
        obs::logger()->warn("check pass for {} answered {}", id, pass->status);
    }

    obs::logger()->info("registered {} at {}", id, endpoints_.register_address);
    return {};
}

} // namespace ignite::registry
