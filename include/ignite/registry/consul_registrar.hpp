#pragma once
/**
 * @file consul_registrar.hpp
 * @brief Service registration with a Consul agent's HTTP API.
 *
 * One PUT of the service descriptor (with an HTTP health check) to the
 * registration endpoint, then one PUT to the check "pass" endpoint so the
 * service is healthy before the agent's first poll. No retries.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "ignite/compat/expected.hpp"
#include "ignite/config/constants.hpp"
#include "ignite/http/transport.hpp"

namespace ignite::registry {

/// Result codes for registration.
enum class RegistryError : std::uint8_t {
    MissingCheckPath = 1, ///< No health check path given and none known
    TransportFailed,      ///< Request never produced a response
    Rejected              ///< Agent answered with a non-200 status
};

std::string_view to_string(RegistryError e) noexcept;

struct RegistryFailure {
    RegistryError code;
    std::string   detail;   ///< Transport error text or the agent's response body
};

/** @struct Registration
 *  @brief What is being registered.
 */
struct Registration {
    std::string   service_name;                                              ///< Consul "Name"
    std::string   host;                                                      ///< Consul "Address"
    std::uint16_t port{0};                                                   ///< Consul "Port"
    std::string   check_path;                                                ///< Path polled by the agent
    std::string   check_interval{config::constants::REGISTRY_CHECK_INTERVAL}; ///< e.g. "30s"
    std::string   check_timeout{config::constants::REGISTRY_CHECK_TIMEOUT};   ///< e.g. "3s"
};

/// "<name>:<port>"
std::string service_id(const Registration& r);

/// "http://<host>:<port><check_path>"
std::string check_url(const Registration& r);

/// Registration body: Name, ID, Port, Address, Check{http, interval, timeout}.
nlohmann::json make_payload(const Registration& r);

/** @struct Endpoints
 *  @brief Agent URLs.
 */
struct Endpoints {
    std::string register_address{config::constants::REGISTRY_REGISTER_ADDRESS}; ///< PUT target for the descriptor
    std::string pass_address{config::constants::REGISTRY_PASS_ADDRESS};         ///< Prefix; service id is appended
};

/** @class ConsulRegistrar
 *  @brief Performs the registration and narrates it in a console Block.
 */
class ConsulRegistrar {
public:
    ConsulRegistrar(std::shared_ptr<http::Transport> transport, Endpoints endpoints = {});

    /// Console destination for the registration Block (std::cout when null).
    void set_console(std::ostream* out, std::optional<int> width = std::nullopt) noexcept {
        out_ = out;
        width_ = width;
    }

    /**
     * @brief Register @p r and mark its check as passing.
     * @return void on a 200 from the registration endpoint. A failed pass ping
     *         is logged and does not fail the registration.
     */
    ignite_detail::expected<void, RegistryFailure> register_service(const Registration& r) const;

    const Endpoints& endpoints() const noexcept { return endpoints_; }

private:
    std::shared_ptr<http::Transport> transport_;
    Endpoints                        endpoints_;
    std::ostream*                    out_{nullptr};
    std::optional<int>               width_;
};

} // namespace ignite::registry
