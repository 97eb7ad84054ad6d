#pragma once
/**
 * @file transport.hpp
 * @brief Outbound HTTP used by the registry client.
 * @details Plain HTTP/1.1 only, one request per connection, no retries.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "ignite/compat/expected.hpp"
#include "ignite/config/constants.hpp"

namespace ignite::http {

/// Failure classes of an outbound request.
enum class TransportError : std::uint8_t {
    BadUrl = 1,   ///< URL could not be parsed
    Unsupported,  ///< Scheme other than http
    Network       ///< Resolve/connect/write/read failed
};

std::string_view to_string(TransportError e) noexcept;

struct TransportFailure {
    TransportError code;
    std::string    detail;
};

/** @struct Url
 *  @brief Split form of an http URL.
 */
struct Url {
    std::string   scheme;           ///< Lower-cased scheme
    std::string   host;             ///< Host name or literal
    std::uint16_t port{0};          ///< Explicit port or the scheme default
    std::string   target{"/"};      ///< Path plus query

    bool operator==(const Url&) const = default;
};

/// Parse "scheme://host[:port][/target]".
ignite_detail::expected<Url, TransportFailure> parse_url(std::string_view url);

/** @struct Response
 *  @brief Status and body of a completed request.
 */
struct Response {
    int         status{0};
    std::string body;
};

/** @class Transport
 *  @brief Outbound request interface (injected so tests can record calls).
 */
class Transport {
public:
    virtual ~Transport() = default;

    /// PUT @p json_body (may be empty) to @p url with a JSON content type.
    virtual ignite_detail::expected<Response, TransportFailure>
    put(const std::string& url, const std::string& json_body) = 0;
};

/**
 * @brief Blocking Boost.Beast client.
 * @param timeout Deadline for connect + write + read of one put(); expiry is
 *        reported as TransportError::Network.
 */
std::shared_ptr<Transport> make_beast_transport(
    std::chrono::milliseconds timeout = config::constants::HTTP_REQUEST_TIMEOUT);

} // namespace ignite::http
