#pragma once
/**
 * @file listen_socket.hpp
 * @brief Port reservation: a bound (not listening) IPv4 TCP socket.
 *
 * The launcher binds early so the port is known (and printed, and registered)
 * before the application runner starts. close() hands the port over to the
 * runner, which binds it again itself.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ignite/compat/expected.hpp"  // ignite_detail::expected / unexpected

namespace ignite::net {

/// Result codes for socket acquisition.
enum class SocketError : std::uint8_t {
    CreateFailed = 1, ///< socket(2) failed
    AddressInUse,     ///< bind(2) reported EADDRINUSE
    BindFailed,       ///< bind(2) failed for another reason
    QueryFailed       ///< getsockname(2) failed
};

std::string_view to_string(SocketError e) noexcept;

/** @struct SocketFailure
 *  @brief Error code plus the errno text captured at the failing call.
 */
struct SocketFailure {
    SocketError code;
    std::string detail;
};

/** @class ListeningSocket
 *  @brief Move-only owner of a bound socket descriptor.
 */
class ListeningSocket {
public:
    /**
     * @brief Bind INADDR_ANY on @p port (ephemeral when empty or 0).
     * @return The bound socket, or the failing step.
     */
    static ignite_detail::expected<ListeningSocket, SocketFailure>
    bind(std::optional<std::uint16_t> port);

    ListeningSocket(const ListeningSocket&)            = delete;
    ListeningSocket& operator=(const ListeningSocket&) = delete;
    ListeningSocket(ListeningSocket&& other) noexcept;
    ListeningSocket& operator=(ListeningSocket&& other) noexcept;
    ~ListeningSocket();

    /// Port the socket is bound to (kept after close()).
    std::uint16_t port() const noexcept { return port_; }
    bool is_open() const noexcept { return fd_ >= 0; }

    /// Release the descriptor and return the bound port. Idempotent.
    std::uint16_t close() noexcept;

private:
    ListeningSocket(int fd, std::uint16_t port) noexcept : fd_(fd), port_(port) {}

    int           fd_{-1};
    std::uint16_t port_{0};
};

} // namespace ignite::net
