/**
 * @file listen_socket.cpp
 * @brief POSIX implementation of ListeningSocket.
 */
#include "ignite/net/listen_socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace ignite::net {

std::string_view to_string(SocketError e) noexcept {
    switch (e) {
        case SocketError::CreateFailed: return "socket creation failed";
        case SocketError::AddressInUse: return "address already in use";
        case SocketError::BindFailed:   return "bind failed";
        case SocketError::QueryFailed:  return "getsockname failed";
    }
    return "unknown socket error";
}

ignite_detail::expected<ListeningSocket, SocketFailure>
ListeningSocket::bind(std::optional<std::uint16_t> port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return ignite_detail::unexpected(SocketFailure{SocketError::CreateFailed, std::strerror(errno)});
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port.value_or(0));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        ::close(fd);
        const SocketError code = (err == EADDRINUSE) ? SocketError::AddressInUse : SocketError::BindFailed;
        return ignite_detail::unexpected(SocketFailure{code, std::strerror(err)});
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) < 0) {
        const int err = errno;
        ::close(fd);
        return ignite_detail::unexpected(SocketFailure{SocketError::QueryFailed, std::strerror(err)});
    }

    return ListeningSocket(fd, ntohs(bound.sin_port));
}

ListeningSocket::ListeningSocket(ListeningSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), port_(other.port_) {}

ListeningSocket& ListeningSocket::operator=(ListeningSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        port_ = other.port_;
    }
    return *this;
}

ListeningSocket::~ListeningSocket() { close(); }

std::uint16_t ListeningSocket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    return port_;
}

} // namespace ignite::net
