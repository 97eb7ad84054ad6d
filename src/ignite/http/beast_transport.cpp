/**
 * @file beast_transport.cpp
 * @brief URL parsing and the Boost.Beast backed Transport.
 */
#include "ignite/http/transport.hpp"
#include "ignite/config/constants.hpp"
#include "ignite/obs/log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;   // from <boost/beast.hpp>
namespace bhttp = beast::http;    // from <boost/beast/http.hpp>
namespace asio  = boost::asio;    // from <boost/asio.hpp>
using tcp = boost::asio::ip::tcp; // from <boost/asio/ip/tcp.hpp>

namespace ignite::http {

using namespace ignite::config::constants;

std::string_view to_string(TransportError e) noexcept {
    switch (e) {
        case TransportError::BadUrl:      return "malformed url";
        case TransportError::Unsupported: return "unsupported scheme";
        case TransportError::Network:     return "network error";
    }
    return "unknown transport error";
}

ignite_detail::expected<Url, TransportFailure> parse_url(std::string_view url) {
    auto bad = [&](TransportError code) {
        return ignite_detail::unexpected(TransportFailure{code, std::string(url)});
    };

    const auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) return bad(TransportError::BadUrl);

    Url out;
    out.scheme.assign(url.substr(0, sep));
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.scheme != "http") return bad(TransportError::Unsupported);

    std::string_view rest = url.substr(sep + 3);
    const auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) out.target.assign(rest.substr(slash));

    if (authority.empty()) return bad(TransportError::BadUrl);

    out.port = HTTP_DEFAULT_PORT;
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        std::string_view port_text = authority.substr(colon + 1);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || value == 0 || value > 65535)
            return bad(TransportError::BadUrl);
        out.port = static_cast<std::uint16_t>(value);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) return bad(TransportError::BadUrl);
    out.host.assign(authority);
    return out;
}

class BeastTransport final : public Transport {
public:
    explicit BeastTransport(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    ignite_detail::expected<Response, TransportFailure>
    put(const std::string& url, const std::string& json_body) override {
        auto parsed = parse_url(url);
        if (!parsed) return ignite_detail::unexpected(parsed.error());

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        beast::error_code ec;
        std::string_view step = "resolve";

        bhttp::request<bhttp::string_body> req{bhttp::verb::put, parsed->target, HTTP_VERSION_11};
        req.set(bhttp::field::host, parsed->host);
        req.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(bhttp::field::content_type, "application/json");
        req.body() = json_body;
        req.prepare_payload();

        beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> res;

        // One deadline covers connect, write and read; expiry surfaces as beast::error::timeout.
        resolver.async_resolve(parsed->host, std::to_string(parsed->port),
            [&](beast::error_code e, tcp::resolver::results_type results) {
                if (e) { ec = e; return; }
                step = "connect";
                stream.expires_after(timeout_);
                stream.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) {
                    if (e) { ec = e; return; }
                    step = "write";
                    bhttp::async_write(stream, req, [&](beast::error_code e, std::size_t) {
                        if (e) { ec = e; return; }
                        step = "read";
                        bhttp::async_read(stream, buffer, res,
                                          [&](beast::error_code e, std::size_t) { ec = e; });
                    });
                });
            });
        ioc.run();

        if (ec) {
            std::string detail = std::string(step) + " " + parsed->host + ":" +
                                 std::to_string(parsed->port) + ": " + ec.message();
            obs::logger()->warn("PUT {} failed: {}", url, detail);
            return ignite_detail::unexpected(TransportFailure{TransportError::Network, std::move(detail)});
        }

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        // not_connected happens sometimes; nothing to do about it.

        obs::logger()->debug("PUT {} -> {}", url, res.result_int());
        return Response{static_cast<int>(res.result_int()), std::move(res.body())};
    }

private:
    std::chrono::milliseconds timeout_;
};

std::shared_ptr<Transport> make_beast_transport(std::chrono::milliseconds timeout) {
    return std::make_shared<BeastTransport>(timeout);
}

} // namespace ignite::http
