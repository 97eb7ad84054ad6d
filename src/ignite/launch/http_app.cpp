/**
 * @file http_app.cpp
 * @brief Route dispatch and the Boost.Beast serving loop.
 */
#include "ignite/launch/http_app.hpp"
#include "ignite/config/constants.hpp"
#include "ignite/obs/log.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>

#include <boost/asio/signal_set.hpp>
#include <boost/beast/core.hpp>

namespace beast = boost::beast;   // from <boost/beast.hpp>
namespace asio  = boost::asio;    // from <boost/asio.hpp>
using tcp = boost::asio::ip::tcp; // from <boost/asio/ip/tcp.hpp>

namespace ignite::launch {

using namespace ignite::config::constants;

namespace {

std::string_view view(beast::string_view s) noexcept { return {s.data(), s.size()}; }

/// One keep-alive connection; owns itself through the pending handler.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, const HttpApp& app) : stream_(std::move(socket)), app_(app) {}

    void start() { read_next(); }

private:
    void read_next() {
        req_ = Request{};
        stream_.expires_after(HTTP_IDLE_TIMEOUT);
        bhttp::async_read(stream_, buffer_, req_,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec == bhttp::error::end_of_stream) return close();
        if (ec) {
            obs::logger()->debug("read failed: {}", ec.message());
            return close();
        }
        res_ = app_.handle(req_);
        bhttp::async_write(stream_, res_,
                           [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_write(ec); });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            obs::logger()->debug("write failed: {}", ec.message());
            return close();
        }
        if (res_.need_eof()) return close();
        read_next();
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream  stream_;
    beast::flat_buffer buffer_;
    Request            req_;
    Response           res_;
    const HttpApp&     app_;
};

} // namespace

std::string_view target_path(std::string_view target) noexcept {
    return target.substr(0, target.find('?'));
}

Response json_response(const Request& req, bhttp::status status, const nlohmann::json& body) {
    Response res{status, req.version()};
    res.set(bhttp::field::server, HTTP_SERVER_NAME);
    res.set(bhttp::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

Response health_ok(const Request& req) {
    return json_response(req, bhttp::status::ok, {{"status", "ok"}});
}

void Router::add_route(bhttp::verb method, std::string path, Handler handler) {
    routes_.push_back(Route{method, std::move(path), std::move(handler)});
}

console::BlockDecorator HttpApp::step(std::string text) const {
    return console::BlockDecorator(
        console::BlockSpec{.lines = {std::move(text)}, .width = width_, .out = out_});
}

void HttpApp::add_route(bhttp::verb method, std::string path, Handler handler) {
    routes_.push_back(Router::Route{method, std::move(path), std::move(handler)});
}

void HttpApp::include_router(const Router& router, const std::string& prefix) {
    step("Include router in app")([this](const Router& r, const std::string& p) {
        for (const auto& route : r.routes())
            routes_.push_back(Router::Route{route.method, p + route.path, route.handler});
    })(router, prefix);
}

void HttpApp::add_health_route(const std::string& path, Handler handler) {
    step("Added a synchronous health check route for Consul")([this](const std::string& p, Handler h) {
        health_path_ = p.empty() ? std::string(LAUNCH_HEALTH_PATH) : p;
        routes_.push_back(Router::Route{bhttp::verb::get, *health_path_, h ? std::move(h) : Handler(health_ok)});
    })(path, std::move(handler));
}

void HttpApp::add_token_middleware(TokenSource get_token, std::vector<std::string> excluded_paths) {
    step("add token middleware")([this](TokenSource src, std::vector<std::string> excluded) {
        middleware_.push_back(
            [src = std::move(src), excluded = std::move(excluded)](const Request& req, Response& res) {
                const auto path = target_path(view(req.target()));
                if (std::find(excluded.begin(), excluded.end(), path) != excluded.end()) return;
                res.set(bhttp::field::authorization, src());
            });
    })(std::move(get_token), std::move(excluded_paths));
}

Response HttpApp::dispatch(const Request& req) const {
    const auto path = target_path(view(req.target()));
    bool path_known = false;
    for (const auto& route : routes_) {
        if (route.path != path) continue;
        path_known = true;
        if (route.method != req.method()) continue;
        try {
            return route.handler(req);
        } catch (const std::exception& e) {
            obs::logger()->error("handler for {} {} threw: {}", view(req.method_string()), path, e.what());
            return json_response(req, bhttp::status::internal_server_error,
                                 {{"detail", "Internal Server Error"}});
        }
    }
    if (path_known)
        return json_response(req, bhttp::status::method_not_allowed, {{"detail", "Method Not Allowed"}});
    return json_response(req, bhttp::status::not_found, {{"detail", "Not Found"}});
}

Response HttpApp::handle(const Request& req) const {
    const std::string method(view(req.method_string()));
    const std::string target(view(req.target()));

    obs::ScopedSpan span(tracer_.get(), method + " " + std::string(target_path(target)));
    span.set_attribute("http.method", method);
    span.set_attribute("http.url", target);

    Response res = dispatch(req);
    for (const auto& mw : middleware_) mw(req, res);
    res.prepare_payload();

    span.set_attribute("http.status_code", std::to_string(res.result_int()));
    if (res.result_int() >= 400) span.fail(std::string(view(res.reason())));
    obs::logger()->debug("{} {} -> {}", method, target, res.result_int());
    return res;
}

void HttpApp::accept_next(tcp::acceptor& acceptor) {
    acceptor.async_accept([this, &acceptor](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) obs::logger()->warn("accept failed: {}", ec.message());
            return;
        }
        std::make_shared<Session>(std::move(socket), *this)->start();
        accept_next(acceptor);
    });
}

int HttpApp::run(const std::string& host, std::uint16_t port) {
    ioc_.restart();
    beast::error_code ec;

    tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec || results.empty()) {
        obs::logger()->error("cannot resolve {}: {}", host, ec.message());
        return EXIT_FAILURE;
    }
    const tcp::endpoint endpoint = results.begin()->endpoint();

    tcp::acceptor acceptor(ioc_);
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor.bind(endpoint, ec);
    if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        obs::logger()->error("cannot listen on {}:{}: {}", host, port, ec.message());
        return EXIT_FAILURE;
    }

    asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const beast::error_code& e, int sig) {
        if (e) return;
        obs::logger()->info("signal {} received, stopping", sig);
        ioc_.stop();
    });

    accept_next(acceptor);
    listening_.store(true, std::memory_order_release);
    obs::logger()->info("serving {} routes on {}:{}", routes_.size(), host, port);

    ioc_.run();

    listening_.store(false, std::memory_order_release);
    obs::logger()->info("HTTP app on {}:{} stopped", host, port);
    return EXIT_SUCCESS;
}

void HttpApp::stop() noexcept {
    ioc_.stop();
}

} // namespace ignite::launch
