#pragma once
/**
 * @file http_app.hpp
 * @brief Built-in HTTP application runner (routes, health check, token middleware).
 *
 * Single-threaded: one io_context drives every connection asynchronously on the
 * thread that called run(). Idle keep-alive connections are closed after
 * HTTP_IDLE_TIMEOUT; stop() and SIGINT/SIGTERM end run() even while clients
 * stay connected. Configuration steps (health route, middleware,
 * router inclusion) are narrated with console Blocks.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "ignite/console/block_decorator.hpp"
#include "ignite/launch/app_runner.hpp"

namespace ignite::launch {

namespace bhttp = boost::beast::http;

using Request    = bhttp::request<bhttp::string_body>;
using Response   = bhttp::response<bhttp::string_body>;
using Handler    = std::function<Response(const Request&)>;
/// Runs on every response before it is written.
using Middleware = std::function<void(const Request&, Response&)>;
/// Produces the Authorization header value for the token middleware.
using TokenSource = std::function<std::string()>;

/// JSON response with the request's version and keep-alive.
Response json_response(const Request& req, bhttp::status status, const nlohmann::json& body);

/// Health check handler: 200 {"status":"ok"}.
Response health_ok(const Request& req);

/// Path component of a request target (query string removed).
std::string_view target_path(std::string_view target) noexcept;

/** @class Router
 *  @brief Route collection mounted into an HttpApp under a prefix.
 */
class Router {
public:
    struct Route {
        bhttp::verb method;
        std::string path;
        Handler     handler;
    };

    void add_route(bhttp::verb method, std::string path, Handler handler);
    const std::vector<Route>& routes() const noexcept { return routes_; }

private:
    std::vector<Route> routes_;
};

/** @class HttpApp
 *  @brief AppRunner serving registered routes over HTTP/1.1.
 */
class HttpApp final : public AppRunner {
public:
    HttpApp() = default;

    HttpApp(const HttpApp&)            = delete;
    HttpApp& operator=(const HttpApp&) = delete;

    /// Console destination/width for the configuration Blocks.
    void set_console(std::ostream* out, std::optional<int> width = std::nullopt) noexcept {
        out_ = out;
        width_ = width;
    }

    /// Register a route directly on the app (no console output).
    void add_route(bhttp::verb method, std::string path, Handler handler);

    /// Mount every route of @p router under @p prefix.
    void include_router(const Router& router, const std::string& prefix = "");

    /**
     * @brief Register the GET health route polled by the registry.
     * @param path Route path; LAUNCH_HEALTH_PATH when empty.
     * @param handler Response producer; health_ok when empty.
     */
    void add_health_route(const std::string& path = "", Handler handler = {});

    /// Set "Authorization: <token>" on every response whose path is not excluded.
    void add_token_middleware(TokenSource get_token, std::vector<std::string> excluded_paths = {});

    /// Dispatch one request in-process (404/405/500 handled here).
    Response handle(const Request& req) const;

    // AppRunner
    std::string name() const override { return "HTTP"; }
    int run(const std::string& host, std::uint16_t port) override;
    std::optional<std::string> health_path() const override { return health_path_; }
    void attach_tracer(std::shared_ptr<obs::Tracer> tracer) override { tracer_ = std::move(tracer); }

    /// Stop a running run() loop. Safe from any thread.
    void stop() noexcept;
    /// True while run() is accepting connections.
    bool is_listening() const noexcept { return listening_.load(std::memory_order_acquire); }
    std::size_t route_count() const noexcept { return routes_.size(); }

private:
    console::BlockDecorator step(std::string text) const;
    Response dispatch(const Request& req) const;
    void accept_next(boost::asio::ip::tcp::acceptor& acceptor);

    std::vector<Router::Route>   routes_;
    std::vector<Middleware>      middleware_;
    std::optional<std::string>   health_path_;
    std::shared_ptr<obs::Tracer> tracer_;
    std::ostream*                out_{nullptr};
    std::optional<int>           width_;
    boost::asio::io_context      ioc_;
    std::atomic<bool>            listening_{false};
};

} // namespace ignite::launch
