/**
* @file config_loader.cpp
 * @brief JSON (nlohmann::json) and environment backed loader over named defaults.
 */
#include "ignite/config/config_loader.hpp"
#include "ignite/obs/log.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace ignite::config {

    namespace {

    using json = nlohmann::json;

    ignite_detail::unexpected<ConfigFailure> fail(ConfigError code, std::string detail) {
        return ignite_detail::unexpected(ConfigFailure{code, std::move(detail)});
    }

    template <class T>
    void read_opt(const json& j, const char* key, T& out) {
        if (auto it = j.find(key); it != j.end() && !it->is_null()) out = it->get<T>();
    }

    std::optional<long> parse_long(std::string_view s) {
        long v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
        return v;
    }

    ignite_detail::expected<std::uint16_t, ConfigFailure> checked_port(long v) {
        if (v < 0 || v > std::numeric_limits<std::uint16_t>::max())
            return fail(ConfigError::Invalid, "port out of range: " + std::to_string(v));
        return static_cast<std::uint16_t>(v);
    }

    // Applies every known key of @p j onto @p cfg. Throws json::exception on type mismatch.
    ignite_detail::expected<void, ConfigFailure> apply_json(const json& j, LauncherConfig& cfg) {
        if (!j.is_object()) return fail(ConfigError::Malformed, "top level must be an object");

        read_opt(j, "service_name", cfg.service_name);
        read_opt(j, "host", cfg.host);
        read_opt(j, "log_level", cfg.log_level);
        if (auto it = j.find("port"); it != j.end() && !it->is_null()) {
            auto port = checked_port(it->get<long>());
            if (!port) return ignite_detail::unexpected(port.error());
            cfg.port = *port;
        }

        if (auto c = j.find("console"); c != j.end() && c->is_object()) {
            if (auto w = c->find("width"); w != c->end() && !w->is_null()) cfg.console.width = w->get<int>();
        }

        if (auto r = j.find("registry"); r != j.end() && r->is_object()) {
            read_opt(*r, "enabled", cfg.registry.enabled);
            read_opt(*r, "address", cfg.registry.address);
            read_opt(*r, "pass_address", cfg.registry.pass_address);
            read_opt(*r, "check_path", cfg.registry.check_path);
            read_opt(*r, "check_interval", cfg.registry.check_interval);
            read_opt(*r, "check_timeout", cfg.registry.check_timeout);
        }

        if (auto t = j.find("tracing"); t != j.end() && t->is_object()) {
            read_opt(*t, "enabled", cfg.tracing.enabled);
        }

        if (auto rn = j.find("runner"); rn != j.end() && rn->is_object()) {
            if (auto k = rn->find("kind"); k != rn->end() && !k->is_null()) {
                const auto name = k->get<std::string>();
                auto kind = runner_kind_from_name(name);
                if (!kind) return fail(ConfigError::Invalid, "unknown runner kind: " + name);
                cfg.runner.kind = *kind;
            }
            read_opt(*rn, "program", cfg.runner.program);
            read_opt(*rn, "app_path", cfg.runner.app_path);
            read_opt(*rn, "workers", cfg.runner.workers);
            read_opt(*rn, "health_path", cfg.runner.health_path);
            if (cfg.runner.workers < 1)
                return fail(ConfigError::Invalid, "runner.workers must be positive");
        }
        return {};
    }

    } // namespace

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::Unreadable: return "config unreadable";
            case ConfigError::Malformed:  return "config malformed";
            case ConfigError::Invalid:    return "config invalid";
        }
        return "unknown config error";
    }

    std::optional<RunnerKind> runner_kind_from_name(std::string_view name) {
        if (name == "http")    return RunnerKind::Http;
        if (name == "command") return RunnerKind::Command;
        return std::nullopt;
    }

    ignite_detail::expected<LauncherConfig, ConfigFailure>
    Loader::load_from_string(std::string_view text) {
        LauncherConfig cfg;
        const json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) return fail(ConfigError::Malformed, "not valid JSON");
        try {
            auto applied = apply_json(j, cfg);
            if (!applied) return ignite_detail::unexpected(applied.error());
        } catch (const json::exception& e) {
            return fail(ConfigError::Malformed, e.what());
        }
        return cfg;
    }

    ignite_detail::expected<LauncherConfig, ConfigFailure>
    Loader::load_from_file(const std::string& path) {
        if (path.empty()) return LauncherConfig{};

        std::ifstream in(path);
        if (!in) {
            obs::logger()->error("cannot open config {}", path);
            return fail(ConfigError::Unreadable, path);
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        auto cfg = load_from_string(ss.str());
        if (!cfg) obs::logger()->error("{} ({}): {}", to_string(cfg.error().code), path, cfg.error().detail);
        return cfg;
    }

    ignite_detail::expected<void, ConfigFailure> Loader::apply_env(LauncherConfig& cfg) {
        auto env = [](const char* name) -> std::optional<std::string_view> {
            const char* v = std::getenv(name);
            if (!v || !*v) return std::nullopt;
            return std::string_view(v);
        };

        if (auto v = env("IGNITE_SERVICE_NAME")) cfg.service_name.assign(*v);
        if (auto v = env("IGNITE_HOST"))         cfg.host.assign(*v);
        if (auto v = env("IGNITE_LOG_LEVEL"))    cfg.log_level.assign(*v);
        if (auto v = env("IGNITE_PORT")) {
            auto n = parse_long(*v);
            if (!n) return fail(ConfigError::Invalid, "IGNITE_PORT is not a number");
            auto port = checked_port(*n);
            if (!port) return ignite_detail::unexpected(port.error());
            cfg.port = *port;
        }
        if (auto v = env("IGNITE_CONSOLE_WIDTH")) {
            auto n = parse_long(*v);
            if (!n || *n <= 0 || *n > std::numeric_limits<int>::max())
                return fail(ConfigError::Invalid, "IGNITE_CONSOLE_WIDTH must be a positive number");
            cfg.console.width = static_cast<int>(*n);
        }
        return {};
    }

} // namespace ignite::config
