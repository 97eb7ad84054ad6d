#pragma once
/**
 * @file app_runner.hpp
 * @brief The one capability a launcher needs from an application: start it.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ignite/obs/tracing.hpp"

namespace ignite::launch {

/** @class AppRunner
 *  @brief Starts the application on a host/port and blocks until it exits.
 */
class AppRunner {
public:
    virtual ~AppRunner() = default;

    /// Short label used in console output, e.g. "HTTP" or "gunicorn".
    virtual std::string name() const = 0;

    /**
     * @brief Serve on @p host:@p port until the application stops.
     * @return Process-style exit status (0 on a clean stop).
     */
    virtual int run(const std::string& host, std::uint16_t port) = 0;

    /// Health route the registry should poll, when the runner owns one.
    virtual std::optional<std::string> health_path() const { return std::nullopt; }

    /// Tracer for request spans; runners without requests ignore it.
    virtual void attach_tracer(std::shared_ptr<obs::Tracer> tracer) { (void)tracer; }
};

} // namespace ignite::launch
