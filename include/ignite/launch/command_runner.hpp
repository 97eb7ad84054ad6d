#pragma once
/**
 * @file command_runner.hpp
 * @brief AppRunner that execs an external server program (gunicorn-style CLI).
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "ignite/config/constants.hpp"
#include "ignite/launch/app_runner.hpp"

namespace ignite::launch {

/** @struct CommandSpec
 *  @brief Program and arguments; host/port are supplied at run time.
 */
struct CommandSpec {
    std::string program{config::constants::LAUNCH_COMMAND_PROGRAM}; ///< Looked up on PATH
    std::string app_path;                                           ///< Application argument (e.g. "pkg.wsgi:app")
    int         workers{config::constants::LAUNCH_COMMAND_WORKERS}; ///< --workers value
};

/** @class CommandRunner
 *  @brief Runs `<program> --bind host:port --workers N <app_path>` and waits for it.
 */
class CommandRunner final : public AppRunner {
public:
    explicit CommandRunner(CommandSpec spec) : spec_(std::move(spec)) {}

    /// Full argv for @p host:@p port (argv[0] is the program).
    std::vector<std::string> command_line(const std::string& host, std::uint16_t port) const;

    std::string name() const override { return spec_.program; }

    /**
     * @return The child's exit status, 128 + signal when killed, or
     *         LAUNCH_EXEC_FAILED when the program could not be started.
     */
    int run(const std::string& host, std::uint16_t port) override;

    const CommandSpec& spec() const noexcept { return spec_; }

private:
    CommandSpec spec_;
};

} // namespace ignite::launch
