/**
 * @file command_runner.cpp
 * @brief fork/exec/waitpid implementation of CommandRunner.
 */
#include "ignite/launch/command_runner.hpp"
#include "ignite/obs/log.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace ignite::launch {

using namespace ignite::config::constants;

std::vector<std::string> CommandRunner::command_line(const std::string& host, std::uint16_t port) const {
    std::vector<std::string> argv{
        spec_.program,
        "--bind", host + ":" + std::to_string(port),
        "--workers", std::to_string(spec_.workers),
    };
    if (!spec_.app_path.empty()) argv.push_back(spec_.app_path);
    return argv;
}

int CommandRunner::run(const std::string& host, std::uint16_t port) {
    auto args = command_line(host, port);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    obs::logger()->info("exec {} --bind {}:{}", spec_.program, host, port);

    const pid_t pid = ::fork();
    if (pid < 0) {
        obs::logger()->error("fork failed: {}", std::strerror(errno));
        return LAUNCH_EXEC_FAILED;
    }
    if (pid == 0) {
        ::execvp(argv[0], argv.data());
        _exit(LAUNCH_EXEC_FAILED);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            obs::logger()->error("waitpid({}) failed: {}", pid, std::strerror(errno));
            return LAUNCH_EXEC_FAILED;
        }
    }

    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == LAUNCH_EXEC_FAILED) obs::logger()->error("{} could not be executed", spec_.program);
        return code;
    }
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return LAUNCH_EXEC_FAILED;
}

} // namespace ignite::launch
