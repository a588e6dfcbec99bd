#include "ferry/process_runner.hpp"

#include "ferry/command.hpp"
#include "ferry/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ferry {

Result ProcessRunner::Run(const std::vector<std::string>& argv) {
    if (argv.empty()) return Result::Fail(-1, "empty command");

    const std::string line = RenderShell(argv);
    LogDebug("exec: %s", line.c_str());

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    std::fflush(stdout);
    std::fflush(stderr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        return Result::Fail(err, "fork failed: " + std::string(std::strerror(err)) + ": " + line);
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            (void)::dup2(devnull, STDIN_FILENO);
            if (devnull > STDIN_FILENO) ::close(devnull);
        }
        ::execvp(cargv[0], cargv.data());
        std::fprintf(stderr, "exec %s failed: %s\n", cargv[0], std::strerror(errno));
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        const int err = errno;
        return Result::Fail(err, "waitpid failed: " + std::string(std::strerror(err)) + ": " + line);
    }

    int code = -1;
    if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        code = 128 + WTERMSIG(status);
    }

    if (code == 0) return Result::Ok();
    return Result::Fail(code, line);
}

} // namespace ferry
