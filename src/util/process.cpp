#include "util/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

namespace vc::util {

ProcessResult runProcess(const std::vector<std::string>& argv, const std::optional<std::filesystem::path>& cwd) {
    if (argv.empty()) throw std::runtime_error("runProcess requires a program");

    int errPipe[2];
    if (pipe(errPipe) == -1) throw std::runtime_error("Failed to create pipe for child stderr");

    const pid_t pid = fork();
    if (pid < 0) {
        close(errPipe[0]);
        close(errPipe[1]);
        throw std::runtime_error(fmt::format("Failed to fork {}: {}", argv[0], std::strerror(errno)));
    }

    if (pid == 0) {
        // Child: stderr into the pipe, stdout to /dev/null
        dup2(errPipe[1], STDERR_FILENO);
        close(errPipe[0]);
        close(errPipe[1]);

        if (const int devnull = open("/dev/null", O_WRONLY); devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            close(devnull);
        }

        if (cwd && chdir(cwd->c_str()) != 0) _exit(126);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(errPipe[1]);

    ProcessResult result;
    char buf[4096];
    for (;;) {
        const ssize_t n = read(errPipe[0], buf, sizeof(buf));
        if (n > 0) { result.stderrText.append(buf, static_cast<size_t>(n)); continue; }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(errPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid failed for {}", argv[0]));
    }

    if (WIFEXITED(status)) result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exitCode = 128 + WTERMSIG(status);

    if (result.exitCode == 127 && result.stderrText.empty())
        result.stderrText = fmt::format("{}: command not found", argv[0]);
    if (result.exitCode == 126 && result.stderrText.empty() && cwd)
        result.stderrText = fmt::format("cannot change directory to {}", cwd->string());

    return result;
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

}
