#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command line");

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout into the pipe
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    // Parent: drain stdout until the child closes it
    ::close(pipefd[1]);
    ProcessResult result;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(pipefd[0]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(std::string("read() failed: ") + std::strerror(errno));
        }
        if (n == 0) break;
        result.out.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return result;
}

} // namespace platform
