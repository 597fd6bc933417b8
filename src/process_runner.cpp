#include "process_runner.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

}

std::optional<std::string> resolveExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) {
            return name;
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(searchPath);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = std::format("{}/{}", dir, name);
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string>& argv,
                                                     bool captureOutput) {
    if (argv.empty()) {
        return std::unexpected("Empty command");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // Close-on-exec keeps children forked by other threads from holding the
    // write end open; dup2 clears the flag on the child's stdout and stderr.
    int pipeFds[2] = {-1, -1};
    if (captureOutput && pipe2(pipeFds, O_CLOEXEC) != 0) {
        return std::unexpected(std::format("Failed to create pipe: {}", strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string error = strerror(errno);
        if (captureOutput) {
            close(pipeFds[0]);
            close(pipeFds[1]);
        }
        return std::unexpected(std::format("Failed to fork: {}", error));
    }

    if (pid == 0) {
        if (captureOutput) {
            dup2(pipeFds[1], STDOUT_FILENO);
            dup2(pipeFds[1], STDERR_FILENO);
            close(pipeFds[0]);
            close(pipeFds[1]);
        }
        execv(args[0], args.data());
        _exit(127);
    }

    ProcessResult result;
    if (captureOutput) {
        close(pipeFds[1]);
        char buf[4096];
        ssize_t n;
        while ((n = read(pipeFds[0], buf, sizeof(buf))) != 0) {
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            result.output.append(buf, static_cast<std::size_t>(n));
        }
        close(pipeFds[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(std::format("Failed to wait for child process: {}", strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}
