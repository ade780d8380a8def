#include "sweep/Process.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "sweep/BackgroundTask.hpp"

namespace {

std::vector<char*> BuildArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void ExecChild(std::vector<char*>& argv, int stdin_fd, const char* cwd) {
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        dup2(devnull, STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
        if (stdin_fd < 0) {
            dup2(devnull, STDIN_FILENO);
        }
        close(devnull);
    }
    if (stdin_fd >= 0) {
        dup2(stdin_fd, STDIN_FILENO);
        close(stdin_fd);
    }
    if (cwd != nullptr && chdir(cwd) != 0) {
        _exit(127);
    }
    execvp(argv[0], argv.data());
    _exit(127);
}

int WaitForExit(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

bool WriteAll(int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

int RunProcess(const std::vector<std::string>& args, const std::optional<std::string>& stdin_data) {
    if (args.empty()) {
        return -1;
    }

    int stdin_pipe[2] = {-1, -1};
    if (stdin_data.has_value() && pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        spdlog::warn("Failed to create stdin pipe for {}: {}", args[0], std::strerror(errno));
        return -1;
    }

    std::vector<char*> argv = BuildArgv(args);
    pid_t pid = fork();
    if (pid < 0) {
        spdlog::warn("Failed to fork for {}: {}", args[0], std::strerror(errno));
        if (stdin_data.has_value()) {
            close(stdin_pipe[0]);
            close(stdin_pipe[1]);
        }
        return -1;
    }

    if (pid == 0) {
        if (stdin_data.has_value()) {
            close(stdin_pipe[1]);
        }
        ExecChild(argv, stdin_pipe[0], nullptr);
    }

    if (stdin_data.has_value()) {
        close(stdin_pipe[0]);
        // The child may exit without reading (EPIPE); its exit code decides the outcome.
        if (!WriteAll(stdin_pipe[1], *stdin_data)) {
            spdlog::debug("Child {} closed stdin early", args[0]);
        }
        close(stdin_pipe[1]);
    }

    return WaitForExit(pid);
}

bool SpawnDetached(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
    if (args.empty()) {
        return false;
    }

    std::vector<char*> argv = BuildArgv(args);
    const std::string dir = cwd.string();
    pid_t pid = fork();
    if (pid < 0) {
        spdlog::warn("Failed to fork for {}: {}", args[0], std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        ExecChild(argv, -1, dir.c_str());
    }

    spdlog::info("Started '{}' (pid {}) in {}", args[0], pid, dir);
    const std::string name = args[0];
    const bool reaping = RunDetached("reap " + name, [pid, name]() {
        int code = WaitForExit(pid);
        spdlog::info("'{}' (pid {}) exited with code {}", name, pid, code);
    });
    if (!reaping) {
        spdlog::warn("'{}' (pid {}) keeps running but will not be reaped", name, pid);
    }
    return true;
}
