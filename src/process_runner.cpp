/**
 * @file process_runner.cpp
 * @brief fork/exec of platform tools with captured output and a hard deadline
 */

#include "bgd/process_runner.hpp"
#include "bgd/config.hpp"
#include "bgd/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace bgd {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void append_capped(std::string& output, const char* data, size_t size) {
    output.append(data, size);
    if (output.size() > MAX_CAPTURED_OUTPUT) {
        output.erase(0, output.size() - MAX_CAPTURED_OUTPUT);
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

Result<ProcessResult> ProcessRunner::run(const std::vector<std::string>& argv,
                                         std::chrono::milliseconds timeout) {
    if (argv.empty() || argv[0].empty()) {
        return Result<ProcessResult>(ErrorCode::INVALID_ARGUMENT, "empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessResult>(ErrorCode::PROCESS_SPAWN_FAILED, std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return Result<ProcessResult>(ErrorCode::PROCESS_SPAWN_FAILED, std::strerror(saved));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    LOG_DEBUG("exec: " + join_command(argv));

    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return Result<ProcessResult>(ErrorCode::PROCESS_SPAWN_FAILED, std::strerror(saved));
    }

    if (pid == 0) {
        // Child: own process group so a timeout can kill the whole tree and a
        // terminal SIGINT reaches only the orchestrator.
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    // The error pipe closes on a successful exec; a payload means exec failed.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        return Result<ProcessResult>(ErrorCode::PROCESS_SPAWN_FAILED,
                                     argv[0] + ": " + std::strerror(exec_errno));
    }

    ProcessResult result;
    auto deadline = start + timeout;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfd{out_pipe[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t r = ::read(out_pipe[0], buffer, sizeof(buffer));
        if (r > 0) {
            append_capped(result.output, buffer, static_cast<size_t>(r));
        } else if (r == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close_fd(out_pipe[0]);

    int status = 0;
    bool reaped = false;
    while (!result.timed_out) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (result.timed_out) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    }
    if (!reaped) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }

    result.exit_code = result.timed_out ? -1 : decode_status(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.timed_out) {
        LOG_WARN(argv[0] + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    return result;
}

bool is_executable_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

bool find_executable(const std::string& name, std::string* resolved) {
    if (name.empty()) return false;

    if (name.find('/') != std::string::npos) {
        if (!is_executable_file(name)) return false;
        if (resolved) *resolved = name;
        return true;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/bin:/bin";

    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            if (resolved) *resolved = candidate;
            return true;
        }
    }
    return false;
}

CommandTemplate::CommandTemplate(std::string text) : text_(std::move(text)) {}

Result<std::vector<std::string>> CommandTemplate::expand(
    const std::map<std::string, std::string>& vars) const {
    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    bool in_quote = false;

    for (char c : text_) {
        if (in_quote) {
            if (c == '\'') {
                in_quote = false;
            } else {
                current += c;
            }
        } else if (c == '\'') {
            in_quote = true;
            in_token = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_token) {
                tokens.push_back(current);
                current.clear();
                in_token = false;
            }
        } else {
            current += c;
            in_token = true;
        }
    }
    if (in_quote) {
        return Result<std::vector<std::string>>(ErrorCode::CONFIG_PARSE_ERROR,
                                                "unterminated quote in: " + text_);
    }
    if (in_token) {
        tokens.push_back(current);
    }
    if (tokens.empty()) {
        return Result<std::vector<std::string>>(ErrorCode::CONFIG_VALIDATION_FAILED, "empty command");
    }

    std::vector<std::string> argv;
    argv.reserve(tokens.size());
    for (const auto& token : tokens) {
        bool empty_placeholder = false;
        for (const auto& [key, value] : vars) {
            if (value.empty() && token.find("{" + key + "}") != std::string::npos) {
                empty_placeholder = true;
                break;
            }
        }
        if (empty_placeholder) continue;
        argv.push_back(substitute(token, vars));
    }

    if (argv.empty()) {
        return Result<std::vector<std::string>>(ErrorCode::CONFIG_VALIDATION_FAILED,
                                                "command expands to nothing: " + text_);
    }
    return argv;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            line += "'" + arg + "'";
        } else {
            line += arg;
        }
    }
    return line;
}

} // namespace bgd
