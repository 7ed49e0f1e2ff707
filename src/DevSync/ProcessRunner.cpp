// =================================================================
// src/DevSync/ProcessRunner.cpp
// =================================================================
// fork/exec process runner with enforced timeouts.

#include "DevSync/ProcessRunner.hpp"
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace DevSync {

namespace {

int makeCloexecPipe(int pfd[2]) {
#ifdef __linux__
    if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
    if (::pipe(pfd) != 0) return -1;
    ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
    ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
    return 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads what is available; returns false once the pipe reached EOF.
bool drainFd(int fd, std::string& sink) {
    std::array<char, 4096> buffer{};
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        sink.append(buffer.data(), static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

[[noreturn]] void childFailed(int report_fd) {
    int err = errno;
    ssize_t ignored = ::write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

std::string formatCommandLine(const std::vector<std::string>& args) {
    std::string line;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i) line += ' ';
        const std::string& arg = args[i];
        if (arg.find_first_of(" \t\n\"'") != std::string::npos) {
            line += '"';
            for (char c : arg) {
                if (c == '"') line += '\\';
                line += c;
            }
            line += '"';
        } else {
            line += arg;
        }
    }
    return line;
}

int pollTimeout(std::chrono::milliseconds remaining) {
    if (remaining.count() <= 0) {
        return 0;
    }
    if (remaining.count() > INT_MAX) {
        return INT_MAX;
    }
    return static_cast<int>(remaining.count());
}

SystemProcessRunner::SystemProcessRunner(std::chrono::milliseconds kill_grace)
    : m_kill_grace(kill_grace) {}

ProcessResult SystemProcessRunner::run(const std::vector<std::string>& args,
                                       const std::string& working_dir,
                                       std::chrono::milliseconds timeout) {
    if (args.empty()) {
        throw std::invalid_argument("Cannot run an empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (makeCloexecPipe(out_pipe) != 0 || makeCloexecPipe(err_pipe) != 0 || makeCloexecPipe(exec_pipe) != 0) {
        std::string reason = std::strerror(errno);
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        closeFd(exec_pipe[0]); closeFd(exec_pipe[1]);
        throw std::runtime_error("Failed to create pipes: " + reason);
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const auto started = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        closeFd(exec_pipe[0]); closeFd(exec_pipe[1]);
        throw std::runtime_error("fork failed: " + reason);
    }

    if (pid == 0) {
        // Child: own process group, stdin from /dev/null, pipes for output.
        ::setpgid(0, 0);
        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            childFailed(exec_pipe[1]);
        }
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (::dup2(out_pipe[1], STDOUT_FILENO) < 0 || ::dup2(err_pipe[1], STDERR_FILENO) < 0) {
            childFailed(exec_pipe[1]);
        }
        ::execvp(argv[0], argv.data());
        childFailed(exec_pipe[1]);
    }

    // Parent
    ::setpgid(pid, pid);
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    closeFd(exec_pipe[1]);

    // The exec pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t reported;
    do {
        reported = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (reported < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);

    if (reported == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        closeFd(out_pipe[0]);
        closeFd(err_pipe[0]);
        throw std::runtime_error("Failed to start '" + args[0] + "': " + std::strerror(child_errno));
    }

    ProcessResult result;
    const bool has_deadline = timeout.count() > 0;
    const auto deadline = started + timeout;

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    while (out_fd >= 0 || err_fd >= 0) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        int wait_ms = -1;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = pollTimeout(remaining);
        }

        int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue; // deadline re-checked at the top of the loop
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_fd) {
                if (!drainFd(out_fd, result.stdout_output)) closeFd(out_fd);
            } else if (fds[i].fd == err_fd) {
                if (!drainFd(err_fd, result.stderr_output)) closeFd(err_fd);
            }
        }
    }

    int status = 0;
    if (result.timed_out) {
        ::kill(-pid, SIGTERM);
        const auto kill_deadline = std::chrono::steady_clock::now() + m_kill_grace;
        pid_t waited = 0;
        while ((waited = ::waitpid(pid, &status, WNOHANG)) == 0 &&
               std::chrono::steady_clock::now() < kill_deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (waited == 0) {
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
        result.exit_code = -1;
    } else {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.exit_code = decodeStatus(status);
    }

    closeFd(out_fd);
    closeFd(err_fd);

    result.duration_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    return result;
}

} // namespace DevSync
