#include "shell_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <thread>

#include <log4cplus/loggingmacros.h>

namespace flitify {

namespace {

auto& logger() {
    static auto logger = log4cplus::Logger::getInstance("flitify_agent.shell");
    return logger;
}

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

void open_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

// Drain whatever is readable; closes the fd on EOF.
void read_available(UniqueFd& fd, std::string& out) {
    char buffer[4096];
    ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        fd.reset();
    }
}

} // namespace

ShellResult run_shell_command(const std::string& command,
                              std::chrono::milliseconds timeout,
                              const std::string& shell) {
    if (::access(shell.c_str(), X_OK) != 0) {
        throw std::system_error(errno, std::generic_category(), "shell " + shell);
    }

    UniqueFd out_read, out_write, err_read, err_write;
    open_pipe(out_read, out_write);
    open_pipe(err_read, err_write);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::dup2(err_write.get(), STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execl(shell.c_str(), shell.c_str(), "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Set the group from the parent too, so a kill right after fork cannot miss it
    ::setpgid(pid, pid);
    out_write.reset();
    err_write.reset();

    LOG4CPLUS_DEBUG(logger(), "spawned pid " << pid << " for: " << command);

    ShellResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool exited = false;
    int status = 0;

    while (true) {
        if (!exited) {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                exited = true;
            }
        }
        if (exited && !out_read.valid() && !err_read.valid()) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        if (!out_read.valid() && !err_read.valid()) {
            // Pipes closed but the child is still running
            auto nap = std::min(remaining, std::chrono::milliseconds(20));
            std::this_thread::sleep_for(nap);
            continue;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_read.valid()) {
            fds[count++] = {out_read.get(), POLLIN, 0};
        }
        if (err_read.valid()) {
            fds[count++] = {err_read.get(), POLLIN, 0};
        }

        // Bounded wait so a child that exits with inherited pipes still gets reaped
        int wait_ms = static_cast<int>(std::min(remaining, std::chrono::milliseconds(100)).count());
        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            throw std::system_error(err, std::generic_category(), "poll");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == out_read.get()) {
                read_available(out_read, result.stdout_output);
            } else if (fds[i].fd == err_read.get()) {
                read_available(err_read, result.stderr_output);
            }
        }
    }

    if (result.timed_out) {
        LOG4CPLUS_WARN(logger(), "pid " << pid << " exceeded " << timeout.count() << " ms, killing process group");
        ::kill(-pid, SIGKILL);
        if (!exited) {
            ::waitpid(pid, nullptr, 0);
        }
        result.exit_code = -1;
        return result;
    }

    result.exit_code = decode_wait_status(status);
    LOG4CPLUS_DEBUG(logger(), "pid " << pid << " exited with " << result.exit_code);
    return result;
}

} // namespace flitify
