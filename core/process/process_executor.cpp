#include "process/process_executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace arena {

namespace {

using Clock = std::chrono::steady_clock;

// Poll quantum while waiting on output or on the child's exit.
constexpr int kPollIntervalMs = 50;

// Owns a raw descriptor; closed on reset or destruction.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

Pipe makePipe() {
    int fds[2];
    if (::pipe(fds) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

/// One read from a readable descriptor. Closes it on EOF or error.
void readOnce(FileDescriptor& fd, std::string& out) {
    char buf[8192];
    ssize_t n;
    do {
        n = ::read(fd.get(), buf, sizeof(buf));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
    } else {
        fd.reset();
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void waitBlocking(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // namespace

double roundSeconds(double seconds) {
    return std::round(seconds * 100.0) / 100.0;
}

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

ExecResult ProcessExecutor::execute(const std::string& command,
                                    const std::filesystem::path& cwd,
                                    int timeout_seconds) const {
    if (timeout_seconds <= 0) {
        throw std::invalid_argument("timeout must be positive, got " +
                                    std::to_string(timeout_seconds));
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(cwd, ec)) {
        throw std::runtime_error("Working directory does not exist: " + cwd.string());
    }

    spdlog::debug("exec [{}] in {} (timeout {}s)", command, cwd.string(), timeout_seconds);

    Pipe out_pipe = makePipe();
    Pipe err_pipe = makePipe();
    FileDescriptor dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.valid()) {
        throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }

    // Everything the child touches is prepared before fork.
    const std::string cwd_str = cwd.string();
    const auto start = Clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        if (::chdir(cwd_str.c_str()) != 0) _exit(127);
        ::dup2(dev_null.get(), STDIN_FILENO);
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    ::setpgid(pid, pid);  // same as the child's call; whichever runs first wins
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    dev_null.reset();

    ExecResult result;
    FileDescriptor& out_fd = out_pipe.read_end;
    FileDescriptor& err_fd = err_pipe.read_end;
    const auto deadline = start + std::chrono::seconds(timeout_seconds);
    int status = 0;
    bool reaped = false;

    while (out_fd.valid() || err_fd.valid() || !reaped) {
        auto now = Clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(remaining + 1, kPollIntervalMs));

        if (out_fd.valid() || err_fd.valid()) {
            pollfd fds[2];
            FileDescriptor* owners[2];
            nfds_t nfds = 0;
            for (FileDescriptor* fd : {&out_fd, &err_fd}) {
                if (!fd->valid()) continue;
                fds[nfds] = pollfd{fd->get(), POLLIN, 0};
                owners[nfds] = fd;
                nfds++;
            }
            int rc = ::poll(fds, nfds, wait_ms);
            if (rc < 0 && errno != EINTR) {
                int err = errno;
                ::kill(-pid, SIGKILL);
                waitBlocking(pid, status);
                throw std::system_error(err, std::generic_category(), "poll");
            }
            for (nfds_t i = 0; rc > 0 && i < nfds; i++) {
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                    std::string& sink = (owners[i] == &out_fd) ? result.stdout_text
                                                               : result.stderr_text;
                    readOnce(*owners[i], sink);
                }
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(wait_ms, 10)));
        }

        if (!reaped && ::waitpid(pid, &status, WNOHANG) == pid) {
            reaped = true;
        }
    }

    if (result.timed_out) {
        // Hard kill of the whole group: untrusted commands may ignore SIGTERM.
        ::kill(-pid, SIGKILL);
        if (!reaped) waitBlocking(pid, status);
        result.exit_code = -1;
        result.stdout_text.clear();
        result.stderr_text = "Command timed out after " + std::to_string(timeout_seconds) + "s";
        spdlog::debug("exec timed out after {}s: {}", timeout_seconds, command);
    } else {
        result.exit_code = decodeStatus(status);
    }

    result.duration_seconds = roundSeconds(
        std::chrono::duration<double>(Clock::now() - start).count());
    return result;
}

} // namespace arena
