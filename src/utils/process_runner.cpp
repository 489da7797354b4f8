/**
 * @file process_runner.cpp
 * @brief fork/exec based child process runner
 *
 * **Pipe Layout**:
 * ```
 * parent ──stdin pipe──▶ child fd 0
 * parent ◀─stdout pipe── child fd 1
 * parent ◀─stderr pipe── child fd 2
 * parent ◀─status pipe── child (CLOEXEC, carries errno if execvp fails)
 * ```
 *
 * The parent multiplexes all three stdio pipes with poll() so a chatty child
 * can never deadlock against a full stdin or stdout buffer. When the deadline
 * passes the child receives SIGKILL and is reaped before returning.
 *
 * @date 2025
 */

#include "sandcell/utils/process_runner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandcell {
namespace utils {

namespace {

/**
 * @brief Owning wrapper for a raw file descriptor
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset(other.Release());
        }
        return *this;
    }

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    int Release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Pipe MakePipe(int flags = 0) {
    int fds[2];
    if (::pipe2(fds, flags) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Appends up to the cap; returns false once the stream hit EOF or failed.
bool DrainInto(int fd, std::string& sink, std::size_t cap, bool& truncated) {
    std::array<char, 8192> buffer;
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) {
        return false;
    }

    std::size_t bytes = static_cast<std::size_t>(n);
    if (cap == 0 || sink.size() + bytes <= cap) {
        sink.append(buffer.data(), bytes);
    } else {
        if (sink.size() < cap) {
            sink.append(buffer.data(), cap - sink.size());
        }
        truncated = true;
    }
    return true;
}

[[noreturn]] void ExecChild(const std::vector<std::string>& argv,
                            Pipe& in, Pipe& out, Pipe& err, Pipe& status) {
    ::dup2(in.read_end.Get(), STDIN_FILENO);
    ::dup2(out.write_end.Get(), STDOUT_FILENO);
    ::dup2(err.write_end.Get(), STDERR_FILENO);

    in.write_end.Reset();
    out.read_end.Reset();
    err.read_end.Reset();
    status.read_end.Reset();

    std::signal(SIGPIPE, SIG_DFL);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    ::execvp(args[0], args.data());

    int exec_errno = errno;
    ssize_t ignored = ::write(status.write_end.Get(), &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
}

int WaitChild(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return 0;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argv");
    }

    IgnoreSigpipeOnce();

    Pipe in = MakePipe(O_CLOEXEC);
    Pipe out = MakePipe(O_CLOEXEC);
    Pipe err = MakePipe(O_CLOEXEC);
    Pipe status = MakePipe(O_CLOEXEC);

    auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        ExecChild(argv, in, out, err, status);
    }

    in.read_end.Reset();
    out.write_end.Reset();
    err.write_end.Reset();
    status.write_end.Reset();

    // Blocks until execvp succeeds (CLOEXEC closes the pipe) or reports errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status.read_end.Get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int ignored_status = 0;
        WaitChild(pid, ignored_status);
        throw std::system_error(exec_errno, std::generic_category(), "exec " + argv[0]);
    }

    ProcessResult result;

    std::size_t stdin_offset = 0;
    if (options.stdin_data.empty()) {
        in.write_end.Reset();
    } else {
        ::fcntl(in.write_end.Get(), F_SETFL, ::fcntl(in.write_end.Get(), F_GETFL) | O_NONBLOCK);
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = start + *options.timeout;
    }

    while (out.read_end.Valid() || err.read_end.Valid()) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        int in_index = -1;

        if (out.read_end.Valid()) {
            out_index = static_cast<int>(count);
            fds[count++] = pollfd{out.read_end.Get(), POLLIN, 0};
        }
        if (err.read_end.Valid()) {
            err_index = static_cast<int>(count);
            fds[count++] = pollfd{err.read_end.Get(), POLLIN, 0};
        }
        if (in.write_end.Valid()) {
            in_index = static_cast<int>(count);
            fds[count++] = pollfd{in.write_end.Get(), POLLOUT, 0};
        }

        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int poll_errno = errno;
            ::kill(pid, SIGKILL);
            int ignored_status = 0;
            WaitChild(pid, ignored_status);
            throw std::system_error(poll_errno, std::generic_category(), "poll");
        }
        if (ready == 0) {
            continue;  // deadline is re-checked at the top of the loop
        }

        if (in_index >= 0 && fds[in_index].revents != 0) {
            if (fds[in_index].revents & (POLLERR | POLLHUP)) {
                in.write_end.Reset();
            } else {
                const char* data = options.stdin_data.data() + stdin_offset;
                std::size_t left = options.stdin_data.size() - stdin_offset;
                ssize_t written = ::write(in.write_end.Get(), data, left);
                if (written > 0) {
                    stdin_offset += static_cast<std::size_t>(written);
                    if (stdin_offset == options.stdin_data.size()) {
                        in.write_end.Reset();
                    }
                } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: child closed stdin early
                    in.write_end.Reset();
                }
            }
        }

        if (out_index >= 0 && fds[out_index].revents != 0) {
            if (!DrainInto(out.read_end.Get(), result.stdout_output,
                           options.max_output_bytes, result.stdout_truncated)) {
                out.read_end.Reset();
            }
        }
        if (err_index >= 0 && fds[err_index].revents != 0) {
            if (!DrainInto(err.read_end.Get(), result.stderr_output,
                           options.max_output_bytes, result.stderr_truncated)) {
                err.read_end.Reset();
            }
        }
    }

    if (result.timed_out) {
        spdlog::debug("Deadline reached, killing pid {} ({})", pid, argv[0]);
        ::kill(pid, SIGKILL);
    }

    in.write_end.Reset();
    out.read_end.Reset();
    err.read_end.Reset();

    int wait_status = 0;

    // Both output pipes closed but the child may still be running
    while (!result.timed_out && deadline) {
        pid_t done = ::waitpid(pid, &wait_status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (std::chrono::steady_clock::now() >= *deadline) {
            result.timed_out = true;
            ::kill(pid, SIGKILL);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    bool reaped = !result.timed_out && deadline.has_value();
    if (!reaped && WaitChild(pid, wait_status) != 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }

    if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.term_signal = WTERMSIG(wait_status);
        result.exit_code = 128 + result.term_signal;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    return result;
}

} // namespace utils
} // namespace sandcell
