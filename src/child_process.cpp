#include "child_process.hpp"
#include "scry_log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scry {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                  const Options& opts) {
    if (argv.empty()) return nullptr;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (opts.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) {
        SLOG_ERROR("proc", "pipe2(stdin) failed: %s", strerror(errno));
        return nullptr;
    }
    if (opts.pipe_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) {
        SLOG_ERROR("proc", "pipe2(stdout) failed: %s", strerror(errno));
        closeFd(in_pipe[0]);
        closeFd(in_pipe[1]);
        return nullptr;
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& a : argv) c_args.push_back(const_cast<char*>(a.c_str()));
    c_args.push_back(nullptr);
    int dev_null = ::open("/dev/null", O_RDWR | O_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        SLOG_ERROR("proc", "fork failed: %s", strerror(errno));
        closeFd(in_pipe[0]); closeFd(in_pipe[1]);
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(dev_null);
        return nullptr;
    }

    if (pid == 0) {
        int in_fd = opts.pipe_stdin ? in_pipe[0] : dev_null;
        int out_fd = opts.pipe_stdout ? out_pipe[1] : dev_null;
        int err_fd = (opts.pipe_stdout && opts.merge_stderr) ? out_pipe[1] : dev_null;
        if (in_fd >= 0) dup2(in_fd, STDIN_FILENO);
        if (out_fd >= 0) dup2(out_fd, STDOUT_FILENO);
        if (err_fd >= 0) dup2(err_fd, STDERR_FILENO);
        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    closeFd(dev_null);
    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;
    if (opts.pipe_stdin) {
        closeFd(in_pipe[0]);
        child->stdin_fd_ = in_pipe[1];
        int flags = fcntl(child->stdin_fd_, F_GETFL);
        fcntl(child->stdin_fd_, F_SETFL, flags | O_NONBLOCK);
    }
    if (opts.pipe_stdout) {
        closeFd(out_pipe[1]);
        child->stdout_fd_ = out_pipe[0];
    }

    SLOG_DEBUG("proc", "Spawned pid=%d: %s", (int)pid, joinArgs(argv).c_str());
    return child;
}

int ChildProcess::run(const std::vector<std::string>& argv, std::string* output, int timeout_ms) {
    Options opts;
    opts.pipe_stdout = true;
    opts.merge_stderr = true;
    auto child = spawn(argv, opts);
    if (!child) return -1;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buffer[4096];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            SLOG_WARN("proc", "Timed out after %dms: %s", timeout_ms, joinArgs(argv).c_str());
            child->terminate();
            return -1;
        }
        pollfd pfd{child->stdout_fd_, POLLIN, 0};
        int pr = poll(&pfd, 1, static_cast<int>(remaining));
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) continue;
        ssize_t n = ::read(child->stdout_fd_, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        // Cap collected output at 1MB
        if (output && output->size() < 1024 * 1024) output->append(buffer, static_cast<size_t>(n));
    }
    return child->wait(timeout_ms);
}

ChildProcess::~ChildProcess() {
    if (!reaped_) terminate();
    closeFd(stdin_fd_);
    closeFd(stdout_fd_);
}

ssize_t ChildProcess::read(uint8_t* buf, size_t cap) {
    if (stdout_fd_ < 0) return -1;
    while (true) {
        ssize_t n = ::read(stdout_fd_, buf, cap);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

ssize_t ChildProcess::write(const uint8_t* data, size_t len, int timeout_ms) {
    timed_out_ = false;
    if (stdin_fd_ < 0) return -1;
    size_t written = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (written < len) {
        ssize_t n = ::write(stdin_fd_, data + written, len - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int wait_ms = -1;
            if (timeout_ms >= 0) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();
                if (remaining <= 0) {
                    timed_out_ = true;
                    return static_cast<ssize_t>(written);
                }
                wait_ms = static_cast<int>(remaining);
            }
            pollfd pfd{stdin_fd_, POLLOUT, 0};
            int pr = poll(&pfd, 1, wait_ms);
            if (pr < 0 && errno != EINTR) return -1;
            if (pfd.revents & (POLLERR | POLLHUP)) return -1;
            continue;
        }
        return -1;  // EPIPE: child gone
    }
    return static_cast<ssize_t>(written);
}

void ChildProcess::closeStdin() { closeFd(stdin_fd_); }
void ChildProcess::closeStdout() { closeFd(stdout_fd_); }

void ChildProcess::signal(int sig) {
    if (pid_ > 0 && !reaped_) ::kill(pid_, sig);
}

void ChildProcess::terminate(int grace_ms) {
    if (pid_ <= 0 || reaped_) return;
    ::kill(pid_, SIGTERM);
    if (wait(grace_ms) == -1 && !reaped_) {
        ::kill(pid_, SIGKILL);
        wait(-1);
    }
}

int ChildProcess::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        int status = 0;
        pid_t r = waitpid(pid_, &status, timeout_ms < 0 ? 0 : WNOHANG);
        if (r == pid_) {
            reaped_ = true;
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return exit_code_;
        }
        if (r < 0 && errno != EINTR) {
            reaped_ = true;
            return -1;
        }
        if (timeout_ms >= 0 && std::chrono::steady_clock::now() >= deadline) return -1;
        if (r == 0) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool ChildProcess::alive() {
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        reaped_ = true;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return false;
    }
    return r == 0;
}

} // namespace scry
