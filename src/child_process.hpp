// =============================================================================
// Scry - Child Process
// =============================================================================
// fork/exec wrapper with pipes to the child's stdin and stdout. Used for every
// adb invocation (video recorder, persistent shell, exec-in file sink).
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <atomic>
#include <sys/types.h>

namespace scry {

class ChildProcess {
public:
    struct Options {
        bool pipe_stdin = false;
        bool pipe_stdout = true;
        bool merge_stderr = false;   // stderr joins the stdout pipe
    };

    // Spawns argv[0] (PATH lookup). Returns nullptr on failure (logged).
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                               const Options& opts);

    // Runs to completion, collecting stdout+stderr. Returns exit code or -1.
    static int run(const std::vector<std::string>& argv, std::string* output = nullptr,
                   int timeout_ms = 8000);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Blocking read from stdout. >0 bytes, 0 on EOF, -1 on error.
    ssize_t read(uint8_t* buf, size_t cap);

    // Writes all bytes to stdin, waiting at most timeout_ms for pipe space
    // (timeout_ms < 0 waits forever). Returns written count; a short count with
    // timedOut() set means the child stopped draining its input. Writing to an
    // exited child returns -1 (EPIPE) only if the process ignores SIGPIPE.
    ssize_t write(const uint8_t* data, size_t len, int timeout_ms = -1);
    bool timedOut() const { return timed_out_; }

    void closeStdin();
    void closeStdout();

    // Sends sig without reaping; safe while another thread blocks in read()/write()
    void signal(int sig);

    // SIGTERM, then SIGKILL after grace_ms; reaps the child.
    void terminate(int grace_ms = 500);

    // Waits for exit (timeout_ms < 0 = forever). Returns exit code, -1 if the
    // child was signalled or did not exit in time.
    int wait(int timeout_ms = -1);

    bool alive();
    pid_t pid() const { return pid_; }

private:
    ChildProcess() = default;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::atomic<bool> reaped_{false};
    int exit_code_ = -1;
    bool timed_out_ = false;
};

} // namespace scry
