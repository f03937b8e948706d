// =============================================================================
// Scry - ADB Transport Implementation
// =============================================================================
#include "adb_transport.hpp"
#include "adb_command_translator.hpp"
#include "adb_security.hpp"
#include "child_process.hpp"
#include "scry_log.hpp"
#include "scry_protocol.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <functional>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <signal.h>

namespace scry {

using namespace protocol;

namespace {

// Time a closing shell gets to finish queued commands
constexpr int SHELL_DRAIN_MS = 3000;

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// ----------------------------------------------------------------------------
// Video: read-only pipe from screenrecord
// ----------------------------------------------------------------------------
class AdbVideoStream : public Stream {
public:
    AdbVideoStream(std::unique_ptr<ChildProcess> child, std::vector<std::string> stop_cmd)
        : child_(std::move(child)), stop_cmd_(std::move(stop_cmd)) {}

    ~AdbVideoStream() override { close(); }

    Result<void> write(const uint8_t*, size_t) override {
        return Error(ErrorKind::Connection, "video channel is receive-only");
    }

    Result<size_t> readChunk(uint8_t* buf, size_t cap) override {
        if (closed_.load()) return size_t{0};
        ssize_t n = child_->read(buf, cap);
        if (n > 0) return static_cast<size_t>(n);
        if (n == 0 || closed_.load()) return size_t{0};
        return Error(ErrorKind::Connection, std::string("video pipe read failed: ") + strerror(errno), errno);
    }

    void close() override {
        if (closed_.exchange(true)) return;
        child_->terminate();
        // Killing the local client does not always stop the recorder on the device
        int rc = ChildProcess::run(stop_cmd_, nullptr, 3000);
        SLOG_DEBUG("adb_transport", "Video channel closed (pkill rc=%d)", rc);
    }

    ChannelKind kind() const override { return ChannelKind::Video; }

private:
    std::unique_ptr<ChildProcess> child_;
    std::vector<std::string> stop_cmd_;
    std::atomic<bool> closed_{false};
};

// ----------------------------------------------------------------------------
// Control: persistent shell fed with translated input commands
// ----------------------------------------------------------------------------
class AdbControlStream : public Stream {
public:
    AdbControlStream(std::unique_ptr<ChildProcess> child, int busy_timeout_ms)
        : child_(std::move(child)), busy_timeout_ms_(busy_timeout_ms) {}

    ~AdbControlStream() override { close(); }

    Result<void> write(const uint8_t* data, size_t len) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_.load()) return Error(ErrorKind::Connection, "control channel closed");

        reader_.append(data, len);
        std::string script;
        Frame frame;
        while (reader_.next(frame)) {
            auto lines = translator_.translate(frame);
            if (lines.is_err()) return lines.error();
            for (const auto& line : lines.value()) {
                script += line;
                script += '\n';
            }
        }
        if (reader_.corrupt()) {
            return Error(ErrorKind::Connection, "control stream desynchronized (bad frame header)");
        }
        if (script.empty()) return {};

        if (!child_->alive()) return Error(ErrorKind::Connection, "adb shell exited");

        ssize_t n = child_->write(reinterpret_cast<const uint8_t*>(script.data()), script.size(),
                                  busy_timeout_ms_);
        if (n == static_cast<ssize_t>(script.size())) {
            SLOG_TRACE("adb_transport", "shell <- %s", script.c_str());
            return {};
        }
        if (n == 0 && child_->timedOut()) {
            return Error(ErrorKind::DeviceBusy,
                         "adb shell did not accept input within " + std::to_string(busy_timeout_ms_) + "ms");
        }
        if (n > 0) {
            // Half a command line is in the pipe; the shell can no longer be trusted
            SLOG_ERROR("adb_transport", "adb shell stalled mid-command, dropping it");
            child_->terminate(200);
            return Error(ErrorKind::Connection, "adb shell stalled mid-command");
        }
        return Error(ErrorKind::Connection, "adb shell write failed");
    }

    // No device-to-host traffic: blocks until close()
    Result<size_t> readChunk(uint8_t*, size_t) override {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this] { return closed_.load(); });
        return size_t{0};
    }

    void close() override {
        if (closed_.exchange(true)) return;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
        }
        state_cv_.notify_all();

        std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
        if (lock.owns_lock()) {
            // Idle: EOF lets the shell run what it already has, then exit
            child_->closeStdin();
            if (child_->wait(SHELL_DRAIN_MS) == -1) child_->terminate(200);
        } else {
            // A writer is stuck on a full pipe; kill the shell to release it
            child_->signal(SIGTERM);
            lock.lock();
            child_->closeStdin();
            child_->terminate(200);
        }
        SLOG_DEBUG("adb_transport", "Control channel closed");
    }

    ChannelKind kind() const override { return ChannelKind::Control; }

private:
    std::unique_ptr<ChildProcess> child_;
    int busy_timeout_ms_;
    FrameReader reader_;
    AdbCommandTranslator translator_;
    std::mutex write_mutex_;
    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::atomic<bool> closed_{false};
};

// ----------------------------------------------------------------------------
// FilePush: SEND/DATA/DONE frames in, OKAY/FAIL frames out
// ----------------------------------------------------------------------------
class AdbFilePushStream : public Stream {
public:
    using SinkCommand = std::function<std::vector<std::string>(const std::string&)>;

    AdbFilePushStream(SinkCommand sink_command, int close_timeout_ms)
        : sink_command_(std::move(sink_command)), close_timeout_ms_(close_timeout_ms) {}

    ~AdbFilePushStream() override { close(); }

    Result<void> write(const uint8_t* data, size_t len) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_.load()) return Error(ErrorKind::Connection, "file push channel closed");

        reader_.append(data, len);
        Frame frame;
        while (reader_.next(frame)) {
            switch (frame.cmd) {
                case CMD_SEND: onSend(frame); break;
                case CMD_DATA: onData(frame); break;
                case CMD_DONE: onDone(frame); break;
                default:
                    queueReply(CMD_FAIL, frame.seq,
                               std::string("unexpected command ") + cmd_name(frame.cmd));
                    break;
            }
        }
        if (reader_.corrupt()) {
            return Error(ErrorKind::Connection, "file push stream desynchronized (bad frame header)");
        }
        return {};
    }

    Result<size_t> readChunk(uint8_t* buf, size_t cap) override {
        std::unique_lock<std::mutex> lock(reply_mutex_);
        reply_cv_.wait(lock, [this] { return !replies_.empty() || closed_.load(); });
        if (replies_.empty()) return size_t{0};
        size_t n = std::min(cap, replies_.size());
        std::copy(replies_.begin(), replies_.begin() + static_cast<std::ptrdiff_t>(n), buf);
        replies_.erase(replies_.begin(), replies_.begin() + static_cast<std::ptrdiff_t>(n));
        return n;
    }

    void close() override {
        if (closed_.exchange(true)) return;
        {
            std::lock_guard<std::mutex> lock(reply_mutex_);
        }
        reply_cv_.notify_all();
        pid_t pid = sink_pid_.load();
        if (pid > 0) ::kill(pid, SIGTERM);
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (sink_) {
            SLOG_WARN("adb_transport", "File push to %s abandoned", remote_path_.c_str());
            sink_->terminate(200);
            resetSink();
        }
    }

    ChannelKind kind() const override { return ChannelKind::FilePush; }

private:
    void onSend(const Frame& frame) {
        if (sink_) {
            SLOG_WARN("adb_transport", "SEND while %s is open, discarding it", remote_path_.c_str());
            sink_->terminate(200);
            resetSink();
        }
        sink_error_.clear();
        bytes_ = 0;

        size_t offset = 4;
        std::string path;
        if (frame.payload.size() < 4 || !get_string(frame.payload, offset, path)) {
            sink_error_ = "malformed SEND";
            return;
        }
        uint32_t mode = get_u32(frame.payload.data());
        remote_path_ = path;
        if (!security::isAllowedRemotePath(path)) {
            SLOG_ERROR("adb_transport", "SEND path rejected: %s", path.c_str());
            sink_error_ = "remote path not allowed: " + path;
            return;
        }

        ChildProcess::Options opts;
        opts.pipe_stdin = true;
        opts.pipe_stdout = false;
        sink_ = ChildProcess::spawn(sink_command_(path), opts);
        if (!sink_) {
            sink_error_ = "failed to spawn adb exec-in";
            return;
        }
        sink_pid_.store(sink_->pid());
        SLOG_INFO("adb_transport", "Receiving %s (mode %o)", path.c_str(), static_cast<unsigned>(mode));
    }

    void onData(const Frame& frame) {
        if (!sink_error_.empty()) return;
        if (!sink_) {
            sink_error_ = "DATA without SEND";
            return;
        }
        ssize_t n = sink_->write(frame.payload.data(), frame.payload.size());
        if (n != static_cast<ssize_t>(frame.payload.size())) {
            sink_error_ = "device stopped accepting data";
            return;
        }
        bytes_ += frame.payload.size();
    }

    void onDone(const Frame& frame) {
        if (sink_error_.empty() && !sink_) sink_error_ = "DONE without SEND";
        if (sink_) {
            sink_->closeStdin();
            int rc = sink_->wait(close_timeout_ms_);
            if (rc == -1 && sink_->alive()) {
                sink_->terminate(200);
                if (sink_error_.empty()) sink_error_ = "timed out waiting for the device to store the file";
            } else if (rc != 0 && sink_error_.empty()) {
                sink_error_ = "device write failed (exit " + std::to_string(rc) + ")";
            }
            resetSink();
        }

        if (sink_error_.empty()) {
            SLOG_INFO("adb_transport", "Stored %s (%zu bytes)", remote_path_.c_str(), bytes_);
            queueReply(CMD_OKAY, frame.seq, "");
        } else {
            SLOG_ERROR("adb_transport", "Push of %s failed: %s", remote_path_.c_str(), sink_error_.c_str());
            queueReply(CMD_FAIL, frame.seq, sink_error_);
        }
        sink_error_.clear();
    }

    void resetSink() {
        sink_pid_.store(0);
        sink_.reset();
    }

    void queueReply(uint8_t cmd, uint32_t seq, const std::string& message) {
        std::vector<uint8_t> out;
        append_frame(out, cmd, seq, reinterpret_cast<const uint8_t*>(message.data()), message.size());
        {
            std::lock_guard<std::mutex> lock(reply_mutex_);
            replies_.insert(replies_.end(), out.begin(), out.end());
        }
        reply_cv_.notify_all();
    }

    SinkCommand sink_command_;
    int close_timeout_ms_;

    std::mutex write_mutex_;
    FrameReader reader_;
    std::unique_ptr<ChildProcess> sink_;
    std::atomic<pid_t> sink_pid_{0};
    std::string remote_path_;
    std::string sink_error_;
    size_t bytes_ = 0;

    std::mutex reply_mutex_;
    std::condition_variable reply_cv_;
    std::deque<uint8_t> replies_;
    std::atomic<bool> closed_{false};
};

} // namespace

AdbTransport::AdbTransport(AdbTransportOptions opts) : opts_(std::move(opts)) {}

std::vector<std::string> AdbTransport::videoCommand(const std::string& device_id,
                                                    const VideoOptions& video) const {
    return {opts_.adb_path, "-s", device_id, "exec-out", "screenrecord",
            "--output-format=h264",
            "--size", std::to_string(video.width) + "x" + std::to_string(video.height),
            "--bit-rate", std::to_string(video.bit_rate),
            "-"};
}

std::vector<std::string> AdbTransport::controlCommand(const std::string& device_id) const {
    return {opts_.adb_path, "-s", device_id, "shell"};
}

std::vector<std::string> AdbTransport::fileSinkCommand(const std::string& device_id,
                                                       const std::string& remote_path) const {
    // adb hands a single argument to the device shell unchanged
    return {opts_.adb_path, "-s", device_id, "exec-in", "cat > " + security::quoteShellArg(remote_path)};
}

std::vector<std::string> AdbTransport::stopRecorderCommand(const std::string& device_id) const {
    return {opts_.adb_path, "-s", device_id, "shell", "pkill", "-INT", "screenrecord"};
}

Result<void> AdbTransport::checkDevice(const std::string& device_id) const {
    std::string output;
    int rc = ChildProcess::run({opts_.adb_path, "-s", device_id, "get-state"}, &output, 5000);
    std::string state = trim(output);
    if (rc != 0 || state != "device") {
        return Error(ErrorKind::Connection,
                     "device " + device_id + " not available: " + (state.empty() ? "no response" : state), rc);
    }
    return {};
}

Result<std::unique_ptr<Stream>> AdbTransport::open(const std::string& device_id, ChannelKind kind,
                                                   const VideoOptions& video) {
    if (!security::isValidAdbId(device_id)) {
        SLOG_ERROR("adb_transport", "Rejected device id: %s", device_id.c_str());
        return Error(ErrorKind::Connection, "invalid device id: " + device_id);
    }
    if (opts_.check_device_state) {
        auto state = checkDevice(device_id);
        if (state.is_err()) {
            SLOG_WARN("adb_transport", "%s", state.error().message.c_str());
            return state.error();
        }
    }

    std::unique_ptr<Stream> stream;
    ChildProcess::Options popts;
    switch (kind) {
        case ChannelKind::Video: {
            popts.pipe_stdout = true;
            popts.merge_stderr = true;  // denial messages arrive on stderr
            auto child = ChildProcess::spawn(videoCommand(device_id, video), popts);
            if (!child) return Error(ErrorKind::Connection, "failed to spawn adb screenrecord");
            stream = std::make_unique<AdbVideoStream>(std::move(child), stopRecorderCommand(device_id));
            break;
        }
        case ChannelKind::Control: {
            popts.pipe_stdin = true;
            popts.pipe_stdout = false;
            auto child = ChildProcess::spawn(controlCommand(device_id), popts);
            if (!child) return Error(ErrorKind::Connection, "failed to spawn adb shell");
            stream = std::make_unique<AdbControlStream>(std::move(child), opts_.busy_timeout_ms);
            break;
        }
        case ChannelKind::FilePush:
        {
            auto sink_command = [opts = opts_, device_id](const std::string& path) {
                return AdbTransport(opts).fileSinkCommand(device_id, path);
            };
            stream = std::make_unique<AdbFilePushStream>(std::move(sink_command), opts_.file_close_timeout_ms);
            break;
        }
    }

    SLOG_INFO("adb_transport", "Opened %s channel to %s", channelKindName(kind), device_id.c_str());
    return Result<std::unique_ptr<Stream>>(std::move(stream));
}

} // namespace scry
