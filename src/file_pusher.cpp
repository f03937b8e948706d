// =============================================================================
// Scry - File Pusher Implementation
// =============================================================================
#include "file_pusher.hpp"
#include "adb_security.hpp"
#include "event_bus.hpp"
#include "scry_log.hpp"
#include "scry_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace scry {

using namespace protocol;

namespace {

Result<void> writeFrame(Stream& stream, uint8_t cmd, uint32_t seq, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    append_frame(out, cmd, seq, payload);
    return stream.write(out.data(), out.size());
}

TransferError ioFailure(const std::string& msg) {
    return TransferError(TransferError::Reason::IOFailure, msg);
}

} // namespace

FilePusher::FilePusher(std::shared_ptr<SharedLink> link, std::string device_id, config::TransferConfig cfg)
    : link_(std::move(link)), device_id_(std::move(device_id)), cfg_(std::move(cfg)) {}

std::string FilePusher::mimeForPath(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jpg" || ext == ".png") return "image/*";
    if (ext == ".mp4") return "video/*";
    return "*/*";
}

TransferRequest FilePusher::requestFor(const std::string& local_path) const {
    TransferRequest req;
    req.local_path = local_path;
    std::string dir = cfg_.download_dir;
    if (!dir.empty() && dir.back() != '/') dir.push_back('/');
    req.remote_path = dir + fs::path(local_path).filename().string();
    return req;
}

std::future<Result<void, TransferError>> FilePusher::submit(TransferRequest request) {
    // The job owns copies, so it may outlive this pusher
    auto link = link_;
    auto device_id = device_id_;
    auto cfg = cfg_;
    return std::async(std::launch::async, [link, device_id, cfg, request = std::move(request)]() {
        FilePusher job(link, device_id, cfg);
        return job.push(request);
    });
}

Result<void, TransferError> FilePusher::push(const TransferRequest& request) {
    auto t0 = std::chrono::steady_clock::now();
    auto result = transfer(request);
    int ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    TransferFinishedEvent evt;
    evt.local_path = request.local_path;
    evt.remote_path = request.remote_path;
    evt.ok = result.is_ok();
    if (result.is_ok()) {
        SLOG_INFO("push", "%s -> %s done (%dms)", request.local_path.c_str(), request.remote_path.c_str(), ms);
        openOnDevice(request.remote_path);
    } else {
        const TransferError& err = result.error();
        evt.reason = static_cast<int>(err.reason);
        evt.message = err.message;
        SLOG_ERROR("push", "%s -> %s failed (%s): %s", request.local_path.c_str(),
                   request.remote_path.c_str(), transferReasonName(err.reason), err.message.c_str());
    }
    bus().publish(evt);
    return result;
}

Result<void, TransferError> FilePusher::transfer(const TransferRequest& request) {
    std::error_code ec;
    if (request.local_path.empty() || !fs::exists(request.local_path, ec)) {
        return TransferError(TransferError::Reason::PathInvalid, "local file not found: " + request.local_path);
    }
    if (!fs::is_regular_file(request.local_path, ec)) {
        return TransferError(TransferError::Reason::PathInvalid, "not a regular file: " + request.local_path);
    }
    if (!security::isAllowedRemotePath(request.remote_path)) {
        return TransferError(TransferError::Reason::PathInvalid, "remote path not allowed: " + request.remote_path);
    }

    std::ifstream file(request.local_path, std::ios::binary);
    if (!file) {
        return ioFailure("cannot open " + request.local_path);
    }
    struct stat st {};
    uint32_t mtime = (::stat(request.local_path.c_str(), &st) == 0) ? static_cast<uint32_t>(st.st_mtime) : 0;

    auto opened = link_->open(device_id_, ChannelKind::FilePush);
    if (opened.is_err()) {
        return ioFailure("file push channel: " + opened.error().message);
    }
    std::unique_ptr<Stream> stream = std::move(opened).value();

    // The channel is closed on every exit path
    struct Closer {
        Stream& s;
        ~Closer() { s.close(); }
    } closer{*stream};

    uint32_t seq = 0;
    std::vector<uint8_t> payload;
    put_u32(payload, 0644);
    put_string(payload, request.remote_path);
    auto w = writeFrame(*stream, CMD_SEND, seq++, payload);
    if (w.is_err()) return ioFailure("SEND: " + w.error().message);

    const size_t chunk = std::min<size_t>(cfg_.chunk_size > 0 ? static_cast<size_t>(cfg_.chunk_size) : MAX_PAYLOAD,
                                          MAX_PAYLOAD);
    std::vector<uint8_t> buf(chunk);
    uint64_t total = 0;
    while (file) {
        file.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = file.gcount();
        if (got <= 0) break;
        std::vector<uint8_t> out;
        append_frame(out, CMD_DATA, seq++, buf.data(), static_cast<size_t>(got));
        auto dw = stream->write(out.data(), out.size());
        if (dw.is_err()) return ioFailure("DATA: " + dw.error().message);
        total += static_cast<uint64_t>(got);
    }
    if (file.bad()) {
        return ioFailure("read error on " + request.local_path);
    }

    payload.clear();
    put_u32(payload, mtime);
    w = writeFrame(*stream, CMD_DONE, seq++, payload);
    if (w.is_err()) return ioFailure("DONE: " + w.error().message);

    // Wait for OKAY / FAIL
    FrameReader reader;
    Frame reply;
    uint8_t rbuf[512];
    while (!reader.next(reply)) {
        if (reader.corrupt()) return ioFailure("garbled reply");
        auto r = stream->readChunk(rbuf, sizeof(rbuf));
        if (r.is_err()) return ioFailure("reply: " + r.error().message);
        if (r.value() == 0) return ioFailure("channel closed before reply");
        reader.append(rbuf, r.value());
    }

    if (reply.cmd == CMD_FAIL) {
        std::string msg(reply.payload.begin(), reply.payload.end());
        return TransferError(TransferError::Reason::DeviceRejected, msg.empty() ? "device rejected file" : msg);
    }
    if (reply.cmd != CMD_OKAY) {
        return ioFailure(std::string("unexpected reply ") + cmd_name(reply.cmd));
    }

    SLOG_DEBUG("push", "Sent %llu bytes in %u frames", (unsigned long long)total, seq);
    return {};
}

void FilePusher::openOnDevice(const std::string& remote_path) {
    auto opened = link_->open(device_id_, ChannelKind::Control);
    if (opened.is_err()) {
        SLOG_WARN("push", "Cannot open %s on device: %s", remote_path.c_str(), opened.error().message.c_str());
        return;
    }
    std::unique_ptr<Stream> control = std::move(opened).value();

    std::vector<uint8_t> payload;
    put_string(payload, remote_path);
    put_string(payload, mimeForPath(remote_path));
    auto w = writeFrame(*control, CMD_OPEN_FILE, 0, payload);
    if (w.is_err()) {
        SLOG_WARN("push", "OPEN_FILE %s failed: %s", remote_path.c_str(), w.error().message.c_str());
    }
    control->close();
}

} // namespace scry
