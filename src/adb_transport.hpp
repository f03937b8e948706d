// =============================================================================
// Scry - ADB Transport
// =============================================================================
// Transport backed by the host `adb` executable. Every sub-channel is its own
// adb child process, so channels never share a pipe:
//   Video    : adb exec-out screenrecord (raw H.264 Annex-B on stdout)
//   Control  : persistent `adb shell`, control frames become `input` lines
//   FilePush : adb exec-in "cat > path" per SEND..DONE sequence
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include <memory>
#include "transport.hpp"

namespace scry {

struct AdbTransportOptions {
    std::string adb_path = "adb";
    int busy_timeout_ms = 2000;     // control write stall -> DeviceBusy
    int file_close_timeout_ms = 30000;
    bool check_device_state = true; // `adb get-state` before opening a channel
};

class AdbTransport : public Transport {
public:
    explicit AdbTransport(AdbTransportOptions opts);

    Result<std::unique_ptr<Stream>> open(const std::string& device_id, ChannelKind kind,
                                         const VideoOptions& video) override;

    // Command lines, exposed for tests and logging
    std::vector<std::string> videoCommand(const std::string& device_id, const VideoOptions& video) const;
    std::vector<std::string> controlCommand(const std::string& device_id) const;
    std::vector<std::string> fileSinkCommand(const std::string& device_id,
                                             const std::string& remote_path) const;
    std::vector<std::string> stopRecorderCommand(const std::string& device_id) const;

private:
    Result<void> checkDevice(const std::string& device_id) const;

    AdbTransportOptions opts_;
};

} // namespace scry
