// =============================================================================
// Scry - File Pusher
// =============================================================================
// Copies a local file into the device's download directory over its own
// FilePush channel, then asks the device to index and open it. Transfers are
// independent of the session: they never touch the input queue or session
// state, and a failed transfer affects nothing but its own result.
// =============================================================================
#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "config_loader.hpp"
#include "result.hpp"
#include "transport.hpp"

namespace scry {

struct TransferRequest {
    std::string local_path;
    std::string remote_path;
};

class FilePusher {
public:
    FilePusher(std::shared_ptr<SharedLink> link, std::string device_id, config::TransferConfig cfg);

    // download_dir + file name of local_path
    TransferRequest requestFor(const std::string& local_path) const;

    /**
     * Synchronous push. Errors (TransferError::reason):
     *   PathInvalid    - local file missing / not a regular file, or remote
     *                    path outside the allowed directories
     *   IOFailure      - local read failed, channel could not be opened or
     *                    written, or closed before replying
     *   DeviceRejected - device answered FAIL
     * Publishes TransferFinishedEvent either way.
     */
    Result<void, TransferError> push(const TransferRequest& request);

    // push() on its own thread
    std::future<Result<void, TransferError>> submit(TransferRequest request);

    // "image/*" for .jpg/.png, "video/*" for .mp4, else "*/*"
    static std::string mimeForPath(const std::string& path);

private:
    Result<void, TransferError> transfer(const TransferRequest& request);
    void openOnDevice(const std::string& remote_path);

    std::shared_ptr<SharedLink> link_;
    std::string device_id_;
    config::TransferConfig cfg_;
};

} // namespace scry
