// =============================================================================
// Scry - Session Manager
// =============================================================================
// Owns one mirroring session: device selection, the channels, the decode
// thread, the input dispatcher and the supervisor that reacts to fatal stream
// failures with at most the configured number of reconnects.
//
// Threads per session:
//   decode      VideoSource -> FrameDecoder -> FrameSlot (DecodePump::run)
//   input       InputDispatcher worker
//   supervisor  tears down and reconnects after a fatal pipeline failure
//               (decode escalation, video stream ended, control channel lost)
// =============================================================================
#pragma once

#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config_loader.hpp"
#include "device_provider.hpp"
#include "file_pusher.hpp"
#include "frame_slot.hpp"
#include "input_dispatcher.hpp"
#include "input_event.hpp"
#include "result.hpp"
#include "session_state.hpp"
#include "transport.hpp"
#include "video/decode_pump.hpp"
#include "video/frame_decoder.hpp"
#include "video/video_source.hpp"

namespace scry {

class SessionManager {
public:
    SessionManager(std::shared_ptr<DeviceProvider> provider,
                   std::shared_ptr<Transport> transport,
                   video::DecoderFactory decoder_factory,
                   config::AppConfig cfg);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Enumerates devices and, with exactly one, connects to it.
     * Returns the resulting state (Streaming or AwaitingSelection). Errors:
     *   Config             - called while a session is already active
     *   Connection         - no device, or the connect failed
     *   CaptureUnavailable - the device refused screen capture
     * A failed start leaves the session in Failed with failure() set.
     */
    Result<SessionState> start();

    // Connects to one of candidates(). Only valid in AwaitingSelection.
    Result<SessionState> select(const std::string& device_id);

    // Stops the workers, closes every channel, joins all threads. Idempotent.
    // A surfaced failure stays Failed; any other state ends in Stopped.
    void stop();

    SessionState state() const;
    FailureKind failure() const;                 // None until a failure is surfaced
    std::optional<Error> lastError() const;
    std::vector<std::string> candidates() const;
    Device device() const;
    int reconnectAttempts() const;

    // Render consumer: latest frame since the previous call, never blocks on decode
    std::optional<video::DecodedFrame> takeLatestFrame() { return slot_.takeLatest(); }
    const FrameSlot& frames() const { return slot_; }

    // Cancelled when no session is streaming
    Result<uint64_t> enqueue(InputEvent event);

    // Copies local_path into the configured download directory and opens it
    std::future<Result<void, TransferError>> pushFile(const std::string& local_path);

private:
    using Trigger = SessionTrigger;

    bool transition(Trigger trigger, const std::string& message = "");
    void surfaceFailure(FailureKind kind, const Error& cause);
    static FailureKind classify(const Error& cause);

    // Caller holds lifecycle_mutex_ and the machine is in Connecting
    Result<void> connectLocked(const std::string& device_id);
    void teardownLocked();

    void ensureSupervisor();
    void decodeLoop(video::DecodePump* pump);
    void onInputOutcome(const InputOutcome& outcome);
    void reportPipelineFailure(const Error& cause);
    void supervisorLoop();
    void handlePipelineFailure(const Error& cause);

    std::shared_ptr<DeviceProvider> provider_;
    std::shared_ptr<SharedLink> link_;
    video::DecoderFactory decoder_factory_;
    config::AppConfig cfg_;

    // State, guarded by state_mutex_ (held only for reads and single transitions)
    mutable std::mutex state_mutex_;
    SessionStateMachine machine_;
    FailureKind failure_ = FailureKind::None;
    std::optional<Error> last_error_;
    std::vector<std::string> candidates_;
    std::string device_id_;

    // Serializes connect / teardown between callers and the supervisor
    std::mutex lifecycle_mutex_;
    std::atomic<bool> stopping_{false};

    std::shared_ptr<Stream> control_;
    std::unique_ptr<video::VideoSource> source_;
    std::unique_ptr<video::FrameDecoder> decoder_;
    std::unique_ptr<video::DecodePump> pump_;
    std::thread decode_thread_;
    FrameSlot slot_;

    mutable std::mutex dispatcher_mutex_;
    std::shared_ptr<InputDispatcher> dispatcher_;

    std::mutex supervisor_mutex_;
    std::condition_variable supervisor_cv_;
    std::optional<Error> pipeline_failure_;
    bool supervisor_shutdown_ = false;
    std::thread supervisor_;
};

} // namespace scry
