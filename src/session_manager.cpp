// =============================================================================
// Scry - Session Manager Implementation
// =============================================================================
#include "session_manager.hpp"
#include "event_bus.hpp"
#include "scry_log.hpp"

namespace scry {

SessionManager::SessionManager(std::shared_ptr<DeviceProvider> provider,
                               std::shared_ptr<Transport> transport,
                               video::DecoderFactory decoder_factory,
                               config::AppConfig cfg)
    : provider_(std::move(provider)),
      link_(std::make_shared<SharedLink>(std::move(transport))),
      decoder_factory_(std::move(decoder_factory)),
      cfg_(std::move(cfg)),
      machine_(cfg_.session.max_reconnect_attempts) {}

SessionManager::~SessionManager() {
    stop();
}

// =============================================================================
// State
// =============================================================================

bool SessionManager::transition(Trigger trigger, const std::string& message) {
    SessionStateEvent evt;
    SessionState from;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        from = machine_.state();
        if (!machine_.fire(trigger)) return false;
        if (trigger == Trigger::Start) {
            failure_ = FailureKind::None;
            last_error_.reset();
            candidates_.clear();
            device_id_.clear();
        }
        evt.device_id = device_id_;
        evt.state = static_cast<int>(machine_.state());
        evt.failure = static_cast<int>(failure_);
    }
    evt.message = message;

    SLOG_INFO("session", "%s -> %s%s%s", SessionStateMachine::stateName(from),
              SessionStateMachine::stateName(static_cast<SessionState>(evt.state)),
              message.empty() ? "" : ": ", message.c_str());
    bus().publish(evt);
    return true;
}

void SessionManager::surfaceFailure(FailureKind kind, const Error& cause) {
    SessionStateEvent evt;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        failure_ = kind;
        last_error_ = cause;
        evt.device_id = device_id_;
        evt.state = static_cast<int>(machine_.state());
    }
    evt.failure = static_cast<int>(kind);
    evt.message = cause.message;

    SLOG_ERROR("session", "Session failed (%s): %s", failureKindName(kind), cause.message.c_str());
    bus().publish(evt);
}

FailureKind SessionManager::classify(const Error& cause) {
    switch (cause.kind) {
        case ErrorKind::CaptureUnavailable: return FailureKind::CaptureDenied;
        case ErrorKind::Decode:             return FailureKind::DecodeFailed;
        default:                            return FailureKind::ConnectionLost;
    }
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return machine_.state();
}

FailureKind SessionManager::failure() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_;
}

std::optional<Error> SessionManager::lastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

std::vector<std::string> SessionManager::candidates() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return candidates_;
}

int SessionManager::reconnectAttempts() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return machine_.reconnectAttempts();
}

Device SessionManager::device() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    Device d;
    d.id = device_id_;
    switch (machine_.state()) {
        case SessionState::Connecting: d.state = DeviceState::Connecting; break;
        case SessionState::Streaming:  d.state = DeviceState::Streaming; break;
        case SessionState::Failed:     d.state = DeviceState::Failed; break;
        default:                       d.state = DeviceState::Disconnected; break;
    }
    return d;
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<SessionState> SessionManager::start() {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    if (!transition(Trigger::Start)) {
        return Error(ErrorKind::Config, std::string("cannot start a session that is ") +
                     SessionStateMachine::stateName(state()));
    }
    stopping_ = false;
    ensureSupervisor();

    auto listed = provider_->listDevices();
    if (listed.is_err()) {
        transition(Trigger::NoDevices, listed.error().message);
        surfaceFailure(FailureKind::ConnectionLost, listed.error());
        return listed.error();
    }

    const std::vector<std::string>& ids = listed.value();
    if (ids.empty()) {
        Error e(ErrorKind::Connection, "no device attached");
        transition(Trigger::NoDevices, e.message);
        surfaceFailure(FailureKind::ConnectionLost, e);
        return e;
    }

    if (ids.size() > 1) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            candidates_ = ids;
        }
        transition(Trigger::SeveralDevices, std::to_string(ids.size()) + " devices");
        DevicesDiscoveredEvent evt;
        evt.device_ids = ids;
        bus().publish(evt);
        return SessionState::AwaitingSelection;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        device_id_ = ids.front();
    }
    transition(Trigger::OneDevice, ids.front());
    auto r = connectLocked(ids.front());
    if (r.is_err()) {
        surfaceFailure(classify(r.error()), r.error());
        return r.error();
    }
    return SessionState::Streaming;
}

Result<SessionState> SessionManager::select(const std::string& device_id) {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (machine_.state() != SessionState::AwaitingSelection) {
            return Error(ErrorKind::Config, std::string("select() while ") +
                         SessionStateMachine::stateName(machine_.state()));
        }
        bool known = false;
        for (const auto& id : candidates_) {
            if (id == device_id) known = true;
        }
        if (!known) {
            return Error(ErrorKind::Config, "not a discovered device: " + device_id);
        }
        device_id_ = device_id;
    }

    transition(Trigger::Select, device_id);
    auto r = connectLocked(device_id);
    if (r.is_err()) {
        surfaceFailure(classify(r.error()), r.error());
        return r.error();
    }
    return SessionState::Streaming;
}

void SessionManager::stop() {
    stopping_ = true;
    {
        std::lock_guard<std::mutex> life(lifecycle_mutex_);
        teardownLocked();
        SessionState current = state();
        if (current != SessionState::Stopped && current != SessionState::Failed) transition(Trigger::Stop);
    }

    {
        std::lock_guard<std::mutex> lock(supervisor_mutex_);
        supervisor_shutdown_ = true;
    }
    supervisor_cv_.notify_all();
    if (supervisor_.joinable()) supervisor_.join();
}

Result<void> SessionManager::connectLocked(const std::string& device_id) {
    auto fail = [this](const Error& e) -> Result<void> {
        teardownLocked();
        transition(Trigger::Fatal, e.message);
        return e;
    };

    if (!decoder_factory_) return fail(Error(ErrorKind::Config, "no decoder factory"));

    auto control = link_->open(device_id, ChannelKind::Control);
    if (control.is_err()) return fail(control.error());
    control_ = std::shared_ptr<Stream>(std::move(control).value());

    VideoOptions options;
    options.width = cfg_.stream.width;
    options.height = cfg_.stream.height;
    options.bit_rate = cfg_.stream.bit_rate;
    auto source = video::VideoSource::start(*link_, device_id, options);
    if (source.is_err()) return fail(source.error());
    source_ = std::move(source).value();

    auto decoder = decoder_factory_();
    if (decoder.is_err()) return fail(decoder.error());
    decoder_ = std::move(decoder).value();

    auto dispatcher = std::make_shared<InputDispatcher>(
        control_, cfg_.input.swipe_step_ms, [this](const InputOutcome& o) { onInputOutcome(o); });
    dispatcher->start();
    {
        std::lock_guard<std::mutex> lock(dispatcher_mutex_);
        dispatcher_ = dispatcher;
    }

    pump_ = std::make_unique<video::DecodePump>(*source_, *decoder_, slot_,
                                                cfg_.session.max_consecutive_decode_errors);
    transition(Trigger::Connected, device_id);
    decode_thread_ = std::thread(&SessionManager::decodeLoop, this, pump_.get());
    return {};
}

void SessionManager::teardownLocked() {
    // 1. signal the workers
    if (pump_) pump_->requestStop();
    std::shared_ptr<InputDispatcher> dispatcher;
    {
        std::lock_guard<std::mutex> lock(dispatcher_mutex_);
        dispatcher.swap(dispatcher_);
    }
    if (dispatcher) dispatcher->requestStop();

    // 2. close channels so a blocked read or write returns
    if (source_) source_->stop();
    if (control_) control_->close();

    // 3. join
    if (dispatcher) dispatcher->stop();
    if (decode_thread_.joinable()) decode_thread_.join();

    pump_.reset();
    decoder_.reset();
    source_.reset();
    control_.reset();
    slot_.clear();

    // Failures raised by the workers while they were being torn down
    std::lock_guard<std::mutex> lock(supervisor_mutex_);
    pipeline_failure_.reset();
}

// =============================================================================
// Workers
// =============================================================================

void SessionManager::ensureSupervisor() {
    if (supervisor_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(supervisor_mutex_);
        supervisor_shutdown_ = false;
        pipeline_failure_.reset();
    }
    supervisor_ = std::thread(&SessionManager::supervisorLoop, this);
}

void SessionManager::decodeLoop(video::DecodePump* pump) {
    auto r = pump->run();
    if (r.is_ok() && r.value() == video::DecodePump::Exit::Stopped) return;
    if (stopping_.load()) return;

    reportPipelineFailure(r.is_err() ? r.error() : Error(ErrorKind::Connection, "video stream ended"));
}

void SessionManager::onInputOutcome(const InputOutcome& outcome) {
    // DeviceBusy is per event; a Connection error means the control channel is gone
    if (outcome.state != InputState::Failed || !outcome.error) return;
    if (outcome.error->kind != ErrorKind::Connection || stopping_.load()) return;
    reportPipelineFailure(*outcome.error);
}

void SessionManager::reportPipelineFailure(const Error& cause) {
    {
        std::lock_guard<std::mutex> lock(supervisor_mutex_);
        if (pipeline_failure_) return;
        pipeline_failure_ = cause;
    }
    supervisor_cv_.notify_one();
}

void SessionManager::supervisorLoop() {
    while (true) {
        Error cause;
        {
            std::unique_lock<std::mutex> lock(supervisor_mutex_);
            supervisor_cv_.wait(lock, [this] { return supervisor_shutdown_ || pipeline_failure_.has_value(); });
            if (supervisor_shutdown_) return;
            cause = *pipeline_failure_;
            pipeline_failure_.reset();
        }
        handlePipelineFailure(cause);
    }
}

void SessionManager::handlePipelineFailure(const Error& cause) {
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    if (stopping_.load() || state() != SessionState::Streaming) return;

    FailureKind kind = classify(cause);
    SLOG_WARN("session", "Stream failed (%s): %s", failureKindName(kind), cause.message.c_str());
    transition(Trigger::Fatal, cause.message);
    teardownLocked();

    // A refused capture will be refused again
    if (kind == FailureKind::CaptureDenied || !transition(Trigger::Reconnect)) {
        surfaceFailure(kind, cause);
        return;
    }

    std::string device_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        device_id = device_id_;
    }
    SLOG_INFO("session", "Reconnecting to %s (attempt %d)", device_id.c_str(), reconnectAttempts());
    auto r = connectLocked(device_id);
    if (r.is_err()) surfaceFailure(classify(r.error()), r.error());
}

// =============================================================================
// Facade
// =============================================================================

Result<uint64_t> SessionManager::enqueue(InputEvent event) {
    std::shared_ptr<InputDispatcher> dispatcher;
    {
        std::lock_guard<std::mutex> lock(dispatcher_mutex_);
        dispatcher = dispatcher_;
    }
    if (!dispatcher) return Error(ErrorKind::Cancelled, "no streaming session");
    return dispatcher->enqueue(std::move(event));
}

std::future<Result<void, TransferError>> SessionManager::pushFile(const std::string& local_path) {
    std::string device_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        device_id = device_id_;
    }
    if (device_id.empty()) {
        std::promise<Result<void, TransferError>> done;
        done.set_value(Result<void, TransferError>(
            TransferError(TransferError::Reason::IOFailure, "no device selected")));
        return done.get_future();
    }
    FilePusher pusher(link_, device_id, cfg_.transfer);
    return pusher.submit(pusher.requestFor(local_path));
}

} // namespace scry
