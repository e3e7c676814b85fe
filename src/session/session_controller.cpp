#include "session/session_controller.hpp"
#include "core/log.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

const char* kTag = "Session";

}

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Starting: return "Starting";
        case SessionState::Listening: return "Listening";
        case SessionState::Paused: return "Paused";
        case SessionState::Stopping: return "Stopping";
        case SessionState::Stopped: return "Stopped";
    }
    return "Unknown";
}

// Constructor
SessionController::SessionController(ModelLoader loader, std::unique_ptr<AudioCapture> capture)
    : SessionController(std::move(loader), std::move(capture), Config{}) {}

SessionController::SessionController(ModelLoader loader, std::unique_ptr<AudioCapture> capture, Config config)
    : loader_(std::move(loader)),
      capture_(std::move(capture)),
      config_(config),
      processing_("Processing", config_.maxPendingFrames),
      control_("Session Control") {
    if (!capture_) throw std::invalid_argument("SessionController requires an audio capture");
}

// Destructor
SessionController::~SessionController() {
    timer_.cancel();
    control_.stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        teardownLocked(true);
        model_.reset();
    }
    processing_.stop();
    bus_.shutdown();
}

bool SessionController::isModelLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_ != nullptr;
}

// Replaces the loaded model; a live session is torn down silently first
Outcome SessionController::loadModel(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    teardownLocked(true);
    model_.reset();

    try {
        std::unique_ptr<RecognitionModel> model;
        if (loader_) model = loader_(path);
        if (!model) return Outcome::failure(ErrorKind::ModelLoadError, "Failed to load model: " + path);
        model_ = std::move(model);
    } catch (const SessionError& e) {
        logError(kTag, e.what());
        return Outcome::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        logError(kTag, e.what());
        return Outcome::failure(ErrorKind::ModelLoadError, std::string("Error loading model: ") + e.what());
    }

    logInfo(kTag, "model ready: " + path);
    return Outcome::success();
}

Outcome SessionController::start(const StartOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!model_) return Outcome::failure(ErrorKind::ConfigurationError, "No model loaded");

    try {
        validateStartOptions(options);
    } catch (const SessionError& e) {
        return Outcome::failure(e.kind(), e.what());
    }

    // The previous session is released before anything new is acquired,
    // including its writer finalize, which may target the same path
    teardownLocked(true);
    processing_.drain();

    state_ = SessionState::Starting;
    auto session = std::make_shared<ActiveSession>(++generation_, bus_, config_.volume);
    session->options = options;
    session_ = session;
    const uint64_t generation = session->generation;

    try {
        if (!capture_->requestPermission()) {
            session_.reset();
            state_ = SessionState::Stopped;
            return Outcome::failure(ErrorKind::PermissionDenied, "Microphone permission denied");
        }

        capture_->activate();
        session->format = capture_->negotiateFormat();

        session->engine = model_->createRecognizer(session->format.sampleRate, session->format.channelCount,
                                                   Grammar(options.grammar));
        if (!session->engine) throw SessionError(ErrorKind::AudioSubsystemError, "Failed to create recognizer");
        session->engine->setWordTimestamps(true);

        if (options.audioFilePath) {
            session->writer = WaveformWriter::open(*options.audioFilePath, session->format.sampleRate,
                                                   session->format.channelCount);
            if (!session->writer) {
                logWarn(kTag, std::string(errorKindName(ErrorKind::PersistenceError)) +
                              ": recording continues without saving to " + *options.audioFilePath);
            }
        }

        capture_->install(
            session->format,
            [this, session](const int16_t* samples, std::size_t frameCount) { onFrame(session, samples, frameCount); },
            [this, generation](const std::string& message) {
                control_.post([this, generation, message] { onCaptureError(generation, message); });
            });

        state_ = SessionState::Listening;

        if (options.timeoutMs) {
            session->timeout = timer_.schedule(
                std::chrono::milliseconds(*options.timeoutMs),
                [this, generation](const CancellationTokenPtr& token) {
                    control_.post([this, generation, token] { onTimeout(generation, token); });
                });
        }
    } catch (const SessionError& e) {
        logError(kTag, std::string("start failed: ") + e.what());
        if (e.kind() == ErrorKind::AudioSubsystemError) bus_.emitError(std::string("Unable to start audio: ") + e.what());
        teardownLocked(true);
        state_ = SessionState::Stopped;
        return Outcome::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        logError(kTag, std::string("start failed: ") + e.what());
        bus_.emitError(std::string("Unable to start audio: ") + e.what());
        teardownLocked(true);
        state_ = SessionState::Stopped;
        return Outcome::failure(ErrorKind::AudioSubsystemError, std::string("Error starting session: ") + e.what());
    }

    logInfo(kTag, "listening at " + std::to_string(session->format.sampleRate) + " Hz, " +
                  std::to_string(session->format.channelCount) + " ch");
    return Outcome::success();
}

void SessionController::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    teardownLocked(false);
}

void SessionController::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Listening) return;

    state_ = SessionState::Paused;
    if (session_ && session_->timeout) session_->timeout->cancel();
    timer_.cancel();
}

bool SessionController::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Paused) return false;

    state_ = SessionState::Listening;
    return true;
}

void SessionController::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    teardownLocked(false);
    model_.reset();
    state_ = SessionState::Idle;
}

void SessionController::waitForIdle() {
    control_.drain();
    processing_.drain();
    bus_.flush();
}

// Capture thread: copy and hand off, nothing else
void SessionController::onFrame(const std::shared_ptr<ActiveSession>& session, const int16_t* samples,
                                std::size_t frameCount) {
    if (state_.load() != SessionState::Listening || samples == nullptr || frameCount == 0) return;

    std::vector<int16_t> frame(samples, samples + frameCount * (std::size_t)session->format.channelCount);
    processing_.tryPost([this, session, frame] { processFrame(*session, frame); });
}

// Processing queue
void SessionController::processFrame(ActiveSession& session, const std::vector<int16_t>& frame) {
    const std::size_t frameCount = frame.size() / (std::size_t)session.format.channelCount;
    if (frameCount == 0) return;

    float level = 0.0f;
    if (session.meter.measure(frame.data(), frame.size(), level)) bus_.emitVolume(level);

    if (session.writer) session.writer->append(frame.data(), frameCount);

    if (!session.engine) return;
    try {
        const bool isFinal = session.engine->acceptWaveform(frame.data(), frameCount);
        session.router.route(isFinal ? session.engine->finalResult() : session.engine->partialResult(), isFinal);
    } catch (const SessionError& e) {
        logWarn(kTag, std::string(errorKindName(e.kind())) + ": " + e.what());
    }
}

void SessionController::onCaptureError(uint64_t generation, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || session_->generation != generation) return;

    bus_.emitError(message);
    teardownLocked(true);
}

void SessionController::onTimeout(uint64_t generation, const CancellationTokenPtr& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || session_->generation != generation || token->isCancelled()) return;

    logInfo(kTag, "timeout reached");
    teardownLocked(true);
    bus_.emitTimeout();
}

// Order: tap, audio stream, queued frames, final flush, writer, recognizer,
// timeout, audio session
void SessionController::teardownLocked(bool withoutEvents) {
    std::shared_ptr<ActiveSession> session = session_;
    if (!session) return;

    state_ = SessionState::Stopping;

    capture_->remove();
    processing_.drain();

    if (!withoutEvents && bus_.hasListeners()) {
        std::optional<RecognitionResult> pending = session->router.takePending();
        if (pending) bus_.emitFinalResult(*pending);
    }

    if (session->writer) {
        std::shared_ptr<WaveformWriter> writer(std::move(session->writer));
        processing_.post([writer] { writer->finalize(); });
    }

    session->engine.reset();

    if (session->timeout) session->timeout->cancel();
    timer_.cancel();

    capture_->deactivate();

    session_.reset();
    state_ = SessionState::Stopped;
}
