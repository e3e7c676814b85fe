#ifndef SESSION_CONTROLLER_HPP
#define SESSION_CONTROLLER_HPP

#include "audio/audio_capture.hpp"
#include "audio/volume_meter.hpp"
#include "audio/waveform_writer.hpp"
#include "core/errors.hpp"
#include "session/event_bus.hpp"
#include "session/serial_queue.hpp"
#include "session/start_options.hpp"
#include "session/timeout_scheduler.hpp"
#include "stt/recognition_engine.hpp"
#include "stt/result_router.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class SessionState {
    Idle,
    Starting,
    Listening,
    Paused,
    Stopping,
    Stopped
};

const char* sessionStateName(SessionState state);

// Owns the recognition lifecycle: the microphone tap, the recognizer, the
// timeout and the waveform writer of at most one live session.
//
// Every transition runs under one mutex. Frames are copied on the capture
// thread and processed in order on a single worker; events go out on the
// event bus thread.
class SessionController {
public:
    struct Config {
        // Frames allowed to wait on the processing queue
        std::size_t maxPendingFrames = 64;

        VolumeMeter::Config volume;
    };

    SessionController(ModelLoader loader, std::unique_ptr<AudioCapture> capture);
    SessionController(ModelLoader loader, std::unique_ptr<AudioCapture> capture, Config config);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    Outcome loadModel(const std::string& path);
    Outcome start(const StartOptions& options = StartOptions{});
    void stop();
    void pause();
    bool resume();
    void unload();

    SessionState state() const { return state_.load(); }
    bool isModelLoaded() const;

    EventBus& events() { return bus_; }

    // Waits for queued frames and then for queued events. Must not be
    // called from an event listener.
    void waitForIdle();

private:
    // Resources of the live session, released by teardown.
    struct ActiveSession {
        ActiveSession(uint64_t gen, EventBus& bus, VolumeMeter::Config volume)
            : generation(gen), meter(volume), router(bus) {}

        uint64_t generation;
        AudioFormat format;
        StartOptions options;

        std::unique_ptr<RecognitionEngine> engine;
        std::unique_ptr<WaveformWriter> writer;
        VolumeMeter meter;
        ResultRouter router;

        CancellationTokenPtr timeout;
    };

    void onFrame(const std::shared_ptr<ActiveSession>& session, const int16_t* samples, std::size_t frameCount);
    void processFrame(ActiveSession& session, const std::vector<int16_t>& frame);

    void onCaptureError(uint64_t generation, const std::string& message);
    void onTimeout(uint64_t generation, const CancellationTokenPtr& token);

    void teardownLocked(bool withoutEvents);

    ModelLoader loader_;
    std::unique_ptr<AudioCapture> capture_;
    Config config_;

    mutable std::mutex mutex_;
    std::atomic<SessionState> state_{SessionState::Idle};
    std::unique_ptr<RecognitionModel> model_;
    std::shared_ptr<ActiveSession> session_;
    uint64_t generation_ = 0;

    EventBus bus_;
    SerialQueue processing_;
    TimeoutScheduler timer_;

    // Timeout expiry and capture failures are handled here, off the
    // threads that detected them.
    SerialQueue control_;
};

#endif
