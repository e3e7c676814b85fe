#ifndef PORTAUDIO_CAPTURE_HPP
#define PORTAUDIO_CAPTURE_HPP

#include "audio/audio_capture.hpp"

#include <atomic>
#include <thread>

typedef void PaStream;

// Default input device through PortAudio blocking reads on a capture thread.
class PortAudioCapture : public AudioCapture {
public:
    struct Config {
        int maxChannels = 1;
        int bufferMs = 100;
    };

    PortAudioCapture();
    explicit PortAudioCapture(Config config);
    ~PortAudioCapture() override;

    PortAudioCapture(const PortAudioCapture&) = delete;
    PortAudioCapture& operator=(const PortAudioCapture&) = delete;

    void activate() override;
    void deactivate() override;

    bool requestPermission() override { return true; }

    AudioFormat negotiateFormat() override;

    void install(const AudioFormat& format, FrameCallback onFrame, CaptureErrorCallback onError) override;
    void remove() override;

    bool isInstalled() const override { return stream_ != nullptr; }

private:
    void run();
    void closeStream();

    Config config_;
    bool active_ = false;

    PaStream* stream_ = nullptr;
    AudioFormat format_;
    FrameCallback onFrame_;
    CaptureErrorCallback onError_;

    std::thread thread_;
    std::atomic<bool> running_{false};
};

#endif
