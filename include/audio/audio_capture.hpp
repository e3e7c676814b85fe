#ifndef AUDIO_CAPTURE_HPP
#define AUDIO_CAPTURE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

struct AudioFormat {
    int sampleRate = 16000;
    int channelCount = 1;

    // Frames per delivered buffer (about 100 ms)
    int framesPerBuffer = 1600;
};

// Called on the capture thread with interleaved PCM16. The buffer is only
// valid for the duration of the call.
using FrameCallback = std::function<void(const int16_t* samples, std::size_t frameCount)>;

// Called on the capture thread when capture stops on its own.
using CaptureErrorCallback = std::function<void(const std::string& message)>;

// Microphone input. Failures are thrown as SessionError(AudioSubsystemError).
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    // Brings up the audio subsystem for a session.
    virtual void activate() = 0;
    virtual void deactivate() = 0;

    virtual bool requestPermission() = 0;

    // Reads the input device's format; falls back to 16 kHz when the
    // device reports no usable rate.
    virtual AudioFormat negotiateFormat() = 0;

    virtual void install(const AudioFormat& format, FrameCallback onFrame, CaptureErrorCallback onError) = 0;

    // Idempotent. No frame is delivered after it returns.
    virtual void remove() = 0;

    virtual bool isInstalled() const = 0;
};

#endif
