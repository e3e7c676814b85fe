#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "audio/portaudio_capture.hpp"
#include "session/session_controller.hpp"
#include "stt/whisper_engine.hpp"

#include <optional>
#include <string>

struct DaemonConfig {
    std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";

    std::string bindIp = "127.0.0.1";
    int port = 3939;

    bool verbose = false;

    // Start a session right after the model loads
    std::optional<std::string> autoStartOptions;

    WhisperConfig whisper;
    PortAudioCapture::Config capture;
    SessionController::Config session;
};

// --model PATH --bind IP --port N --threads N --language CODE --channels N
// --start JSON --verbose. Throws SessionError(ConfigurationError).
DaemonConfig parseArgs(int argc, char** argv);

std::string usage(const char* program);

#endif
