#ifndef RECOGNITION_ENGINE_HPP
#define RECOGNITION_ENGINE_HPP

#include "stt/grammar.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// One recognizer per session. Fed interleaved PCM16 at the session's format.
class RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    virtual void setWordTimestamps(bool enabled) = 0;

    // Returns true when the engine detected the end of an utterance; the
    // caller then reads finalResult(), otherwise partialResult().
    virtual bool acceptWaveform(const int16_t* samples, std::size_t frameCount) = 0;

    virtual std::string partialResult() = 0;
    virtual std::string finalResult() = 0;
};

class RecognitionModel {
public:
    virtual ~RecognitionModel() = default;

    // An empty grammar creates an unconstrained recognizer. Throws
    // SessionError on failure.
    virtual std::unique_ptr<RecognitionEngine> createRecognizer(int sampleRate, int channelCount,
                                                                const Grammar& grammar) = 0;
};

// Throws SessionError(ModelLoadError) when the model cannot be loaded.
using ModelLoader = std::function<std::unique_ptr<RecognitionModel>(const std::string& path)>;

#endif
