#ifndef WHISPER_ENGINE_HPP
#define WHISPER_ENGINE_HPP

#include "audio/endpoint_detector.hpp"
#include "audio/pcm_resampler.hpp"
#include "stt/recognition_engine.hpp"

#include <memory>
#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;

struct WhisperConfig {
    int threads = 4;
    std::string language = "en";
    bool useGpu = false;

    // Minimum amount of new speech between two partial decodes.
    int partialIntervalMs = 1000;

    float noSpeechThreshold = 0.6f;

    EndpointDetector::Config endpoint;
};

// A loaded whisper.cpp model. Recognizers share the context and own a
// decoding state each.
class WhisperModel : public RecognitionModel {
public:
    WhisperModel(const std::string& modelPath, WhisperConfig config);
    ~WhisperModel() override;

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    std::unique_ptr<RecognitionEngine> createRecognizer(int sampleRate, int channelCount,
                                                        const Grammar& grammar) override;

    static ModelLoader loader(WhisperConfig config);

private:
    whisper_context* context_ = nullptr;
    WhisperConfig config_;
};

// Streams audio into whisper: resamples to 16 kHz mono, segments utterances
// with the endpoint detector and decodes partial and final hypotheses.
class WhisperRecognizer : public RecognitionEngine {
public:
    WhisperRecognizer(whisper_context* context, int sampleRate, int channelCount,
                      Grammar grammar, WhisperConfig config);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    void setWordTimestamps(bool enabled) override { wordTimestamps_ = enabled; }

    bool acceptWaveform(const int16_t* samples, std::size_t frameCount) override;

    std::string partialResult() override;
    std::string finalResult() override;

private:
    static constexpr int kWhisperRate = 16000;

    bool decode(const std::vector<float>& pcm, bool withTimestamps);
    std::string decodedText() const;
    std::vector<WordTimestamp> decodedWords(double offsetSec) const;

    whisper_context* context_;
    whisper_state* state_ = nullptr;

    Grammar grammar_;
    std::string prompt_;
    WhisperConfig config_;
    bool wordTimestamps_ = false;

    PcmResampler resampler_;
    EndpointDetector detector_;

    int64_t samplesSincePartial_ = 0;
    std::string partialText_;
    std::string finalDocument_;
};

#endif
