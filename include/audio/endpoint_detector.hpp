#ifndef ENDPOINT_DETECTOR_HPP
#define ENDPOINT_DETECTOR_HPP

#include <cstdint>
#include <vector>

// Energy-based utterance segmentation with start/stop hysteresis. Collects the
// samples of the current utterance (with pre-roll) until trailing silence or
// the maximum utterance length ends it.
class EndpointDetector {
public:
    struct Config {
        int sampleRate = 16000;

        float vadStartRms = 0.014f;
        float vadStopRms = 0.011f;
        int startHangMs = 80;
        int stopHangMs = 550;

        int maxUtteranceMs = 12000;
        int preRollMs = 250;
    };

    enum class Event {
        None,
        SpeechStarted,
        Speech,
        UtteranceEnded
    };

    explicit EndpointDetector(Config config);

    // samples are mono floats in [-1, 1] at config.sampleRate.
    Event feed(const float* samples, int count);

    bool inSpeech() const { return inSpeech_; }

    // Samples of the running (or just ended) utterance.
    const std::vector<float>& utterance() const { return utterance_; }

    // Offset of utterance()[0] from the first sample ever fed, in samples.
    int64_t utteranceStartSample() const { return utteranceStart_; }

    // Drops the collected utterance; keeps the running sample position.
    void clearUtterance();

    void reset();

private:
    float rms(const float* x, int n) const;
    void pushPreRoll(const float* x, int n);
    int millis(int samples) const;

    Config config_;

    bool inSpeech_ = false;
    int speechMs_ = 0;
    int silenceMs_ = 0;
    int utteranceMs_ = 0;

    int64_t position_ = 0;
    int64_t utteranceStart_ = 0;

    std::vector<float> preRoll_;
    std::vector<float> utterance_;
};

#endif
