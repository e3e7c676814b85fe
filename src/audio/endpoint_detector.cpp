#include "audio/endpoint_detector.hpp"

#include <algorithm>
#include <cmath>

// Constructor
EndpointDetector::EndpointDetector(Config config) : config_(config) {
    preRoll_.reserve((config_.preRollMs * config_.sampleRate) / 1000);
    utterance_.reserve((config_.maxUtteranceMs * config_.sampleRate) / 1000);
}

void EndpointDetector::reset() {
    inSpeech_ = false;
    speechMs_ = 0;
    silenceMs_ = 0;
    utteranceMs_ = 0;
    position_ = 0;
    utteranceStart_ = 0;
    preRoll_.clear();
    utterance_.clear();
}

void EndpointDetector::clearUtterance() {
    utterance_.clear();
    utteranceMs_ = 0;
}

float EndpointDetector::rms(const float* x, int n) const {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

int EndpointDetector::millis(int samples) const {
    return (int)std::lround(1000.0 * samples / config_.sampleRate);
}

void EndpointDetector::pushPreRoll(const float* x, int n) {
    const int maxPre = (config_.preRollMs * config_.sampleRate) / 1000;
    preRoll_.insert(preRoll_.end(), x, x + n);
    if ((int)preRoll_.size() > maxPre) {
        const int extra = (int)preRoll_.size() - maxPre;
        preRoll_.erase(preRoll_.begin(), preRoll_.begin() + extra);
    }
}

EndpointDetector::Event EndpointDetector::feed(const float* samples, int count) {
    if (samples == nullptr || count <= 0) return Event::None;

    const int ms = millis(count);
    const float r = rms(samples, count);
    const int64_t chunkStart = position_;
    position_ += count;

    if (!inSpeech_) {
        pushPreRoll(samples, count);
        if (r < config_.vadStartRms) {
            speechMs_ = 0;
            return Event::None;
        }

        speechMs_ += ms;
        if (speechMs_ < config_.startHangMs) return Event::None;

        inSpeech_ = true;
        silenceMs_ = 0;
        utterance_.clear();
        utterance_.insert(utterance_.end(), preRoll_.begin(), preRoll_.end());
        utteranceStart_ = chunkStart + count - (int64_t)preRoll_.size();
        utteranceMs_ = millis((int)utterance_.size());
        preRoll_.clear();
        return Event::SpeechStarted;
    }

    utterance_.insert(utterance_.end(), samples, samples + count);
    utteranceMs_ += ms;

    bool ended = false;
    if (r <= config_.vadStopRms) {
        silenceMs_ += ms;
        if (silenceMs_ >= config_.stopHangMs) ended = true;
    } else {
        silenceMs_ = 0;
    }

    if (utteranceMs_ >= config_.maxUtteranceMs) ended = true;

    if (ended) {
        inSpeech_ = false;
        speechMs_ = 0;
        silenceMs_ = 0;
        return Event::UtteranceEnded;
    }
    return Event::Speech;
}
