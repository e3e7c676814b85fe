#include "audio/pcm_resampler.hpp"

#include <utility>

// Constructor
PcmResampler::PcmResampler(int inputRate, int channelCount, int outputRate)
    : inputRate_(inputRate), channelCount_(channelCount), outputRate_(outputRate) {}

void PcmResampler::reset() {
    position_ = 0.0;
    lastSample_ = 0.0f;
    haveLast_ = false;
}

void PcmResampler::process(const int16_t* samples, std::size_t frameCount, std::vector<float>& out) {
    out.clear();
    if (samples == nullptr || frameCount == 0 || channelCount_ <= 0) return;

    std::vector<float> mono(frameCount);
    for (std::size_t i = 0; i < frameCount; ++i) {
        int32_t sum = 0;
        for (int c = 0; c < channelCount_; ++c) sum += samples[i * channelCount_ + c];
        mono[i] = (float)sum / (32768.0f * channelCount_);
    }

    if (inputRate_ == outputRate_) {
        out = std::move(mono);
        return;
    }

    // ext[0] is the previous buffer's last sample, still owed an interpolation
    std::vector<float> ext;
    ext.reserve(mono.size() + 1);
    if (haveLast_) ext.push_back(lastSample_);
    ext.insert(ext.end(), mono.begin(), mono.end());

    const double step = (double)inputRate_ / outputRate_;
    double pos = position_;
    out.reserve((std::size_t)(ext.size() / step) + 1);
    while (pos + 1.0 < (double)ext.size()) {
        const std::size_t i = (std::size_t)pos;
        const float frac = (float)(pos - (double)i);
        out.push_back(ext[i] * (1.0f - frac) + ext[i + 1] * frac);
        pos += step;
    }

    position_ = pos - (double)(ext.size() - 1);
    lastSample_ = ext.back();
    haveLast_ = true;
}
