#include "audio/volume_meter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

// Constructor
VolumeMeter::VolumeMeter() : VolumeMeter(Config{}) {}

VolumeMeter::VolumeMeter(Config config, NowFn now) : config_(config), now_(std::move(now)) {
    if (!now_) now_ = [] { return Clock::now(); };
}

// RMS in dBFS clamped to [floorDb, 0], mapped onto [0, 1]
float VolumeMeter::normalizedLevel(const int16_t* samples, std::size_t sampleCount, float floorDb) {
    if (samples == nullptr || sampleCount == 0) return 0.0f;

    double acc = 0.0;
    for (std::size_t i = 0; i < sampleCount; ++i) {
        const double s = (double)samples[i] / 32767.0;
        acc += s * s;
    }
    const double rms = std::sqrt(acc / (double)sampleCount);
    const double db = std::clamp(20.0 * std::log10(std::max(rms, 1e-4)), (double)floorDb, 0.0);
    return (float)((db - floorDb) / -floorDb);
}

bool VolumeMeter::measure(const int16_t* samples, std::size_t sampleCount, float& level) {
    if (samples == nullptr || sampleCount == 0) return false;

    const Clock::time_point now = now_();
    if (emitted_ && now - lastEmit_ < config_.interval) return false;

    emitted_ = true;
    lastEmit_ = now;
    level = normalizedLevel(samples, sampleCount, config_.floorDb);
    return true;
}
