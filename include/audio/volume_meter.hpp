#ifndef VOLUME_METER_HPP
#define VOLUME_METER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

// Loudness of PCM16 frames normalized to [0, 1], emitted at most once per
// interval of wall-clock time.
class VolumeMeter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Config {
        std::chrono::milliseconds interval{100};
        float floorDb = -60.0f;
    };

    VolumeMeter();
    explicit VolumeMeter(Config config, NowFn now = nullptr);

    // Returns true and sets level when an emission is due.
    bool measure(const int16_t* samples, std::size_t sampleCount, float& level);

    static float normalizedLevel(const int16_t* samples, std::size_t sampleCount, float floorDb = -60.0f);

private:
    Config config_;
    NowFn now_;
    bool emitted_ = false;
    Clock::time_point lastEmit_;
};

#endif
