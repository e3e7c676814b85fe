#ifndef PCM_RESAMPLER_HPP
#define PCM_RESAMPLER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Downmixes interleaved PCM16 to mono floats in [-1, 1] and linearly
// resamples to a target rate. The fractional read position and the last
// input sample carry over between buffers, so consecutive buffers resample
// as one continuous stream.
class PcmResampler {
public:
    PcmResampler(int inputRate, int channelCount, int outputRate = 16000);

    void process(const int16_t* samples, std::size_t frameCount, std::vector<float>& out);

    void reset();

    int inputRate() const { return inputRate_; }
    int outputRate() const { return outputRate_; }

private:
    int inputRate_;
    int channelCount_;
    int outputRate_;

    double position_ = 0.0;
    float lastSample_ = 0.0f;
    bool haveLast_ = false;
};

#endif
