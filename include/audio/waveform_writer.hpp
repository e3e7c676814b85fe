#ifndef WAVEFORM_WRITER_HPP
#define WAVEFORM_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

// Streams interleaved PCM16 audio to a RIFF/WAVE file. The 44-byte header is
// written with placeholder sizes on open and patched on finalize().
class WaveformWriter {
public:
    static constexpr std::size_t kHeaderSize = 44;

    // Returns nullptr if the parent directory cannot be created or the file
    // cannot be opened for writing.
    static std::unique_ptr<WaveformWriter> open(const std::string& path, int sampleRate,
                                                int channelCount, int bitsPerSample = 16);

    ~WaveformWriter();

    WaveformWriter(const WaveformWriter&) = delete;
    WaveformWriter& operator=(const WaveformWriter&) = delete;

    // frameCount frames of channelCount interleaved samples each.
    void append(const int16_t* samples, std::size_t frameCount);

    // Idempotent.
    void finalize();

    // "file:///tmp/a.wav" -> "/tmp/a.wav"; other paths are returned unchanged.
    static std::string stripFileScheme(const std::string& path);

    bool isOpen() const { return open_; }
    uint64_t framesWritten() const { return totalFrames_; }
    const std::string& path() const { return path_; }

private:
    WaveformWriter(std::string path, int sampleRate, int channelCount, int bitsPerSample);

    void writeHeader();

    std::string path_;
    std::ofstream file_;
    bool open_ = false;

    int sampleRate_;
    int channelCount_;
    int bitsPerSample_;
    int blockAlign_;
    uint64_t totalFrames_ = 0;
};

#endif
