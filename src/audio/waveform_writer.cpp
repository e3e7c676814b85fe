#include "audio/waveform_writer.hpp"
#include "core/log.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace {

const char* kTag = "Waveform Writer";

void putU16(std::ostream& out, uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
    out.write(b, 2);
}

void putU32(std::ostream& out, uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                       static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
    out.write(b, 4);
}

}

std::string WaveformWriter::stripFileScheme(const std::string& path) {
    const std::string scheme = "file://";
    if (path.compare(0, scheme.size(), scheme) == 0) return path.substr(scheme.size());
    return path;
}

// Constructor
WaveformWriter::WaveformWriter(std::string path, int sampleRate, int channelCount, int bitsPerSample)
    : path_(std::move(path)),
      sampleRate_(sampleRate),
      channelCount_(channelCount),
      bitsPerSample_(bitsPerSample),
      blockAlign_(channelCount * (bitsPerSample / 8)) {}

// Destructor
WaveformWriter::~WaveformWriter() { finalize(); }

std::unique_ptr<WaveformWriter> WaveformWriter::open(const std::string& rawPath, int sampleRate,
                                                     int channelCount, int bitsPerSample) {
    const std::string path = stripFileScheme(rawPath);
    if (path.empty() || sampleRate <= 0 || channelCount <= 0 || bitsPerSample != 16) {
        logError(kTag, "invalid parameters for " + rawPath);
        return nullptr;
    }

    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            logError(kTag, "failed to create directory " + parent.string() + ": " + ec.message());
            return nullptr;
        }
    }

    std::unique_ptr<WaveformWriter> writer(new WaveformWriter(path, sampleRate, channelCount, bitsPerSample));
    writer->file_.open(path, std::ios::binary | std::ios::trunc);
    if (!writer->file_.is_open()) {
        logError(kTag, "failed to open " + path + " for writing");
        return nullptr;
    }

    writer->writeHeader();
    if (!writer->file_) {
        logError(kTag, "failed to write header to " + path);
        writer->file_.close();
        return nullptr;
    }

    writer->open_ = true;
    logInfo(kTag, "initialized " + path);
    return writer;
}

void WaveformWriter::writeHeader() {
    const uint32_t byteRate = static_cast<uint32_t>(sampleRate_) * static_cast<uint32_t>(blockAlign_);

    file_.write("RIFF", 4);
    putU32(file_, 36);
    file_.write("WAVE", 4);

    file_.write("fmt ", 4);
    putU32(file_, 16);
    putU16(file_, 1); // PCM
    putU16(file_, static_cast<uint16_t>(channelCount_));
    putU32(file_, static_cast<uint32_t>(sampleRate_));
    putU32(file_, byteRate);
    putU16(file_, static_cast<uint16_t>(blockAlign_));
    putU16(file_, static_cast<uint16_t>(bitsPerSample_));

    file_.write("data", 4);
    putU32(file_, 0);
    file_.flush();
}

// Appends frames as little-endian sample bytes
void WaveformWriter::append(const int16_t* samples, std::size_t frameCount) {
    if (!open_ || samples == nullptr || frameCount == 0) return;

    const std::size_t sampleCount = frameCount * static_cast<std::size_t>(channelCount_);
    std::vector<char> bytes(sampleCount * 2);
    for (std::size_t i = 0; i < sampleCount; ++i) {
        const uint16_t v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<char>(v & 0xff);
        bytes[2 * i + 1] = static_cast<char>((v >> 8) & 0xff);
    }

    file_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file_) {
        logError(kTag, "write failed on " + path_);
        return;
    }
    totalFrames_ += frameCount;
}

// Patches the RIFF and data chunk sizes, then closes the file
void WaveformWriter::finalize() {
    if (!open_) return;
    open_ = false;

    const uint32_t dataSize = static_cast<uint32_t>(totalFrames_ * static_cast<uint64_t>(blockAlign_));
    const uint32_t chunkSize = 36 + dataSize;

    file_.flush();
    file_.seekp(4, std::ios::beg);
    putU32(file_, chunkSize);
    file_.seekp(40, std::ios::beg);
    putU32(file_, dataSize);
    file_.close();

    if (file_.fail()) {
        logError(kTag, "failed to finalize " + path_);
        return;
    }
    logInfo(kTag, "finalized " + path_ + ". dataSize=" + std::to_string(dataSize) +
                  ", chunkSize=" + std::to_string(chunkSize) + ", frames=" + std::to_string(totalFrames_));
}
