#include "audio/waveform_writer.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace {

std::vector<unsigned char> readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

uint32_t u32At(const std::vector<unsigned char>& b, std::size_t off) {
    return (uint32_t)b[off] | ((uint32_t)b[off + 1] << 8) | ((uint32_t)b[off + 2] << 16) | ((uint32_t)b[off + 3] << 24);
}

uint16_t u16At(const std::vector<unsigned char>& b, std::size_t off) {
    return (uint16_t)(b[off] | (b[off + 1] << 8));
}

std::string tagAt(const std::vector<unsigned char>& b, std::size_t off) {
    return std::string(b.begin() + off, b.begin() + off + 4);
}

}

TEST(WaveformWriterTest, HeaderDescribesFormat) {
    const std::string path = tempPath("format.wav");
    auto writer = WaveformWriter::open(path, 44100, 2);
    ASSERT_TRUE(writer);
    writer->finalize();

    const auto bytes = readAll(path);
    ASSERT_EQ(WaveformWriter::kHeaderSize, bytes.size());
    EXPECT_EQ("RIFF", tagAt(bytes, 0));
    EXPECT_EQ("WAVE", tagAt(bytes, 8));
    EXPECT_EQ("fmt ", tagAt(bytes, 12));
    EXPECT_EQ(16u, u32At(bytes, 16));
    EXPECT_EQ(1u, u16At(bytes, 20));
    EXPECT_EQ(2u, u16At(bytes, 22));
    EXPECT_EQ(44100u, u32At(bytes, 24));
    EXPECT_EQ(44100u * 2 * 2, u32At(bytes, 28));
    EXPECT_EQ(4u, u16At(bytes, 32));
    EXPECT_EQ(16u, u16At(bytes, 34));
    EXPECT_EQ("data", tagAt(bytes, 36));
    EXPECT_EQ(36u, u32At(bytes, 4));
    EXPECT_EQ(0u, u32At(bytes, 40));
}

TEST(WaveformWriterTest, FinalizedSizesMatchAppendedFrames) {
    struct Case {
        int sampleRate;
        int channels;
        std::size_t frames;
        int appends;
    };
    const Case cases[] = {{16000, 1, 160, 5}, {48000, 2, 480, 3}, {8000, 1, 1, 1}, {22050, 2, 0, 4}};

    int n = 0;
    for (const Case& c : cases) {
        const std::string path = tempPath("sizes" + std::to_string(n++) + ".wav");
        auto writer = WaveformWriter::open(path, c.sampleRate, c.channels);
        ASSERT_TRUE(writer);

        std::vector<int16_t> samples(c.frames * c.channels, 1234);
        for (int i = 0; i < c.appends; ++i) writer->append(samples.data(), c.frames);
        writer->finalize();

        const uint32_t dataSize = (uint32_t)(c.appends * c.frames * c.channels * 2);
        const auto bytes = readAll(path);
        ASSERT_EQ(WaveformWriter::kHeaderSize + dataSize, bytes.size());
        EXPECT_EQ(36u + dataSize, u32At(bytes, 4));
        EXPECT_EQ(dataSize, u32At(bytes, 40));
        EXPECT_EQ((uint64_t)(c.appends * c.frames), writer->framesWritten());
    }
}

TEST(WaveformWriterTest, SamplesAreLittleEndian) {
    const std::string path = tempPath("samples.wav");
    auto writer = WaveformWriter::open(path, 16000, 1);
    ASSERT_TRUE(writer);

    const int16_t samples[] = {0x0102, -2};
    writer->append(samples, 2);
    writer->finalize();

    const auto bytes = readAll(path);
    ASSERT_EQ(WaveformWriter::kHeaderSize + 4, bytes.size());
    EXPECT_EQ(0x02, bytes[44]);
    EXPECT_EQ(0x01, bytes[45]);
    EXPECT_EQ(0xFE, bytes[46]);
    EXPECT_EQ(0xFF, bytes[47]);
}

TEST(WaveformWriterTest, FinalizeIsIdempotent) {
    const std::string path = tempPath("twice.wav");
    auto writer = WaveformWriter::open(path, 16000, 1);
    ASSERT_TRUE(writer);

    std::vector<int16_t> samples(100, 7);
    writer->append(samples.data(), samples.size());
    writer->finalize();
    const auto first = readAll(path);

    EXPECT_FALSE(writer->isOpen());
    writer->finalize();
    writer->append(samples.data(), samples.size());
    writer.reset();

    EXPECT_EQ(first, readAll(path));
}

TEST(WaveformWriterTest, DestructorFinalizes) {
    const std::string path = tempPath("dtor.wav");
    {
        auto writer = WaveformWriter::open(path, 16000, 1);
        ASSERT_TRUE(writer);
        std::vector<int16_t> samples(10, 1);
        writer->append(samples.data(), samples.size());
    }
    const auto bytes = readAll(path);
    EXPECT_EQ(20u, u32At(bytes, 40));
    EXPECT_EQ(56u, u32At(bytes, 4));
}

TEST(WaveformWriterTest, CreatesParentDirectoriesAndStripsFileScheme) {
    const std::string dir = tempPath("nested");
    const std::string path = dir + "/a/b/take.wav";
    auto writer = WaveformWriter::open("file://" + path, 16000, 1);
    ASSERT_TRUE(writer);
    EXPECT_EQ(path, writer->path());
    writer->finalize();
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(WaveformWriterTest, StripFileScheme) {
    EXPECT_EQ("/tmp/take.wav", WaveformWriter::stripFileScheme("file:///tmp/take.wav"));
    EXPECT_EQ("/tmp/take.wav", WaveformWriter::stripFileScheme("/tmp/take.wav"));
    EXPECT_EQ("take.wav", WaveformWriter::stripFileScheme("file://take.wav"));
    EXPECT_EQ("file:/tmp/take.wav", WaveformWriter::stripFileScheme("file:/tmp/take.wav"));
    EXPECT_EQ("", WaveformWriter::stripFileScheme(""));
}

TEST(WaveformWriterTest, UnwritablePathReturnsNull) {
    const std::string blocker = tempPath("blocker");
    std::ofstream(blocker) << "x";

    EXPECT_FALSE(WaveformWriter::open(blocker + "/take.wav", 16000, 1));
    EXPECT_FALSE(WaveformWriter::open(tempPath("bad.wav"), 0, 1));
}
