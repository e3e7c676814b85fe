#include "session/start_options.hpp"
#include "audio/waveform_writer.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

namespace {

ErrorKind kindOf(const std::string& text) {
    try {
        parseStartOptions(text);
    } catch (const SessionError& e) {
        return e.kind();
    }
    return ErrorKind::None;
}

}

TEST(StartOptionsTest, EmptyTextGivesDefaults) {
    const StartOptions options = parseStartOptions(std::string());
    EXPECT_TRUE(options.grammar.empty());
    EXPECT_FALSE(options.timeoutMs);
    EXPECT_FALSE(options.audioFilePath);
}

TEST(StartOptionsTest, ParsesAllFields) {
    const StartOptions options = parseStartOptions(
        std::string(R"({"grammar": ["yes", "no", "[unk]"], "timeout": 5000, "audioFilePath": "/tmp/take.wav"})"));
    EXPECT_EQ((std::vector<std::string>{"yes", "no", "[unk]"}), options.grammar);
    ASSERT_TRUE(options.timeoutMs);
    EXPECT_EQ(5000, *options.timeoutMs);
    ASSERT_TRUE(options.audioFilePath);
    EXPECT_EQ("/tmp/take.wav", *options.audioFilePath);
}

TEST(StartOptionsTest, AcceptsTimeoutMsSpelling) {
    const StartOptions options = parseStartOptions(std::string(R"({"timeoutMs": 100})"));
    ASSERT_TRUE(options.timeoutMs);
    EXPECT_EQ(100, *options.timeoutMs);
}

TEST(StartOptionsTest, NullFieldsAreUnset) {
    const StartOptions options =
        parseStartOptions(std::string(R"({"grammar": null, "timeout": null, "audioFilePath": null})"));
    EXPECT_TRUE(options.grammar.empty());
    EXPECT_FALSE(options.timeoutMs);
    EXPECT_FALSE(options.audioFilePath);
}

TEST(StartOptionsTest, StripsFileScheme) {
    const StartOptions options = parseStartOptions(std::string(R"({"audioFilePath": "file:///data/take.wav"})"));
    ASSERT_TRUE(options.audioFilePath);
    EXPECT_EQ("/data/take.wav", *options.audioFilePath);
}

TEST(StartOptionsTest, ParsedPathMatchesWriterPath) {
    const std::string raw = "file:///data/sub/take.wav";
    const StartOptions options = parseStartOptions(nlohmann::json{{"audioFilePath", raw}});
    ASSERT_TRUE(options.audioFilePath);
    EXPECT_EQ(WaveformWriter::stripFileScheme(raw), *options.audioFilePath);
}

TEST(StartOptionsTest, RejectsMalformedOptions) {
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf("{"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf("[1, 2]"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf(R"({"grammar": "yes"})"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf(R"({"grammar": ["yes", 3]})"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf(R"({"grammar": [""]})"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf(R"({"timeout": "soon"})"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf(R"({"timeout": 1.5})"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf(R"({"timeout": -1})"));
    EXPECT_EQ(ErrorKind::ConfigurationError, kindOf(R"({"audioFilePath": 7})"));
}

TEST(StartOptionsTest, ErrorMessageNamesTheProblem) {
    try {
        parseStartOptions(std::string(R"({"timeout": -5})"));
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(std::string("invalid start options: timeout out of range"), e.what());
    }
}

TEST(StartOptionsTest, ValidateRejectsNegativeTimeout) {
    StartOptions options;
    options.timeoutMs = -1;
    EXPECT_THROW(validateStartOptions(options), SessionError);

    options.timeoutMs = 0;
    EXPECT_NO_THROW(validateStartOptions(options));
}
