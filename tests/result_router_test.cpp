#include "stt/result_router.hpp"
#include "stt/result_json.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

namespace {

class ResultRouterTest : public ::testing::Test {
protected:
    EventBus bus;
    EventRecorder recorder{bus};
    ResultRouter router{bus};

    std::vector<std::string> partials() {
        bus.flush();
        std::vector<std::string> out;
        for (const SessionEvent& e : recorder.of(EventType::PartialResult)) out.push_back(e.text);
        return out;
    }
};

}

TEST_F(ResultRouterTest, RepeatedPartialEmitsOnce) {
    router.route(encodePartial("hel"), false);
    router.route(encodePartial("hel"), false);
    router.route(encodePartial("hello"), false);
    router.route(encodePartial("hello"), false);

    EXPECT_EQ((std::vector<std::string>{"hel", "hello"}), partials());
}

TEST_F(ResultRouterTest, EmptyPartialNeverEmits) {
    router.route(encodePartial(""), false);
    router.route("{\"partial\": \"\"}", false);
    EXPECT_TRUE(partials().empty());
}

TEST_F(ResultRouterTest, PartialAfterEmptyPartialIsNew) {
    router.route(encodePartial("a"), false);
    router.route(encodePartial(""), false);
    router.route(encodePartial("a"), false);
    EXPECT_EQ((std::vector<std::string>{"a", "a"}), partials());
}

TEST_F(ResultRouterTest, FinalEmitsResultThenFinal) {
    WordTimestamp w;
    w.word = "hello";
    w.startSec = 0.5;
    w.endSec = 0.9;
    w.confidence = 0.8;
    router.route(encodeFinal("hello", {w}), true);
    bus.flush();

    const auto events = recorder.events();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(EventType::Result, events[0].type);
    EXPECT_EQ(EventType::FinalResult, events[1].type);
    ASSERT_TRUE(events[1].result.words);
    ASSERT_EQ(1u, events[1].result.words->size());
    EXPECT_EQ(w, events[1].result.words->front());
    EXPECT_EQ("hello", events[1].result.text);
}

TEST_F(ResultRouterTest, FinalWithoutWordsCarriesText) {
    router.route("{\"text\": \"just text\"}", true);
    bus.flush();

    const auto finals = recorder.of(EventType::FinalResult);
    ASSERT_EQ(1u, finals.size());
    EXPECT_FALSE(finals[0].result.words);
    EXPECT_EQ("just text", finals[0].result.text);
    EXPECT_EQ(nlohmann::json("just text"), resultBody(finals[0].result));
}

TEST_F(ResultRouterTest, SamePartialAfterFinalEmitsAgain) {
    router.route(encodePartial("go"), false);
    router.route("{\"text\": \"go\"}", true);
    router.route(encodePartial("go"), false);
    EXPECT_EQ((std::vector<std::string>{"go", "go"}), partials());
}

TEST_F(ResultRouterTest, MalformedOutputIsDropped) {
    router.route("not json", false);
    router.route("{\"text\": \"x\", \"result\": 5}", true);
    router.route("{\"text\": \"x\", \"result\": [{\"word\": 1}]}", true);
    bus.flush();

    EXPECT_TRUE(recorder.events().empty());
    EXPECT_EQ(3u, router.droppedCount());
    EXPECT_FALSE(router.last());
}

TEST_F(ResultRouterTest, TakePendingPromotesLastPartial) {
    router.route(encodePartial("almost"), false);

    auto pending = router.takePending();
    ASSERT_TRUE(pending);
    EXPECT_TRUE(pending->isFinal());
    EXPECT_EQ("almost", pending->text);
    EXPECT_FALSE(router.takePending());
}

TEST_F(ResultRouterTest, TakePendingKeepsFinalWords) {
    WordTimestamp w;
    w.word = "done";
    w.endSec = 0.4;
    router.route(encodePartial("do"), false);
    router.route(encodeFinal("done", {w}), true);

    auto pending = router.takePending();
    ASSERT_TRUE(pending);
    ASSERT_TRUE(pending->words);
    EXPECT_EQ(std::vector<WordTimestamp>{w}, *pending->words);
    EXPECT_FALSE(router.takePending());
}

TEST_F(ResultRouterTest, NothingPendingInitially) {
    EXPECT_FALSE(router.takePending());
}

TEST(ResultJsonTest, InvalidUtf8IsReplaced) {
    WordTimestamp w;
    w.word = "caf\xC3";
    std::string doc;
    ASSERT_NO_THROW(doc = encodeFinal("caf\xC3", {w}));

    const RecognitionResult result = decodeEngineOutput(doc, true);
    EXPECT_EQ("caf\xEF\xBF\xBD", result.text);
    ASSERT_TRUE(result.words);
    EXPECT_EQ("caf\xEF\xBF\xBD", (*result.words)[0].word);

    ASSERT_NO_THROW(doc = encodePartial("a\xFF" "b"));
    EXPECT_EQ("a\xEF\xBF\xBD" "b", decodeEngineOutput(doc, false).text);
}

TEST_F(ResultRouterTest, TruncatedCharacterStillRoutes) {
    router.route(encodePartial("ni\xC3"), false);
    EXPECT_EQ(std::vector<std::string>{"ni\xEF\xBF\xBD"}, partials());
    EXPECT_EQ(0u, router.droppedCount());
}
