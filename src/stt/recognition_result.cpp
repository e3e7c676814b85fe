#include "stt/recognition_result.hpp"

#include <utility>

RecognitionResult RecognitionResult::makePartial(std::string text) {
    RecognitionResult r;
    r.kind = Kind::Partial;
    r.text = std::move(text);
    return r;
}

RecognitionResult RecognitionResult::makeFinal(std::string text, std::optional<std::vector<WordTimestamp>> words) {
    RecognitionResult r;
    r.kind = Kind::Final;
    r.text = std::move(text);
    r.words = std::move(words);
    return r;
}

bool operator==(const WordTimestamp& a, const WordTimestamp& b) {
    return a.word == b.word && a.startSec == b.startSec && a.endSec == b.endSec && a.confidence == b.confidence;
}
