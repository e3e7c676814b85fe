#ifndef RECOGNITION_RESULT_HPP
#define RECOGNITION_RESULT_HPP

#include <optional>
#include <string>
#include <vector>

struct WordTimestamp {
    std::string word;
    double startSec = 0.0;
    double endSec = 0.0;
    double confidence = 0.0;
};

struct RecognitionResult {
    enum class Kind {
        Partial,
        Final
    };

    Kind kind = Kind::Partial;

    // Hypothesis text for a partial, transcript for a final.
    std::string text;

    // Present on finals when the engine reported word timing.
    std::optional<std::vector<WordTimestamp>> words;

    bool isFinal() const { return kind == Kind::Final; }

    static RecognitionResult makePartial(std::string text);
    static RecognitionResult makeFinal(std::string text, std::optional<std::vector<WordTimestamp>> words = std::nullopt);
};

bool operator==(const WordTimestamp& a, const WordTimestamp& b);

#endif
