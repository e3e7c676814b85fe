#ifndef WORD_ASSEMBLER_HPP
#define WORD_ASSEMBLER_HPP

#include "stt/recognition_result.hpp"

#include <cstdint>
#include <string>
#include <vector>

// One decoded text token with whisper's timing (centiseconds relative to the
// decoded buffer) and probability.
struct TokenPiece {
    std::string text;
    int64_t t0 = 0;
    int64_t t1 = 0;
    float probability = 0.0f;
};

// Tokens beginning with a space start a new word; the others continue the
// current one. Word times are offsetSec plus the token times, confidence is
// the mean token probability. Words without letters or digits are dropped.
std::vector<WordTimestamp> assembleWords(const std::vector<TokenPiece>& tokens, double offsetSec);

std::string joinWords(const std::vector<WordTimestamp>& words);

#endif
