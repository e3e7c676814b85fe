#include "stt/word_assembler.hpp"
#include "stt/grammar.hpp"

#include <algorithm>

namespace {

std::string trim(const std::string& s) {
    const std::size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    const std::size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

}

std::vector<WordTimestamp> assembleWords(const std::vector<TokenPiece>& tokens, double offsetSec) {
    std::vector<WordTimestamp> words;
    std::vector<int> tokenCounts;

    for (const TokenPiece& token : tokens) {
        if (token.text.empty()) continue;

        const double start = offsetSec + token.t0 * 0.01;
        const double end = offsetSec + token.t1 * 0.01;

        if (words.empty() || token.text[0] == ' ') {
            WordTimestamp w;
            w.word = token.text;
            w.startSec = start;
            w.endSec = end;
            w.confidence = token.probability;
            words.push_back(w);
            tokenCounts.push_back(1);
        } else {
            WordTimestamp& w = words.back();
            w.word += token.text;
            w.endSec = std::max(w.endSec, end);
            w.confidence += token.probability;
            tokenCounts.back() += 1;
        }
    }

    std::vector<WordTimestamp> out;
    for (std::size_t i = 0; i < words.size(); ++i) {
        WordTimestamp w = words[i];
        w.confidence = std::min(1.0, std::max(0.0, w.confidence / tokenCounts[i]));
        w.word = trim(w.word);
        if (Grammar::normalizeWord(w.word).empty()) continue;
        out.push_back(w);
    }
    return out;
}

std::string joinWords(const std::vector<WordTimestamp>& words) {
    std::string text;
    for (const WordTimestamp& w : words) {
        if (!text.empty()) text += " ";
        text += w.word;
    }
    return text;
}
