#include "stt/grammar.hpp"

#include <cctype>
#include <sstream>
#include <utility>

// Constructor
Grammar::Grammar(std::vector<std::string> phrases) : phrases_(std::move(phrases)) {
    for (const std::string& phrase : phrases_) {
        if (phrase == kUnknown) {
            strict_ = true;
            continue;
        }
        std::istringstream in(phrase);
        std::string word;
        while (in >> word) {
            const std::string norm = normalizeWord(word);
            if (!norm.empty()) vocabulary_.insert(norm);
        }
    }
}

// Lowercase, with surrounding punctuation removed
std::string Grammar::normalizeWord(const std::string& word) {
    std::size_t a = 0;
    std::size_t b = word.size();
    while (a < b && !std::isalnum(static_cast<unsigned char>(word[a]))) ++a;
    while (b > a && !std::isalnum(static_cast<unsigned char>(word[b - 1]))) --b;

    std::string out;
    out.reserve(b - a);
    for (std::size_t i = a; i < b; ++i) out += (char)std::tolower(static_cast<unsigned char>(word[i]));
    return out;
}

std::string Grammar::prompt() const {
    std::string out;
    for (const std::string& phrase : phrases_) {
        if (phrase == kUnknown) continue;
        if (!out.empty()) out += ", ";
        out += phrase;
    }
    return out;
}

bool Grammar::contains(const std::string& word) const {
    return vocabulary_.count(normalizeWord(word)) > 0;
}

void Grammar::restrict(std::vector<WordTimestamp>& words) const {
    if (!strict_) return;
    for (WordTimestamp& w : words) {
        if (!contains(w.word)) w.word = kUnknown;
    }
}
