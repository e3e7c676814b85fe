#ifndef GRAMMAR_HPP
#define GRAMMAR_HPP

#include "stt/recognition_result.hpp"

#include <set>
#include <string>
#include <vector>

// Phrase list handed to a recognizer. "[unk]" in the list makes the
// vocabulary closed: words outside it are reported as "[unk]".
class Grammar {
public:
    static constexpr const char* kUnknown = "[unk]";

    Grammar() = default;
    explicit Grammar(std::vector<std::string> phrases);

    bool empty() const { return phrases_.empty(); }
    bool strict() const { return strict_; }
    const std::vector<std::string>& phrases() const { return phrases_; }

    // Phrases joined into a single prompt string, "[unk]" left out.
    std::string prompt() const;

    bool contains(const std::string& word) const;

    void restrict(std::vector<WordTimestamp>& words) const;

    static std::string normalizeWord(const std::string& word);

private:
    std::vector<std::string> phrases_;
    std::set<std::string> vocabulary_;
    bool strict_ = false;
};

#endif
