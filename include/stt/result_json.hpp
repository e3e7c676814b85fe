#ifndef RESULT_JSON_HPP
#define RESULT_JSON_HPP

#include "stt/recognition_result.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

// Engine output documents:
//   partial: {"partial": "..."}
//   final:   {"text": "...", "result": [{"word": "...", "start": s, "end": s, "conf": c}, ...]}

// Throws SessionError(DecodeGlitch) when the document cannot be decoded.
RecognitionResult decodeEngineOutput(const std::string& document, bool isFinal);

// Compact dump that replaces invalid UTF-8 with U+FFFD instead of throwing.
std::string dumpJson(const nlohmann::json& doc);

std::string encodePartial(const std::string& text);
std::string encodeFinal(const std::string& text, const std::vector<WordTimestamp>& words);

nlohmann::json wordsToJson(const std::vector<WordTimestamp>& words);

// Word array when the result carries one, else the text.
nlohmann::json resultBody(const RecognitionResult& result);

#endif
