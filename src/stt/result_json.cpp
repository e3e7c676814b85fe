#include "stt/result_json.hpp"
#include "core/errors.hpp"

using nlohmann::json;

namespace {

WordTimestamp wordFromJson(const json& j) {
    if (!j.is_object()) throw SessionError(ErrorKind::DecodeGlitch, "word entry is not an object");

    WordTimestamp w;
    w.word = j.at("word").get<std::string>();
    w.startSec = j.at("start").get<double>();
    w.endSec = j.at("end").get<double>();
    w.confidence = j.value("conf", 1.0);
    return w;
}

}

RecognitionResult decodeEngineOutput(const std::string& document, bool isFinal) {
    json doc = json::parse(document, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw SessionError(ErrorKind::DecodeGlitch, "undecodable engine output: " + document);
    }

    try {
        if (!isFinal) return RecognitionResult::makePartial(doc.value("partial", std::string()));

        std::optional<std::vector<WordTimestamp>> words;
        auto it = doc.find("result");
        if (it != doc.end()) {
            if (!it->is_array()) throw SessionError(ErrorKind::DecodeGlitch, "\"result\" is not an array");
            std::vector<WordTimestamp> list;
            for (const json& entry : *it) list.push_back(wordFromJson(entry));
            words = std::move(list);
        }
        return RecognitionResult::makeFinal(doc.value("text", std::string()), std::move(words));
    } catch (const json::exception& e) {
        throw SessionError(ErrorKind::DecodeGlitch, std::string("malformed engine output: ") + e.what());
    }
}

std::string dumpJson(const json& doc) {
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encodePartial(const std::string& text) {
    return dumpJson(json{{"partial", text}});
}

std::string encodeFinal(const std::string& text, const std::vector<WordTimestamp>& words) {
    json doc{{"text", text}};
    if (!words.empty()) doc["result"] = wordsToJson(words);
    return dumpJson(doc);
}

json wordsToJson(const std::vector<WordTimestamp>& words) {
    json arr = json::array();
    for (const WordTimestamp& w : words) {
        arr.push_back({{"word", w.word}, {"start", w.startSec}, {"end", w.endSec}, {"conf", w.confidence}});
    }
    return arr;
}

json resultBody(const RecognitionResult& result) {
    if (result.words) return wordsToJson(*result.words);
    return result.text;
}
