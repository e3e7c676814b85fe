#include "session/start_options.hpp"
#include "audio/waveform_writer.hpp"
#include "core/errors.hpp"

using nlohmann::json;

namespace {

[[noreturn]] void invalid(const std::string& msg) {
    throw SessionError(ErrorKind::ConfigurationError, "invalid start options: " + msg);
}

}

StartOptions parseStartOptions(const json& options) {
    StartOptions out;
    if (options.is_null()) return out;
    if (!options.is_object()) invalid("expected an object");

    auto grammar = options.find("grammar");
    if (grammar != options.end() && !grammar->is_null()) {
        if (!grammar->is_array()) invalid("grammar must be an array of strings");
        for (const json& phrase : *grammar) {
            if (!phrase.is_string()) invalid("grammar must be an array of strings");
            out.grammar.push_back(phrase.get<std::string>());
        }
    }

    auto timeout = options.find("timeout");
    if (timeout == options.end()) timeout = options.find("timeoutMs");
    if (timeout != options.end() && !timeout->is_null()) {
        if (!timeout->is_number_integer()) invalid("timeout must be an integer");
        const long long ms = timeout->get<long long>();
        if (ms < 0 || ms > 24LL * 3600 * 1000) invalid("timeout out of range");
        out.timeoutMs = (int)ms;
    }

    auto path = options.find("audioFilePath");
    if (path != options.end() && !path->is_null()) {
        if (!path->is_string()) invalid("audioFilePath must be a string");
        const std::string p = WaveformWriter::stripFileScheme(path->get<std::string>());
        if (!p.empty()) out.audioFilePath = p;
    }

    validateStartOptions(out);
    return out;
}

StartOptions parseStartOptions(const std::string& text) {
    if (text.empty()) return StartOptions{};
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) invalid("not valid JSON");
    return parseStartOptions(doc);
}

void validateStartOptions(const StartOptions& options) {
    for (const std::string& phrase : options.grammar) {
        if (phrase.empty()) invalid("grammar phrases must not be empty");
    }
    if (options.timeoutMs && *options.timeoutMs < 0) invalid("timeout must not be negative");
}
