#include "stt/result_router.hpp"
#include "stt/result_json.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

// Constructor
ResultRouter::ResultRouter(EventBus& bus) : bus_(bus) {}

void ResultRouter::route(const std::string& engineOutput, bool isFinal) {
    RecognitionResult result;
    try {
        result = decodeEngineOutput(engineOutput, isFinal);
    } catch (const SessionError& e) {
        ++dropped_;
        logWarn("Result Router", e.what());
        return;
    }

    if (result.isFinal()) {
        bus_.emitResult(result);
        bus_.emitFinalResult(result);
    } else {
        const bool repeated = last_ && !last_->isFinal() && last_->text == result.text;
        if (!repeated && !result.text.empty()) bus_.emitPartialResult(result.text);
    }
    last_ = std::move(result);
}

std::optional<RecognitionResult> ResultRouter::takePending() {
    if (!last_) return std::nullopt;

    RecognitionResult pending = RecognitionResult::makeFinal(last_->text, last_->words);
    last_.reset();
    return pending;
}
