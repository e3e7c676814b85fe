#ifndef RESULT_ROUTER_HPP
#define RESULT_ROUTER_HPP

#include "session/event_bus.hpp"
#include "stt/recognition_result.hpp"

#include <optional>
#include <string>

// Turns per-frame engine output into events. Keeps only the most recent
// result, for partial de-duplication and the flush at teardown.
class ResultRouter {
public:
    explicit ResultRouter(EventBus& bus);

    // Malformed output is logged and dropped.
    void route(const std::string& engineOutput, bool isFinal);

    // The most recent result as a final, then forgets it. Words when it
    // carried them, else its text.
    std::optional<RecognitionResult> takePending();

    const std::optional<RecognitionResult>& last() const { return last_; }

    std::size_t droppedCount() const { return dropped_; }

private:
    EventBus& bus_;
    std::optional<RecognitionResult> last_;
    std::size_t dropped_ = 0;
};

#endif
