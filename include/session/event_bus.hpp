#ifndef EVENT_BUS_HPP
#define EVENT_BUS_HPP

#include "session/serial_queue.hpp"
#include "stt/recognition_result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

enum class EventType {
    Result,
    PartialResult,
    FinalResult,
    Error,
    Timeout,
    VolumeChanged
};

const char* eventName(EventType type);

struct SessionEvent {
    EventType type = EventType::Error;

    // Result / FinalResult
    RecognitionResult result;

    // PartialResult / Error
    std::string text;

    // VolumeChanged
    float volume = 0.0f;
};

// Delivers session events to listeners on a dedicated dispatch thread, in the
// order they were emitted. Nothing is queued while there are no listeners.
class EventBus {
public:
    using SubscriptionId = uint64_t;
    using Listener = std::function<void(const SessionEvent&)>;

    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(EventType type, Listener listener);

    // Receives every event type.
    SubscriptionId subscribeAll(Listener listener);

    void unsubscribe(SubscriptionId id);

    bool hasListeners() const;

    void emitResult(const RecognitionResult& result);
    void emitPartialResult(const std::string& text);
    void emitFinalResult(const RecognitionResult& result);
    void emitError(const std::string& message);
    void emitTimeout();
    void emitVolume(float level);

    // Blocks until everything emitted so far has been delivered.
    void flush();

    void shutdown();

private:
    struct Subscription {
        bool all = false;
        EventType type = EventType::Error;
        Listener listener;
    };

    void emit(SessionEvent event);
    void deliver(const SessionEvent& event);

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId nextId_ = 1;

    SerialQueue dispatch_;
};

#endif
