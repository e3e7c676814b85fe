#include "session/event_bus.hpp"
#include "core/log.hpp"

#include <exception>
#include <utility>
#include <vector>

const char* eventName(EventType type) {
    switch (type) {
        case EventType::Result: return "onResult";
        case EventType::PartialResult: return "onPartialResult";
        case EventType::FinalResult: return "onFinalResult";
        case EventType::Error: return "onError";
        case EventType::Timeout: return "onTimeout";
        case EventType::VolumeChanged: return "onVolumeChanged";
    }
    return "unknown";
}

// Constructor
EventBus::EventBus() : dispatch_("Event Bus") {}

// Destructor
EventBus::~EventBus() { shutdown(); }

EventBus::SubscriptionId EventBus::subscribe(EventType type, Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = nextId_++;
    Subscription sub;
    sub.type = type;
    sub.listener = std::move(listener);
    subscriptions_[id] = std::move(sub);
    return id;
}

EventBus::SubscriptionId EventBus::subscribeAll(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = nextId_++;
    Subscription sub;
    sub.all = true;
    sub.listener = std::move(listener);
    subscriptions_[id] = std::move(sub);
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(id);
}

bool EventBus::hasListeners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !subscriptions_.empty();
}

void EventBus::emitResult(const RecognitionResult& result) {
    SessionEvent event;
    event.type = EventType::Result;
    event.result = result;
    emit(std::move(event));
}

void EventBus::emitPartialResult(const std::string& text) {
    SessionEvent event;
    event.type = EventType::PartialResult;
    event.text = text;
    emit(std::move(event));
}

void EventBus::emitFinalResult(const RecognitionResult& result) {
    SessionEvent event;
    event.type = EventType::FinalResult;
    event.result = result;
    emit(std::move(event));
}

void EventBus::emitError(const std::string& message) {
    SessionEvent event;
    event.type = EventType::Error;
    event.text = message;
    emit(std::move(event));
}

void EventBus::emitTimeout() {
    SessionEvent event;
    event.type = EventType::Timeout;
    emit(std::move(event));
}

void EventBus::emitVolume(float level) {
    SessionEvent event;
    event.type = EventType::VolumeChanged;
    event.volume = level;
    emit(std::move(event));
}

void EventBus::emit(SessionEvent event) {
    if (!hasListeners()) return;
    dispatch_.post([this, event] { deliver(event); });
}

// Runs on the dispatch thread; listeners are snapshotted so they may
// (un)subscribe from inside a callback
void EventBus::deliver(const SessionEvent& event) {
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : subscriptions_) {
            if (entry.second.all || entry.second.type == event.type) targets.push_back(entry.second.listener);
        }
    }

    for (const Listener& listener : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            logError("Event Bus", std::string(eventName(event.type)) + " listener threw: " + e.what());
        }
    }
}

void EventBus::flush() { dispatch_.drain(); }

void EventBus::shutdown() { dispatch_.stop(); }
