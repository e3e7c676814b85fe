#include "session/event_bus.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

TEST(EventBusTest, EventNames) {
    EXPECT_STREQ("onResult", eventName(EventType::Result));
    EXPECT_STREQ("onPartialResult", eventName(EventType::PartialResult));
    EXPECT_STREQ("onFinalResult", eventName(EventType::FinalResult));
    EXPECT_STREQ("onError", eventName(EventType::Error));
    EXPECT_STREQ("onTimeout", eventName(EventType::Timeout));
    EXPECT_STREQ("onVolumeChanged", eventName(EventType::VolumeChanged));
}

TEST(EventBusTest, DeliversInEmitOrder) {
    EventBus bus;
    EventRecorder recorder(bus);

    bus.emitPartialResult("a");
    bus.emitVolume(0.5f);
    bus.emitFinalResult(RecognitionResult::makeFinal("a"));
    bus.emitError("oops");
    bus.emitTimeout();
    bus.flush();

    const auto events = recorder.events();
    ASSERT_EQ(5u, events.size());
    EXPECT_EQ(EventType::PartialResult, events[0].type);
    EXPECT_EQ("a", events[0].text);
    EXPECT_EQ(EventType::VolumeChanged, events[1].type);
    EXPECT_FLOAT_EQ(0.5f, events[1].volume);
    EXPECT_EQ(EventType::FinalResult, events[2].type);
    EXPECT_EQ(EventType::Error, events[3].type);
    EXPECT_EQ("oops", events[3].text);
    EXPECT_EQ(EventType::Timeout, events[4].type);
}

TEST(EventBusTest, TypedSubscriptionFilters) {
    EventBus bus;
    std::atomic<int> timeouts{0};
    bus.subscribe(EventType::Timeout, [&](const SessionEvent&) { ++timeouts; });

    bus.emitError("x");
    bus.emitTimeout();
    bus.emitVolume(0.1f);
    bus.flush();
    EXPECT_EQ(1, timeouts.load());
}

TEST(EventBusTest, ListenersRunOffTheEmittingThread) {
    EventBus bus;
    std::thread::id listenerThread;
    bus.subscribeAll([&](const SessionEvent&) { listenerThread = std::this_thread::get_id(); });

    bus.emitTimeout();
    bus.flush();
    EXPECT_NE(std::thread::id(), listenerThread);
    EXPECT_NE(std::this_thread::get_id(), listenerThread);
}

TEST(EventBusTest, ThrowingListenerDoesNotStopOthers) {
    EventBus bus;
    bus.subscribeAll([](const SessionEvent&) { throw std::runtime_error("listener failure"); });
    EventRecorder recorder(bus);

    bus.emitError("first");
    bus.emitError("second");
    bus.flush();
    EXPECT_EQ(2, recorder.count(EventType::Error));
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    std::atomic<int> seen{0};
    const auto id = bus.subscribeAll([&](const SessionEvent&) { ++seen; });
    EXPECT_TRUE(bus.hasListeners());

    bus.emitTimeout();
    bus.flush();
    bus.unsubscribe(id);
    EXPECT_FALSE(bus.hasListeners());

    bus.emitTimeout();
    bus.flush();
    EXPECT_EQ(1, seen.load());
}

TEST(EventBusTest, ListenerMayUnsubscribeItself) {
    EventBus bus;
    std::atomic<int> seen{0};
    EventBus::SubscriptionId id = 0;
    id = bus.subscribeAll([&](const SessionEvent&) {
        ++seen;
        bus.unsubscribe(id);
    });

    bus.emitTimeout();
    bus.emitTimeout();
    bus.flush();
    EXPECT_EQ(1, seen.load());
}

TEST(EventBusTest, EmitAfterShutdownIsIgnored) {
    EventBus bus;
    EventRecorder recorder(bus);
    bus.shutdown();
    bus.emitTimeout();
    bus.flush();
    EXPECT_EQ(0, recorder.count(EventType::Timeout));
}
