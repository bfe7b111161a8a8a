#include <gtest/gtest.h>

#include "../libquarry/include/event_bus.hpp"
#include "../libquarry/include/events.hpp"

#include <atomic>
#include <thread>
#include <vector>

using quarry::DocumentCompleteEvent;
using quarry::DocumentErrorEvent;
using quarry::DocumentSkippedEvent;
using quarry::EventBus;

TEST(EventBus, DeliversOnlyToMatchingType) {
    EventBus bus;
    int completed = 0;
    int errors = 0;
    bus.subscribe<DocumentCompleteEvent>([&](const DocumentCompleteEvent& e) {
        ++completed;
        EXPECT_EQ(e.pages, 7);
    });
    bus.subscribe<DocumentErrorEvent>([&](const DocumentErrorEvent&) { ++errors; });

    DocumentCompleteEvent done{"a.pdf"};
    done.pages = 7;
    bus.publish(done);

    EXPECT_EQ(completed, 1);
    EXPECT_EQ(errors, 0);
}

TEST(EventBus, PublishWithoutSubscribersIsHarmless) {
    EventBus bus;
    EXPECT_NO_THROW((bus.publish(DocumentSkippedEvent{"x.txt", "Unsupported format"})));
}

TEST(EventBus, HandlersRunInSubscriptionOrder) {
    EventBus bus;
    std::vector<int> order;
    bus.subscribe<DocumentSkippedEvent>([&](const DocumentSkippedEvent&) { order.push_back(1); });
    bus.subscribe<DocumentSkippedEvent>([&](const DocumentSkippedEvent&) { order.push_back(2); });
    bus.publish(DocumentSkippedEvent{});
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;
    int calls = 0;
    const auto id = bus.subscribe<DocumentSkippedEvent>([&](const DocumentSkippedEvent&) { ++calls; });
    bus.publish(DocumentSkippedEvent{});
    bus.unsubscribe(id);
    bus.publish(DocumentSkippedEvent{});
    bus.unsubscribe(id + 1000);
    EXPECT_EQ(calls, 1);
}

TEST(EventBus, HandlerMayPublishAnotherEvent) {
    EventBus bus;
    int skipped = 0;
    bus.subscribe<DocumentErrorEvent>([&](const DocumentErrorEvent& e) {
        bus.publish(DocumentSkippedEvent{e.path, "follow-up"});
    });
    bus.subscribe<DocumentSkippedEvent>([&](const DocumentSkippedEvent& e) {
        EXPECT_EQ(e.reason, "follow-up");
        ++skipped;
    });
    bus.publish(DocumentErrorEvent{"broken.pdf", "OpenDocumentFailed", "bad xref"});
    EXPECT_EQ(skipped, 1);
}

TEST(EventBus, ConcurrentPublishersReachEveryHandler) {
    EventBus bus;
    std::atomic<int> received{0};
    bus.subscribe<DocumentCompleteEvent>([&](const DocumentCompleteEvent&) { ++received; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 250; ++i) bus.publish(DocumentCompleteEvent{});
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(received.load(), 1000);
}
