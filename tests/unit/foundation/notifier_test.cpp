#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "crr/foundation/notifier.hpp"

using namespace crr::foundation;

// --- Notifier tests ---

TEST(NotifierTest, NotifiesInSubscriptionOrder) {
    Notifier<const std::string&> notifier;
    std::vector<std::string> calls;

    notifier.subscribe([&](const std::string& s) { calls.push_back("a:" + s); });
    notifier.subscribe([&](const std::string& s) { calls.push_back("b:" + s); });
    notifier.notify("open");

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "a:open");
    EXPECT_EQ(calls[1], "b:open");
}

TEST(NotifierTest, UnsubscribeStopsDelivery) {
    Notifier<int> notifier;
    int sum = 0;

    auto id = notifier.subscribe([&](int v) { sum += v; });
    notifier.notify(1);
    notifier.unsubscribe(id);
    notifier.notify(10);

    EXPECT_EQ(sum, 1);
    EXPECT_EQ(notifier.observerCount(), 0u);
}

TEST(NotifierTest, UnknownIdIsIgnored) {
    Notifier<int> notifier;
    notifier.subscribe([](int) {});
    notifier.unsubscribe(999);
    EXPECT_EQ(notifier.observerCount(), 1u);
}

TEST(NotifierTest, ObserverMayUnsubscribeItself) {
    Notifier<> notifier;
    int calls = 0;
    Notifier<>::SubscriptionId id = 0;

    id = notifier.subscribe([&] {
        ++calls;
        notifier.unsubscribe(id);
    });
    notifier.notify();
    notifier.notify();

    EXPECT_EQ(calls, 1);
}

TEST(NotifierTest, ScopedSubscriptionUnsubscribesOnDestruction) {
    Notifier<int> notifier;
    int calls = 0;
    {
        auto sub = notifier.scopedSubscribe([&](int) { ++calls; });
        EXPECT_TRUE(sub.active());
        notifier.notify(1);
    }
    notifier.notify(2);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(notifier.observerCount(), 0u);
}

TEST(NotifierTest, ScopedSubscriptionMayOutliveNotifier) {
    Notifier<int>::Subscription sub;
    {
        auto notifier = std::make_unique<Notifier<int>>();
        sub = notifier->scopedSubscribe([](int) {});
    }
    EXPECT_FALSE(sub.active());
    sub.reset();
}

TEST(NotifierTest, MovedSubscriptionKeepsObserver) {
    Notifier<int> notifier;
    int calls = 0;

    auto first = notifier.scopedSubscribe([&](int) { ++calls; });
    auto second = std::move(first);
    EXPECT_FALSE(first.active());
    EXPECT_TRUE(second.active());

    notifier.notify(0);
    EXPECT_EQ(calls, 1);
}
