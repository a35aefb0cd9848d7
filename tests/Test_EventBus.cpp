#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

import Pulse;

using namespace Pulse;

// -------------------------------------------------------------------------
// Helpers
// -------------------------------------------------------------------------
namespace
{
    class ScoreEvent final : public EventBase
    {
    public:
        explicit ScoreEvent(int score) : EventBase("Tests"), Score(score) {}
        int Score;
    };

    class DamageEvent final : public EventBase
    {
    public:
        explicit DamageEvent(float amount) : Amount(amount) {}
        float Amount;
    };

    struct Listener
    {
        int Scores = 0;
        int Hits = 0;

        void OnScore(const ScoreEvent&) { ++Scores; }
        void OnDamage(const DamageEvent&) { ++Hits; }
    };
}

// =========================================================================
// Test: Event payload header
// =========================================================================
TEST(EventBus, EventsCarryTimestampIdAndSource)
{
    const auto before = EventBase::Clock::now();
    ScoreEvent a(1);
    DamageEvent b(2.0f);
    const auto after = EventBase::Clock::now();

    EXPECT_GE(a.Timestamp(), before);
    EXPECT_LE(a.Timestamp(), after);

    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    EXPECT_TRUE(std::regex_match(a.EventId(), uuid)) << a.EventId();
    EXPECT_NE(a.EventId(), b.EventId());

    ASSERT_TRUE(a.Source().has_value());
    EXPECT_EQ(*a.Source(), "Tests");
    EXPECT_FALSE(b.Source().has_value());
}

TEST(EventBus, EventIdsAreUnique)
{
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i)
        ids.insert(GenerateEventId());
    EXPECT_EQ(ids.size(), 1000u);
}

// =========================================================================
// Test: Subscribe / Publish basics
// =========================================================================
TEST(EventBus, PublishReachesTypedSubscribersOnly)
{
    EventBus bus;
    int scoreTotal = 0;
    int damageCalls = 0;

    auto s1 = bus.Subscribe<ScoreEvent>([&](const ScoreEvent& e) { scoreTotal += e.Score; });
    auto s2 = bus.Subscribe<DamageEvent>([&](const DamageEvent&) { ++damageCalls; });

    bus.Publish(ScoreEvent(10));
    bus.Publish(ScoreEvent(5));

    EXPECT_EQ(scoreTotal, 15);
    EXPECT_EQ(damageCalls, 0);
}

// =========================================================================
// Test: Priorities [1, 5, 3] dispatch as 5, 3, 1
// =========================================================================
TEST(EventBus, DispatchesInDescendingPriority)
{
    EventBus bus;
    std::vector<int> order;

    auto a = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { order.push_back(1); }, 1);
    auto b = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { order.push_back(5); }, 5);
    auto c = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { order.push_back(3); }, 3);

    bus.Publish(ScoreEvent(0));
    EXPECT_EQ(order, (std::vector<int>{5, 3, 1}));
}

TEST(EventBus, EqualPrioritiesKeepSubscriptionOrder)
{
    EventBus bus;
    std::vector<char> order;

    auto a = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { order.push_back('a'); });
    auto b = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { order.push_back('b'); });
    auto c = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { order.push_back('c'); }, 2);

    bus.Publish(ScoreEvent(0));
    EXPECT_EQ(order, (std::vector<char>{'c', 'a', 'b'}));
}

// =========================================================================
// Test: Unsubscribe by token and by id
// =========================================================================
TEST(EventBus, DisposedTokenStopsDelivery)
{
    EventBus bus;
    int calls = 0;

    auto token = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++calls; });
    bus.Publish(ScoreEvent(1));
    token.Dispose();
    token.Dispose(); // no-op
    bus.Publish(ScoreEvent(1));

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(token.IsActive());
    EXPECT_EQ(bus.GetSubscriberCount<ScoreEvent>(), 0u);
}

TEST(EventBus, UnsubscribeById)
{
    EventBus bus;
    int calls = 0;

    auto token = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++calls; });
    EXPECT_TRUE(bus.Unsubscribe<ScoreEvent>(token.Id()));
    EXPECT_FALSE(bus.Unsubscribe<ScoreEvent>(token.Id()));
    EXPECT_FALSE(bus.Unsubscribe<DamageEvent>(token.Id()));

    bus.Publish(ScoreEvent(1));
    EXPECT_EQ(calls, 0);

    // The token's later disposal is harmless.
    token.Dispose();
}

// =========================================================================
// Test: Bulk unsubscribe by receiver across event types
// =========================================================================
TEST(EventBus, UnsubscribeReceiverAcrossTypes)
{
    EventBus bus;
    Listener target;
    Listener bystander;

    auto t1 = bus.Subscribe(&target, &Listener::OnScore);
    auto t2 = bus.Subscribe(&target, &Listener::OnDamage, 3);
    auto t3 = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++target.Scores; }, 0, &target);
    auto b1 = bus.Subscribe(&bystander, &Listener::OnScore);

    EXPECT_EQ(bus.Unsubscribe(&target), 3u);

    bus.Publish(ScoreEvent(1));
    bus.Publish(DamageEvent(1.0f));

    EXPECT_EQ(target.Scores, 0);
    EXPECT_EQ(target.Hits, 0);
    EXPECT_EQ(bystander.Scores, 1);
    EXPECT_EQ(bus.Unsubscribe(&target), 0u);
}

// =========================================================================
// Test: Handler faults are isolated
// =========================================================================
TEST(EventBus, ThrowingHandlerDoesNotBlockOthers)
{
    EventBus bus;
    int reached = 0;

    auto a = bus.Subscribe<ScoreEvent>([](const ScoreEvent&) { throw std::runtime_error("handler"); }, 10);
    auto b = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++reached; }, 1);

    EXPECT_NO_THROW(bus.Publish(ScoreEvent(1)));
    EXPECT_EQ(reached, 1);
}

// =========================================================================
// Test: Publish monitors run first and cannot block publishing
// =========================================================================
TEST(EventBus, MonitorsRunBeforeHandlersAndAreIsolated)
{
    EventBus bus;
    std::vector<std::string> order;

    auto m1 = bus.OnEventPublished([&](const EventBase&) { order.push_back("monitor"); });
    auto m2 = bus.OnEventPublished([](const EventBase&) { throw std::runtime_error("monitor"); });
    auto h = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { order.push_back("handler"); });

    EXPECT_NO_THROW(bus.Publish(ScoreEvent(1)));
    EXPECT_EQ(order, (std::vector<std::string>{"monitor", "handler"}));

    m1.Dispose();
    order.clear();
    bus.Publish(ScoreEvent(1));
    EXPECT_EQ(order, (std::vector<std::string>{"handler"}));
}

TEST(EventBus, MonitorsSeeEventsWithoutSubscribers)
{
    EventBus bus;
    int seen = 0;
    auto m = bus.OnEventPublished([&](const EventBase&) { ++seen; });

    bus.Publish(DamageEvent(3.0f));
    EXPECT_EQ(seen, 1);
}

// =========================================================================
// Test: Handlers may unsubscribe during dispatch
// =========================================================================
TEST(EventBus, HandlerCanDisposeItselfDuringDispatch)
{
    EventBus bus;
    int calls = 0;
    Subscription self;

    self = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&)
    {
        ++calls;
        self.Dispose();
    });

    bus.Publish(ScoreEvent(1));
    bus.Publish(ScoreEvent(1));
    EXPECT_EQ(calls, 1);
}

// =========================================================================
// Test: Init latch and introspection
// =========================================================================
TEST(EventBus, TotalCountIsZeroUntilInitialized)
{
    EventBus bus;
    auto a = bus.Subscribe<ScoreEvent>([](const ScoreEvent&) {});
    auto b = bus.Subscribe<DamageEvent>([](const DamageEvent&) {});

    EXPECT_FALSE(bus.IsInitialized());
    EXPECT_EQ(bus.GetTotalSubscriberCount(), 0u);
    EXPECT_EQ(bus.GetSubscriberCount<ScoreEvent>(), 1u);

    bus.Initialize();
    bus.Initialize();
    EXPECT_TRUE(bus.IsInitialized());
    EXPECT_EQ(bus.GetTotalSubscriberCount(), 2u);

    bus.Clear();
    EXPECT_EQ(bus.GetTotalSubscriberCount(), 0u);
    EXPECT_TRUE(bus.IsInitialized());
}

// =========================================================================
// Test: Dispatch through a queued marshaller
// =========================================================================
TEST(EventBus, MarshalledDispatchWaitsForTick)
{
    DispatcherConfig config;
    config.InlineOnMainThread = false;
    MainThreadDispatcher dispatcher(config);
    EventBus bus(&dispatcher);

    std::thread::id handledOn;
    auto h = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { handledOn = std::this_thread::get_id(); });

    std::thread worker([&] { bus.Publish(ScoreEvent(1)); });
    worker.join();

    EXPECT_EQ(handledOn, std::thread::id{});
    EXPECT_EQ(dispatcher.ProcessQueue(), 1u);
    EXPECT_EQ(handledOn, std::this_thread::get_id());
}

TEST(EventBus, HandlersRemovedBeforeTickAreSkipped)
{
    MainThreadDispatcher dispatcher;
    EventBus bus(&dispatcher);

    auto listener = std::make_unique<Listener>();
    auto byReceiver = bus.Subscribe(listener.get(), &Listener::OnScore);

    int tokenCalls = 0;
    int keptCalls = 0;
    auto dropped = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++tokenCalls; });
    auto kept = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++keptCalls; });

    std::thread worker([&] { bus.Publish(ScoreEvent(5)); });
    worker.join();

    // Receiver teardown and token disposal both land before the queue drains.
    EXPECT_EQ(bus.Unsubscribe(listener.get()), 1u);
    listener.reset();
    dropped.Dispose();

    EXPECT_EQ(dispatcher.ProcessQueue(), 1u);
    EXPECT_EQ(tokenCalls, 0);
    EXPECT_EQ(keptCalls, 1);
}

TEST(EventBus, ClearBeforeTickSkipsQueuedDispatch)
{
    MainThreadDispatcher dispatcher;
    EventBus bus(&dispatcher);

    int calls = 0;
    auto h = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++calls; });

    std::thread worker([&] { bus.Publish(ScoreEvent(1)); });
    worker.join();

    bus.Clear();
    EXPECT_EQ(dispatcher.ProcessQueue(), 1u);
    EXPECT_EQ(calls, 0);
}

// =========================================================================
// Test: Concurrent subscribe / unsubscribe never loses a removal
// =========================================================================
TEST(EventBus, ConcurrentUnsubscribeAlwaysRemoves)
{
    EventBus bus;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&bus]
        {
            std::vector<Subscription> tokens;
            for (int i = 0; i < kPerThread; ++i)
                tokens.push_back(bus.Subscribe<ScoreEvent>([](const ScoreEvent&) {}));
            for (auto& token : tokens)
                token.Dispose();
        });
    }

    // Keep a stable subscriber alive while the others churn.
    std::atomic<int> stableCalls{0};
    auto stable = bus.Subscribe<ScoreEvent>([&](const ScoreEvent&) { ++stableCalls; });

    for (auto& t : threads)
        t.join();

    EXPECT_EQ(bus.GetSubscriberCount<ScoreEvent>(), 1u);
    bus.Publish(ScoreEvent(1));
    EXPECT_EQ(stableCalls.load(), 1);
}

TEST(EventBus, TokenOutlivingBusIsSafe)
{
    Subscription token;
    {
        EventBus bus;
        token = bus.Subscribe<ScoreEvent>([](const ScoreEvent&) {});
    }
    EXPECT_NO_THROW(token.Dispose());
}

// =========================================================================
// Test: Generic payload events
// =========================================================================
TEST(EventBus, GenericDataEventCarriesKeyAndPayload)
{
    EventBus bus;
    std::string key;
    std::vector<int> payload;
    std::string source;

    auto sub = bus.Subscribe<GenericDataEvent<std::vector<int>>>([&](const GenericDataEvent<std::vector<int>>& e)
    {
        key = e.DataKey;
        payload = e.Data;
        source = e.Source().value_or("");
    });

    GenericDataEvent<std::vector<int>> event("inventory.slots", {1, 2, 3});
    bus.Publish(event);

    EXPECT_EQ(key, "inventory.slots");
    EXPECT_EQ(payload, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(source, "Pulse.Generic");

    event.SetSource("Inventory");
    bus.Publish(event);
    EXPECT_EQ(source, "Inventory");
}
