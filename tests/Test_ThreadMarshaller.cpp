#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

import Pulse;

using namespace Pulse;
using namespace std::chrono_literals;

// =========================================================================
// Test: Immediate marshaller runs everything inline
// =========================================================================
TEST(ThreadMarshaller, ImmediateRunsInline)
{
    ImmediateMarshaller marshaller;
    EXPECT_TRUE(marshaller.IsMainThread());

    int calls = 0;
    marshaller.ExecuteOnMainThread([&] { ++calls; });
    EXPECT_EQ(calls, 1);

    bool workerSawMain = false;
    std::thread worker([&] { workerSawMain = marshaller.IsMainThread(); });
    worker.join();
    EXPECT_TRUE(workerSawMain);
}

// =========================================================================
// Test: Dispatcher identifies its owning thread
// =========================================================================
TEST(ThreadMarshaller, DispatcherRecordsOwningThread)
{
    MainThreadDispatcher dispatcher;
    EXPECT_TRUE(dispatcher.IsMainThread());

    bool workerIsMain = true;
    std::thread worker([&] { workerIsMain = dispatcher.IsMainThread(); });
    worker.join();
    EXPECT_FALSE(workerIsMain);
}

// =========================================================================
// Test: Off-thread actions are queued and drained in FIFO order
// =========================================================================
TEST(ThreadMarshaller, QueuedActionsDrainInOrder)
{
    MainThreadDispatcher dispatcher;
    std::vector<int> order;

    std::thread worker([&]
    {
        for (int i = 0; i < 5; ++i)
            dispatcher.ExecuteOnMainThread([&order, i] { order.push_back(i); });
    });
    worker.join();

    EXPECT_TRUE(order.empty());
    EXPECT_EQ(dispatcher.QueuedActionCount(), 5u);

    EXPECT_EQ(dispatcher.ProcessQueue(), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(dispatcher.QueuedActionCount(), 0u);
}

// =========================================================================
// Test: Per-tick limit defers the overflow, never drops it
// =========================================================================
TEST(ThreadMarshaller, PerTickLimitDefersOverflow)
{
    DispatcherConfig config;
    config.MaxActionsPerTick = 3;
    MainThreadDispatcher dispatcher(config);

    std::vector<int> order;
    std::thread worker([&]
    {
        for (int i = 0; i < 7; ++i)
            dispatcher.ExecuteOnMainThread([&order, i] { order.push_back(i); });
    });
    worker.join();

    EXPECT_EQ(dispatcher.ProcessQueue(), 3u);
    EXPECT_EQ(dispatcher.QueuedActionCount(), 4u);
    EXPECT_EQ(dispatcher.ProcessQueue(), 3u);
    EXPECT_EQ(dispatcher.ProcessQueue(), 1u);
    EXPECT_EQ(dispatcher.ProcessQueue(), 0u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6}));
}

TEST(ThreadMarshaller, ZeroLimitDrainsEverything)
{
    MainThreadDispatcher dispatcher;
    dispatcher.SetMaxActionsPerTick(0);
    EXPECT_EQ(dispatcher.GetMaxActionsPerTick(), 0u);

    std::atomic<int> calls{0};
    std::thread worker([&]
    {
        for (int i = 0; i < 1000; ++i)
            dispatcher.ExecuteOnMainThread([&] { ++calls; });
    });
    worker.join();

    EXPECT_EQ(dispatcher.ProcessQueue(), 1000u);
    EXPECT_EQ(calls.load(), 1000);
}

// =========================================================================
// Test: On-thread behaviour follows configuration
// =========================================================================
TEST(ThreadMarshaller, OnThreadInlineOrQueued)
{
    MainThreadDispatcher inlineDispatcher;
    int inlineCalls = 0;
    inlineDispatcher.ExecuteOnMainThread([&] { ++inlineCalls; });
    EXPECT_EQ(inlineCalls, 1);

    DispatcherConfig config;
    config.InlineOnMainThread = false;
    MainThreadDispatcher queuedDispatcher(config);
    int queuedCalls = 0;
    queuedDispatcher.ExecuteOnMainThread([&] { ++queuedCalls; });
    EXPECT_EQ(queuedCalls, 0);
    EXPECT_EQ(queuedDispatcher.ProcessQueue(), 1u);
    EXPECT_EQ(queuedCalls, 1);
}

// =========================================================================
// Test: A throwing action does not stop the rest of the tick
// =========================================================================
TEST(ThreadMarshaller, ThrowingActionIsIsolated)
{
    DispatcherConfig config;
    config.InlineOnMainThread = false;
    MainThreadDispatcher dispatcher(config);

    int after = 0;
    dispatcher.ExecuteOnMainThread([] { throw std::runtime_error("boom"); });
    dispatcher.ExecuteOnMainThread([&] { ++after; });

    EXPECT_EQ(dispatcher.ProcessQueue(), 2u);
    EXPECT_EQ(after, 1);
}

// =========================================================================
// Test: ProcessQueue off the main thread is refused
// =========================================================================
TEST(ThreadMarshaller, ProcessQueueOffThreadIsIgnored)
{
    DispatcherConfig config;
    config.InlineOnMainThread = false;
    MainThreadDispatcher dispatcher(config);
    dispatcher.ExecuteOnMainThread([] {});

    size_t processedOffThread = 99;
    std::thread worker([&] { processedOffThread = dispatcher.ProcessQueue(); });
    worker.join();

    EXPECT_EQ(processedOffThread, 0u);
    EXPECT_EQ(dispatcher.QueuedActionCount(), 1u);

    dispatcher.ClearQueue();
    EXPECT_EQ(dispatcher.QueuedActionCount(), 0u);
}

TEST(ThreadMarshaller, BindToCurrentThreadMovesOwnership)
{
    MainThreadDispatcher dispatcher;

    bool workerIsMain = false;
    std::thread worker([&]
    {
        dispatcher.BindToCurrentThread();
        workerIsMain = dispatcher.IsMainThread();
    });
    worker.join();

    EXPECT_TRUE(workerIsMain);
    EXPECT_FALSE(dispatcher.IsMainThread());
    dispatcher.BindToCurrentThread();
    EXPECT_TRUE(dispatcher.IsMainThread());
}

// =========================================================================
// Test: ExecuteOnMainThreadAndWait
// =========================================================================
TEST(ThreadMarshaller, ExecuteAndWaitCompletesWhenPumped)
{
    MainThreadDispatcher dispatcher;

    std::atomic<bool> finished{false};
    std::atomic<bool> result{false};
    std::thread::id ranOn;

    std::thread worker([&]
    {
        result = dispatcher.ExecuteOnMainThreadAndWait([&] { ranOn = std::this_thread::get_id(); }, 5s);
        finished = true;
    });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!finished && std::chrono::steady_clock::now() < deadline)
    {
        dispatcher.ProcessQueue();
        std::this_thread::sleep_for(1ms);
    }
    worker.join();

    EXPECT_TRUE(result.load());
    EXPECT_EQ(ranOn, std::this_thread::get_id());
}

TEST(ThreadMarshaller, ExecuteAndWaitTimesOutWithoutPump)
{
    MainThreadDispatcher dispatcher;

    bool result = true;
    std::thread worker([&] { result = dispatcher.ExecuteOnMainThreadAndWait([] {}, 20ms); });
    worker.join();

    EXPECT_FALSE(result);
    // The action is still queued; draining it later is harmless.
    EXPECT_EQ(dispatcher.ProcessQueue(), 1u);
}

TEST(ThreadMarshaller, ExecuteAndWaitOnMainThreadRunsInline)
{
    MainThreadDispatcher dispatcher;
    int calls = 0;
    EXPECT_TRUE(dispatcher.ExecuteOnMainThreadAndWait([&] { ++calls; }, 1ms));
    EXPECT_EQ(calls, 1);
}
