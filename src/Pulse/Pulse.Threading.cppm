module;
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

export module Pulse.Threading;

export namespace Pulse
{
    using MainThreadAction = std::function<void()>;

    // -------------------------------------------------------------------------
    // IThreadMarshaller: moves work onto the single "main" execution context.
    // -------------------------------------------------------------------------
    class IThreadMarshaller
    {
    public:
        virtual ~IThreadMarshaller() = default;

        // Run `action` on the main context. May run inline or be deferred,
        // depending on the implementation. Never drops the action.
        virtual void ExecuteOnMainThread(MainThreadAction action) = 0;

        [[nodiscard]] virtual bool IsMainThread() const = 0;

        // Blocks the calling thread until `action` has run on the main context.
        // Returns false if it did not complete within `timeout` (or threw).
        // Runs inline when already on the main context.
        bool ExecuteOnMainThreadAndWait(MainThreadAction action, std::chrono::milliseconds timeout);
    };

    // Synchronous variant: every caller is treated as the main context and
    // actions execute inline. Used by tests and headless tools.
    class ImmediateMarshaller final : public IThreadMarshaller
    {
    public:
        void ExecuteOnMainThread(MainThreadAction action) override;
        [[nodiscard]] bool IsMainThread() const override { return true; }
    };

    struct DispatcherConfig
    {
        // Upper bound of actions drained per ProcessQueue() call. 0 = unbounded.
        uint32_t MaxActionsPerTick = 256;
        // When true, ExecuteOnMainThread from the main thread runs inline
        // instead of being queued for the next tick.
        bool InlineOnMainThread = true;
    };

    // Live-runtime variant: records the owning thread, queues work from other
    // threads and drains it in FIFO order once per tick.
    class MainThreadDispatcher final : public IThreadMarshaller
    {
    public:
        // The constructing thread becomes the main thread.
        explicit MainThreadDispatcher(const DispatcherConfig& config = {});
        ~MainThreadDispatcher() override;

        // Non-copyable, non-movable (owns the queue mutex).
        MainThreadDispatcher(const MainThreadDispatcher&) = delete;
        MainThreadDispatcher& operator=(const MainThreadDispatcher&) = delete;
        MainThreadDispatcher(MainThreadDispatcher&&) = delete;
        MainThreadDispatcher& operator=(MainThreadDispatcher&&) = delete;

        void ExecuteOnMainThread(MainThreadAction action) override;
        [[nodiscard]] bool IsMainThread() const override;

        // Re-designate the calling thread as the main thread.
        void BindToCurrentThread();

        // --- Per-tick processing (call from main thread) ---

        // Drain up to MaxActionsPerTick queued actions. Overflow stays queued
        // for later ticks. Returns the number of actions executed.
        size_t ProcessQueue();

        [[nodiscard]] size_t QueuedActionCount() const;
        void ClearQueue();

        void SetMaxActionsPerTick(uint32_t maxActions);
        [[nodiscard]] uint32_t GetMaxActionsPerTick() const;

    private:
        std::atomic<std::thread::id> m_MainThreadId;
        std::atomic<uint32_t> m_MaxActionsPerTick;
        const bool m_InlineOnMainThread;

        mutable std::mutex m_QueueMutex;
        std::deque<MainThreadAction> m_Queue;
    };
}
