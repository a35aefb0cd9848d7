module;
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

module Pulse.Threading;

import Core.Logging;

namespace Pulse
{
    namespace
    {
        void RunGuarded(const MainThreadAction& action)
        {
            try
            {
                action();
            }
            catch (const std::exception& e)
            {
                Core::Log::Error("ThreadMarshaller: main-thread action threw: {}", e.what());
            }
        }

        struct CompletionSignal
        {
            std::mutex Mutex;
            std::condition_variable Cv;
            bool Done = false;
        };
    }

    bool IThreadMarshaller::ExecuteOnMainThreadAndWait(MainThreadAction action, std::chrono::milliseconds timeout)
    {
        if (!action) return true;

        if (IsMainThread())
        {
            action();
            return true;
        }

        auto signal = std::make_shared<CompletionSignal>();
        ExecuteOnMainThread([signal, action = std::move(action)]()
        {
            action();

            // Only reached when the action completed normally.
            {
                std::lock_guard lock(signal->Mutex);
                signal->Done = true;
            }
            signal->Cv.notify_all();
        });

        std::unique_lock lock(signal->Mutex);
        return signal->Cv.wait_for(lock, timeout, [&] { return signal->Done; });
    }

    // -------------------------------------------------------------------------
    // ImmediateMarshaller
    // -------------------------------------------------------------------------

    void ImmediateMarshaller::ExecuteOnMainThread(MainThreadAction action)
    {
        if (action) action();
    }

    // -------------------------------------------------------------------------
    // MainThreadDispatcher
    // -------------------------------------------------------------------------

    MainThreadDispatcher::MainThreadDispatcher(const DispatcherConfig& config)
        : m_MainThreadId(std::this_thread::get_id()),
          m_MaxActionsPerTick(config.MaxActionsPerTick),
          m_InlineOnMainThread(config.InlineOnMainThread)
    {
        Core::Log::Debug("MainThreadDispatcher: bound to main thread (max {} actions/tick).",
                         config.MaxActionsPerTick);
    }

    MainThreadDispatcher::~MainThreadDispatcher()
    {
        std::lock_guard lock(m_QueueMutex);
        if (!m_Queue.empty())
        {
            Core::Log::Warn("MainThreadDispatcher: destroyed with {} pending actions.", m_Queue.size());
        }
    }

    void MainThreadDispatcher::ExecuteOnMainThread(MainThreadAction action)
    {
        if (!action) return;

        if (m_InlineOnMainThread && IsMainThread())
        {
            action();
            return;
        }

        std::lock_guard lock(m_QueueMutex);
        m_Queue.emplace_back(std::move(action));
    }

    bool MainThreadDispatcher::IsMainThread() const
    {
        return std::this_thread::get_id() == m_MainThreadId.load(std::memory_order_acquire);
    }

    void MainThreadDispatcher::BindToCurrentThread()
    {
        m_MainThreadId.store(std::this_thread::get_id(), std::memory_order_release);
    }

    size_t MainThreadDispatcher::ProcessQueue()
    {
        if (!IsMainThread())
        {
            Core::Log::Warn("MainThreadDispatcher: ProcessQueue called off the main thread; ignored.");
            return 0;
        }

        const uint32_t budget = m_MaxActionsPerTick.load(std::memory_order_relaxed);

        // Take this tick's batch, execute without holding the lock so actions
        // may enqueue follow-up work (which lands in a later tick).
        std::vector<MainThreadAction> batch;
        {
            std::lock_guard lock(m_QueueMutex);
            if (m_Queue.empty()) return 0;

            const size_t count = (budget == 0) ? m_Queue.size()
                                               : std::min<size_t>(budget, m_Queue.size());
            batch.reserve(count);
            for (size_t i = 0; i < count; ++i)
            {
                batch.emplace_back(std::move(m_Queue.front()));
                m_Queue.pop_front();
            }
        }

        for (const auto& action : batch)
        {
            RunGuarded(action);
        }
        return batch.size();
    }

    size_t MainThreadDispatcher::QueuedActionCount() const
    {
        std::lock_guard lock(m_QueueMutex);
        return m_Queue.size();
    }

    void MainThreadDispatcher::ClearQueue()
    {
        std::lock_guard lock(m_QueueMutex);
        m_Queue.clear();
    }

    void MainThreadDispatcher::SetMaxActionsPerTick(uint32_t maxActions)
    {
        m_MaxActionsPerTick.store(maxActions, std::memory_order_relaxed);
    }

    uint32_t MainThreadDispatcher::GetMaxActionsPerTick() const
    {
        return m_MaxActionsPerTick.load(std::memory_order_relaxed);
    }
}
