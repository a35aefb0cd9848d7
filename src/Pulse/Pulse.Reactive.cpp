module;
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

module Pulse.Reactive;

import Core.Error;
import Core.Logging;
import Pulse.Subscription;
import Pulse.Threading;
import Pulse.Events;
import Pulse.Events.Framework;

namespace Pulse
{
    ChangeChannel::ChangeChannel()
        : m_State(std::make_shared<State>())
    {
    }

    ChangeChannel::~ChangeChannel() = default;

    Subscription ChangeChannel::Add(ChangeCallback callback)
    {
        if (!callback) return {};

        SubscriptionId id;
        {
            std::lock_guard lock(m_State->Mutex);
            id = m_State->NextId++;
            m_State->Entries.push_back(Entry{id, std::move(callback), std::make_shared<std::atomic<bool>>(true)});
        }

        std::weak_ptr<State> weak = m_State;
        return Subscription(id, [weak, id]()
        {
            auto state = weak.lock();
            if (!state) return;

            std::lock_guard lock(state->Mutex);
            std::erase_if(state->Entries, [id](const Entry& e)
            {
                if (e.Id != id) return false;
                e.Alive->store(false, std::memory_order_release);
                return true;
            });
        });
    }

    void ChangeChannel::Notify(const IReactiveCell& source, entt::any oldValue, entt::any newValue) const
    {
        std::vector<Entry> snapshot;
        CellContext context;
        {
            std::lock_guard lock(m_State->Mutex);
            snapshot = m_State->Entries;
            context = m_State->Context;
        }

        if (!snapshot.empty())
        {
            auto action = [snapshot = std::move(snapshot), oldValue, newValue]()
            {
                for (const Entry& entry : snapshot)
                {
                    if (!entry.Alive->load(std::memory_order_acquire)) continue;

                    try
                    {
                        entry.Fn(oldValue, newValue);
                    }
                    catch (const std::exception& e)
                    {
                        Core::Log::Error("ReactiveCell: subscriber threw: {}", e.what());
                    }
                }
            };

            if (context.Marshaller && !context.Marshaller->IsMainThread())
                context.Marshaller->ExecuteOnMainThread(std::move(action));
            else
                action();
        }

        if (context.Events)
        {
            std::string key;
            if (context.Keys)
            {
                if (auto resolved = context.Keys->GetKey(source))
                    key = std::move(*resolved);
            }
            context.Events->Publish(PropertyChangedEvent(std::move(key), std::move(oldValue), std::move(newValue),
                                                         source.ValueType()));
        }
    }

    void ChangeChannel::AddDependent(Subscription subscription)
    {
        if (!subscription.IsActive()) return;

        std::lock_guard lock(m_State->Mutex);
        m_State->Dependents.push_back(std::move(subscription));
    }

    size_t ChangeChannel::Count() const
    {
        std::lock_guard lock(m_State->Mutex);
        return m_State->Entries.size();
    }

    void ChangeChannel::Dispose()
    {
        std::vector<Subscription> dependents;
        {
            std::lock_guard lock(m_State->Mutex);
            for (const Entry& e : m_State->Entries)
                e.Alive->store(false, std::memory_order_release);
            m_State->Entries.clear();
            dependents = std::move(m_State->Dependents);
            m_State->Dependents.clear();
        }

        // Outside the lock: a dependent's disposer may touch another cell.
        for (Subscription& dependent : dependents)
            dependent.Dispose();
    }

    void ChangeChannel::BindContext(const CellContext& context)
    {
        std::lock_guard lock(m_State->Mutex);
        m_State->Context = context;
    }

    CellContext ChangeChannel::Context() const
    {
        std::lock_guard lock(m_State->Mutex);
        return m_State->Context;
    }

    void ChangeChannel::ReportError(const std::string& message, Core::ErrorCode code) const
    {
        Core::Log::Error("ReactiveCell: {} ({})", message, Core::ErrorCodeToString(code));

        if (EventBus* bus = Context().Events)
            bus->Publish(FrameworkErrorEvent(message, code, ErrorSeverity::Error, "ReactiveCell"));
    }
}
