module;
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

module Pulse.Events;

import Core.Logging;

namespace Pulse
{
    std::string GenerateEventId()
    {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        const uint64_t hi = rng();
        const uint64_t lo = rng();

        // Version 4 in the high nibble of time_hi, variant 10xx in clock_seq.
        const uint32_t timeLow = static_cast<uint32_t>(hi >> 32);
        const uint16_t timeMid = static_cast<uint16_t>(hi >> 16);
        const uint16_t timeHi = static_cast<uint16_t>((hi & 0x0FFF) | 0x4000);
        const uint16_t clockSeq = static_cast<uint16_t>(((lo >> 48) & 0x3FFF) | 0x8000);
        const uint64_t node = lo & 0xFFFFFFFFFFFFull;

        return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", timeLow, timeMid, timeHi, clockSeq, node);
    }

    EventBase::EventBase()
        : m_Timestamp(Clock::now()), m_EventId(GenerateEventId())
    {
    }

    EventBase::EventBase(std::string source)
        : m_Timestamp(Clock::now()), m_EventId(GenerateEventId()), m_Source(std::move(source))
    {
    }

    // -------------------------------------------------------------------------
    // EventBus
    // -------------------------------------------------------------------------

    EventBus::EventBus(IThreadMarshaller* marshaller)
        : m_Marshaller(marshaller), m_Lifetime(std::make_shared<EventBus*>(this))
    {
    }

    EventBus::~EventBus() = default;

    void EventBus::Initialize()
    {
        if (m_Initialized.load(std::memory_order_acquire)) return;

        std::lock_guard lock(m_InitMutex);
        if (!m_Initialized.load(std::memory_order_relaxed))
        {
            m_Initialized.store(true, std::memory_order_release);
            Core::Log::Info("EventBus: initialized.");
        }
    }

    EventBus::Slot& EventBus::AcquireSlot(const entt::type_info& type)
    {
        {
            std::shared_lock lock(m_SlotMutex);
            if (auto it = m_Slots.find(type.hash()); it != m_Slots.end())
                return *it->second;
        }

        std::unique_lock lock(m_SlotMutex);
        auto [it, inserted] = m_Slots.try_emplace(type.hash(), nullptr);
        if (inserted)
            it->second = std::make_unique<Slot>(type);
        return *it->second;
    }

    EventBus::Slot* EventBus::FindSlot(entt::id_type typeHash) const
    {
        std::shared_lock lock(m_SlotMutex);
        auto it = m_Slots.find(typeHash);
        return it != m_Slots.end() ? it->second.get() : nullptr;
    }

    Subscription EventBus::SubscribeErased(const entt::type_info& type, Handler handler, int priority,
                                           const void* receiver)
    {
        Slot& slot = AcquireSlot(type);
        const SubscriptionId id = m_NextId.fetch_add(1, std::memory_order_relaxed);
        auto alive = std::make_shared<std::atomic<bool>>(true);

        EntryListPtr current = slot.Entries.load(std::memory_order_acquire);
        EntryListPtr next;
        do
        {
            auto rebuilt = std::make_shared<EntryList>(*current);
            rebuilt->push_back(Entry{id, priority, receiver, handler, alive});
            next = std::move(rebuilt);
        }
        while (!slot.Entries.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                                   std::memory_order_acquire));

        const entt::id_type typeHash = type.hash();
        std::weak_ptr<EventBus*> lifetime = m_Lifetime;
        return Subscription(id, [lifetime, typeHash, id]()
        {
            if (auto bus = lifetime.lock())
                (*bus)->UnsubscribeErased(typeHash, id);
        });
    }

    bool EventBus::UnsubscribeErased(entt::id_type typeHash, SubscriptionId id)
    {
        Slot* slot = FindSlot(typeHash);
        if (!slot) return false;

        EntryListPtr current = slot->Entries.load(std::memory_order_acquire);
        uint32_t attempts = 0;
        while (true)
        {
            auto it = std::find_if(current->begin(), current->end(),
                                   [id](const Entry& e) { return e.Id == id; });
            if (it == current->end()) return false;

            auto rebuilt = std::make_shared<EntryList>();
            rebuilt->reserve(current->size() - 1);
            for (const Entry& e : *current)
            {
                if (e.Id != id) rebuilt->push_back(e);
            }

            EntryListPtr next = std::move(rebuilt);
            if (slot->Entries.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                                    std::memory_order_acquire))
            {
                it->Alive->store(false, std::memory_order_release);
                break;
            }

            // `current` now holds the list another writer installed; rebuild from it.
            ++attempts;
        }

        if (attempts > 0)
            Core::Log::Debug("EventBus: unsubscribe of {} retried {} time(s) under contention.", id, attempts);
        return true;
    }

    size_t EventBus::Unsubscribe(const void* receiver)
    {
        if (!receiver) return 0;

        std::vector<Slot*> slots;
        {
            std::shared_lock lock(m_SlotMutex);
            slots.reserve(m_Slots.size());
            for (auto& [hash, slot] : m_Slots)
                slots.push_back(slot.get());
        }

        size_t removed = 0;
        for (Slot* slot : slots)
        {
            EntryListPtr current = slot->Entries.load(std::memory_order_acquire);
            while (true)
            {
                auto rebuilt = std::make_shared<EntryList>();
                rebuilt->reserve(current->size());
                for (const Entry& e : *current)
                {
                    if (e.Receiver != receiver) rebuilt->push_back(e);
                }

                const size_t dropped = current->size() - rebuilt->size();
                if (dropped == 0) break;

                EntryListPtr next = std::move(rebuilt);
                if (slot->Entries.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                                        std::memory_order_acquire))
                {
                    for (const Entry& e : *current)
                    {
                        if (e.Receiver == receiver) e.Alive->store(false, std::memory_order_release);
                    }
                    removed += dropped;
                    break;
                }
            }
        }

        if (removed > 0)
            Core::Log::Debug("EventBus: removed {} registration(s) owned by receiver {}.", removed, receiver);
        return removed;
    }

    Subscription EventBus::OnEventPublished(Monitor monitor)
    {
        if (!monitor) return {};

        const SubscriptionId id = m_NextId.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(m_MonitorMutex);
            m_Monitors.emplace_back(id, std::move(monitor));
        }

        std::weak_ptr<EventBus*> lifetime = m_Lifetime;
        return Subscription(id, [lifetime, id]()
        {
            auto bus = lifetime.lock();
            if (!bus) return;

            EventBus& self = **bus;
            std::lock_guard lock(self.m_MonitorMutex);
            std::erase_if(self.m_Monitors, [id](const auto& m) { return m.first == id; });
        });
    }

    void EventBus::NotifyMonitors(const EventBase& event, const entt::type_info& type)
    {
        std::vector<Monitor> monitors;
        {
            std::lock_guard lock(m_MonitorMutex);
            if (m_Monitors.empty()) return;
            monitors.reserve(m_Monitors.size());
            for (const auto& [id, fn] : m_Monitors)
                monitors.push_back(fn);
        }

        for (const Monitor& monitor : monitors)
        {
            try
            {
                monitor(event);
            }
            catch (const std::exception& e)
            {
                Core::Log::Error("EventBus: publish monitor threw for '{}': {}", type.name(), e.what());
            }
        }
    }

    void EventBus::PublishErased(const entt::type_info& type, std::shared_ptr<const EventBase> event)
    {
        NotifyMonitors(*event, type);

        Slot* slot = FindSlot(type.hash());
        if (!slot) return;

        EntryListPtr snapshot = slot->Entries.load(std::memory_order_acquire);
        if (snapshot->empty()) return;

        auto ordered = std::make_shared<EntryList>(*snapshot);
        std::stable_sort(ordered->begin(), ordered->end(),
                         [](const Entry& a, const Entry& b) { return a.Priority > b.Priority; });

        auto dispatch = [ordered, event, typeName = std::string(type.name())]()
        {
            for (const Entry& entry : *ordered)
            {
                if (!entry.Alive->load(std::memory_order_acquire)) continue;

                try
                {
                    entry.Fn(*event);
                }
                catch (const std::exception& e)
                {
                    Core::Log::Error("EventBus: handler {} for '{}' threw: {}", entry.Id, typeName, e.what());
                }
            }
        };

        if (IThreadMarshaller* marshaller = m_Marshaller.load(std::memory_order_acquire))
            marshaller->ExecuteOnMainThread(std::move(dispatch));
        else
            dispatch();
    }

    size_t EventBus::GetSubscriberCountErased(entt::id_type typeHash) const
    {
        Slot* slot = FindSlot(typeHash);
        return slot ? slot->Entries.load(std::memory_order_acquire)->size() : 0;
    }

    size_t EventBus::GetTotalSubscriberCount() const
    {
        if (!IsInitialized()) return 0;

        std::shared_lock lock(m_SlotMutex);
        size_t total = 0;
        for (const auto& [hash, slot] : m_Slots)
            total += slot->Entries.load(std::memory_order_acquire)->size();
        return total;
    }

    void EventBus::Clear()
    {
        {
            std::shared_lock lock(m_SlotMutex);
            for (auto& [hash, slot] : m_Slots)
            {
                EntryListPtr dropped = slot->Entries.exchange(std::make_shared<const EntryList>(),
                                                              std::memory_order_acq_rel);
                for (const Entry& e : *dropped)
                    e.Alive->store(false, std::memory_order_release);
            }
        }
        {
            std::lock_guard lock(m_MonitorMutex);
            m_Monitors.clear();
        }
        Core::Log::Debug("EventBus: cleared.");
    }
}
