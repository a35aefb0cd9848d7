module;
#include <atomic>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

export module Pulse.Events;

import Pulse.Subscription;
import Pulse.Threading;

export namespace Pulse
{
    // -------------------------------------------------------------------------
    // EventBase: common payload header of every published event.
    // -------------------------------------------------------------------------
    class EventBase
    {
    public:
        using Clock = std::chrono::system_clock;

        virtual ~EventBase() = default;

        [[nodiscard]] Clock::time_point Timestamp() const { return m_Timestamp; }
        [[nodiscard]] const std::string& EventId() const { return m_EventId; }
        [[nodiscard]] const std::optional<std::string>& Source() const { return m_Source; }

        void SetSource(std::string source) { m_Source = std::move(source); }

    protected:
        EventBase();
        explicit EventBase(std::string source);

        EventBase(const EventBase&) = default;
        EventBase& operator=(const EventBase&) = default;
        EventBase(EventBase&&) = default;
        EventBase& operator=(EventBase&&) = default;

    private:
        Clock::time_point m_Timestamp;
        std::string m_EventId;
        std::optional<std::string> m_Source;
    };

    // Random (version 4) UUID in canonical 8-4-4-4-12 hex form.
    [[nodiscard]] std::string GenerateEventId();

    template <typename T>
    concept Event = std::derived_from<T, EventBase> && std::copy_constructible<T>;

    // -------------------------------------------------------------------------
    // EventBus: typed publish/subscribe keyed by event type.
    // -------------------------------------------------------------------------
    // Each event type owns an immutable subscriber list published through an
    // atomic shared_ptr. Publishers read it without locking; Subscribe and
    // Unsubscribe rebuild it and compare-and-swap it back, retrying on conflict.
    class EventBus
    {
    public:
        using Handler = std::function<void(const EventBase&)>;
        using Monitor = std::function<void(const EventBase&)>;

        // With a marshaller, handlers run on its main context; otherwise inline
        // on the publishing thread.
        explicit EventBus(IThreadMarshaller* marshaller = nullptr);
        ~EventBus();

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;
        EventBus(EventBus&&) = delete;
        EventBus& operator=(EventBus&&) = delete;

        void Initialize();
        [[nodiscard]] bool IsInitialized() const { return m_Initialized.load(std::memory_order_acquire); }

        void SetMarshaller(IThreadMarshaller* marshaller) { m_Marshaller.store(marshaller, std::memory_order_release); }
        [[nodiscard]] IThreadMarshaller* GetMarshaller() const { return m_Marshaller.load(std::memory_order_acquire); }

        // Higher priority runs first. `receiver` tags the registration for bulk
        // removal through Unsubscribe(receiver).
        template <Event T>
        Subscription Subscribe(std::function<void(const T&)> handler, int priority = 0, const void* receiver = nullptr)
        {
            if (!handler) return {};
            Handler erased = [fn = std::move(handler)](const EventBase& e)
            {
                fn(static_cast<const T&>(e));
            };
            return SubscribeErased(entt::type_id<T>(), std::move(erased), priority, receiver);
        }

        template <Event T, typename R>
        Subscription Subscribe(R* receiver, void (R::*method)(const T&), int priority = 0)
        {
            Handler erased = [receiver, method](const EventBase& e)
            {
                (receiver->*method)(static_cast<const T&>(e));
            };
            return SubscribeErased(entt::type_id<T>(), std::move(erased), priority, receiver);
        }

        // Returns true if the registration existed.
        template <Event T>
        bool Unsubscribe(SubscriptionId id)
        {
            return UnsubscribeErased(entt::type_id<T>().hash(), id);
        }

        // Removes every registration tagged with `receiver`, across all event
        // types. Returns the number removed.
        size_t Unsubscribe(const void* receiver);

        template <Event T>
        void Publish(const T& event)
        {
            PublishErased(entt::type_id<T>(), std::make_shared<const T>(event));
        }

        // Monitors see every published event before any handler. A throwing
        // monitor is logged and does not block publishing.
        Subscription OnEventPublished(Monitor monitor);

        template <Event T>
        [[nodiscard]] size_t GetSubscriberCount() const
        {
            return GetSubscriberCountErased(entt::type_id<T>().hash());
        }

        // Zero until Initialize() has run.
        [[nodiscard]] size_t GetTotalSubscriberCount() const;

        // Drops every registration and monitor. The init latch stays set.
        void Clear();

    private:
        struct Entry
        {
            SubscriptionId Id = kInvalidSubscriptionId;
            int Priority = 0;
            const void* Receiver = nullptr;
            Handler Fn;
            // Cleared on removal; queued dispatches skip entries whose flag is down.
            std::shared_ptr<std::atomic<bool>> Alive;
        };

        using EntryList = std::vector<Entry>;
        using EntryListPtr = std::shared_ptr<const EntryList>;

        struct Slot
        {
            explicit Slot(const entt::type_info& type) : Type(type) {}

            entt::type_info Type;
            std::atomic<EntryListPtr> Entries{std::make_shared<const EntryList>()};
        };

        Subscription SubscribeErased(const entt::type_info& type, Handler handler, int priority, const void* receiver);
        bool UnsubscribeErased(entt::id_type typeHash, SubscriptionId id);
        void PublishErased(const entt::type_info& type, std::shared_ptr<const EventBase> event);
        [[nodiscard]] size_t GetSubscriberCountErased(entt::id_type typeHash) const;

        Slot& AcquireSlot(const entt::type_info& type);
        [[nodiscard]] Slot* FindSlot(entt::id_type typeHash) const;

        void NotifyMonitors(const EventBase& event, const entt::type_info& type);

        std::atomic<bool> m_Initialized{false};
        std::mutex m_InitMutex;
        std::atomic<IThreadMarshaller*> m_Marshaller{nullptr};
        std::atomic<SubscriptionId> m_NextId{1};

        mutable std::shared_mutex m_SlotMutex;
        std::unordered_map<entt::id_type, std::unique_ptr<Slot>> m_Slots;

        mutable std::mutex m_MonitorMutex;
        std::vector<std::pair<SubscriptionId, Monitor>> m_Monitors;

        // Tokens hold a weak reference so disposal after the bus is gone is a no-op.
        std::shared_ptr<EventBus*> m_Lifetime;
    };
}
