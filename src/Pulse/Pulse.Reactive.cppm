module;
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

export module Pulse.Reactive;

import Core.Error;
import Core.Logging;
import Pulse.Subscription;
import Pulse.Threading;
import Pulse.Events;

export namespace Pulse
{
    class IReactiveCell;

    // Reverse lookup used by cells to tag their own change events with the
    // key they were registered under. Implemented by PropertyStore.
    class IKeyResolver
    {
    public:
        virtual ~IKeyResolver() = default;
        [[nodiscard]] virtual std::optional<std::string> GetKey(const IReactiveCell& cell) const = 0;
    };

    // Services a cell notifies through. Every member is optional: an unbound
    // cell notifies inline and publishes nothing.
    struct CellContext
    {
        IThreadMarshaller* Marshaller = nullptr;
        EventBus* Events = nullptr;
        const IKeyResolver* Keys = nullptr;
    };

    enum class CellKind : uint8_t
    {
        Mutable,
        Computed
    };

    using BoxedCallback = std::function<void(const entt::any&)>;
    using ChangeCallback = std::function<void(const entt::any& oldValue, const entt::any& newValue)>;

    // -------------------------------------------------------------------------
    // IReactiveCell: type-erased view used by the store and by bindings.
    // -------------------------------------------------------------------------
    class IReactiveCell
    {
    public:
        virtual ~IReactiveCell() = default;

        [[nodiscard]] virtual CellKind Kind() const = 0;
        [[nodiscard]] virtual const entt::type_info& ValueType() const = 0;

        [[nodiscard]] virtual entt::any GetValue() const = 0;

        // Fails with TypeMismatch when `value` does not hold exactly the
        // element type; the write is dropped and nobody is notified.
        virtual Core::Result SetValue(const entt::any& value, bool forceNotify = false) = 0;

        virtual Subscription SubscribeBoxed(BoxedCallback callback, bool fireOnSubscribe = false) = 0;
        virtual Subscription SubscribeChanges(ChangeCallback callback, bool fireOnSubscribe = false) = 0;

        // The cell takes ownership and disposes `subscription` with itself.
        virtual void AddDependentSubscription(Subscription subscription) = 0;

        [[nodiscard]] virtual bool HasSubscribers() const = 0;
        [[nodiscard]] virtual size_t SubscriberCount() const = 0;

        // Drops every subscriber and disposes dependents. No notification.
        virtual void Dispose() = 0;

        virtual void BindContext(const CellContext& context) = 0;
    };

    // -------------------------------------------------------------------------
    // ChangeChannel: the single (old, new) notification path behind every
    // subscriber shape.
    // -------------------------------------------------------------------------
    // Subscribers are copied under the lock and invoked outside it, so a
    // subscriber may dispose itself (or others) while being notified. A
    // subscriber removed before a queued notification runs is skipped.
    class ChangeChannel
    {
    public:
        ChangeChannel();
        ~ChangeChannel();

        ChangeChannel(const ChangeChannel&) = delete;
        ChangeChannel& operator=(const ChangeChannel&) = delete;

        Subscription Add(ChangeCallback callback);

        // Runs subscribers on the main context (inline when already there),
        // then publishes a PropertyChangedEvent.
        void Notify(const IReactiveCell& source, entt::any oldValue, entt::any newValue) const;

        void AddDependent(Subscription subscription);

        [[nodiscard]] size_t Count() const;

        void Dispose();

        void BindContext(const CellContext& context);
        [[nodiscard]] CellContext Context() const;

        // Log + FrameworkErrorEvent (when a bus is bound).
        void ReportError(const std::string& message, Core::ErrorCode code) const;

    private:
        struct Entry
        {
            SubscriptionId Id = kInvalidSubscriptionId;
            ChangeCallback Fn;
            std::shared_ptr<std::atomic<bool>> Alive;
        };

        struct State
        {
            mutable std::mutex Mutex;
            std::vector<Entry> Entries;
            std::vector<Subscription> Dependents;
            SubscriptionId NextId = 1;
            CellContext Context;
        };

        std::shared_ptr<State> m_State;
    };

    // -------------------------------------------------------------------------
    // ReactiveCell<T>: mutable, thread-safe value holder.
    // -------------------------------------------------------------------------
    template <typename T>
    class ReactiveCell : public IReactiveCell
    {
    public:
        using ValueCallback = std::function<void(const T&)>;
        using PreviousCallback = std::function<void(const T& oldValue, const T& newValue)>;

        explicit ReactiveCell(T initial = T{}) : m_Value(std::move(initial)) {}

        ~ReactiveCell() override { m_Channel.Dispose(); }

        ReactiveCell(const ReactiveCell&) = delete;
        ReactiveCell& operator=(const ReactiveCell&) = delete;

        [[nodiscard]] CellKind Kind() const override { return CellKind::Mutable; }
        [[nodiscard]] const entt::type_info& ValueType() const override { return entt::type_id<T>(); }

        [[nodiscard]] T Get() const
        {
            std::lock_guard lock(m_Mutex);
            return m_Value;
        }

        // Writes and notifies when the value changed (or when forced).
        void Set(T value, bool forceNotify = false)
        {
            if (!Admit(value)) return;
            SetInternal(std::move(value), forceNotify);
        }

        [[nodiscard]] entt::any GetValue() const override { return entt::any{Get()}; }

        Core::Result SetValue(const entt::any& value, bool forceNotify = false) override
        {
            const T* typed = value ? entt::any_cast<T>(&value) : nullptr;
            if (!typed || value.type() != entt::type_id<T>())
            {
                const std::string_view actual = value ? value.type().name() : std::string_view{"<empty>"};
                m_Channel.ReportError(std::format("value of type '{}' cannot be assigned to a cell of type '{}'",
                                                  actual, entt::type_id<T>().name()),
                                      Core::ErrorCode::TypeMismatch);
                return Core::Err(Core::ErrorCode::TypeMismatch);
            }

            if (!Admit(*typed)) return Core::Err(Core::ErrorCode::ValidationFailed);

            SetInternal(*typed, forceNotify);
            return Core::Ok();
        }

        Subscription Subscribe(ValueCallback callback, bool fireOnSubscribe = false)
        {
            if (!callback) return {};
            if (fireOnSubscribe) callback(Get());
            return m_Channel.Add([fn = std::move(callback)](const entt::any&, const entt::any& newValue)
            {
                if (const T* v = entt::any_cast<T>(&newValue)) fn(*v);
            });
        }

        Subscription SubscribeWithPrevious(PreviousCallback callback, bool fireOnSubscribe = false)
        {
            if (!callback) return {};
            if (fireOnSubscribe)
            {
                const T current = Get();
                callback(current, current);
            }
            return m_Channel.Add([fn = std::move(callback)](const entt::any& oldValue, const entt::any& newValue)
            {
                const T* o = entt::any_cast<T>(&oldValue);
                const T* n = entt::any_cast<T>(&newValue);
                if (o && n) fn(*o, *n);
            });
        }

        Subscription SubscribeBoxed(BoxedCallback callback, bool fireOnSubscribe = false) override
        {
            if (!callback) return {};
            if (fireOnSubscribe) callback(GetValue());
            return m_Channel.Add([fn = std::move(callback)](const entt::any&, const entt::any& newValue)
            {
                fn(newValue);
            });
        }

        Subscription SubscribeChanges(ChangeCallback callback, bool fireOnSubscribe = false) override
        {
            if (!callback) return {};
            if (fireOnSubscribe)
            {
                const entt::any current = GetValue();
                callback(current, current);
            }
            return m_Channel.Add(std::move(callback));
        }

        void AddDependentSubscription(Subscription subscription) override
        {
            m_Channel.AddDependent(std::move(subscription));
        }

        [[nodiscard]] bool HasSubscribers() const override { return m_Channel.Count() > 0; }
        [[nodiscard]] size_t SubscriberCount() const override { return m_Channel.Count(); }

        void Dispose() override { m_Channel.Dispose(); }

        void BindContext(const CellContext& context) override { m_Channel.BindContext(context); }

    protected:
        // Gate for every write. Rejected writes change nothing.
        virtual bool Admit(const T&) { return true; }

        void ReportError(const std::string& message, Core::ErrorCode code) const
        {
            m_Channel.ReportError(message, code);
        }

        // Read-modify-write. `edit` works on a copy and returns false to leave
        // the value alone. When another writer commits first, the edit is
        // rerun on the newer value, so `edit` must not touch outside state
        // beyond what it recomputes on every call.
        template <typename Edit>
            requires std::predicate<Edit&, T&>
        bool Modify(Edit edit)
        {
            while (true)
            {
                T next;
                uint64_t version;
                {
                    std::lock_guard lock(m_Mutex);
                    next = m_Value;
                    version = m_Version;
                }

                if (!edit(next)) return false;
                if (!Admit(next)) return false;

                entt::any oldBoxed;
                entt::any newBoxed;
                {
                    std::lock_guard lock(m_Mutex);
                    if (version != m_Version) continue;

                    oldBoxed = entt::any{m_Value};
                    m_Value = std::move(next);
                    ++m_Version;
                    newBoxed = entt::any{m_Value};
                }

                m_Channel.Notify(*this, std::move(oldBoxed), std::move(newBoxed));
                return true;
            }
        }

    private:
        void SetInternal(T value, bool forceNotify)
        {
            entt::any oldBoxed;
            entt::any newBoxed;
            {
                std::lock_guard lock(m_Mutex);

                bool changed = true;
                if constexpr (std::equality_comparable<T>)
                    changed = !(m_Value == value);

                if (!changed && !forceNotify) return;

                oldBoxed = entt::any{m_Value};
                if (changed)
                {
                    m_Value = std::move(value);
                    ++m_Version;
                }
                newBoxed = entt::any{m_Value};
            }

            m_Channel.Notify(*this, std::move(oldBoxed), std::move(newBoxed));
        }

        mutable std::mutex m_Mutex;
        T m_Value;
        uint64_t m_Version = 0;
        ChangeChannel m_Channel;
    };
}
