module;
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <entt/entt.hpp>

export module Pulse.Computed;

import Core.Error;
import Core.Logging;
import Pulse.Subscription;
import Pulse.Reactive;

export namespace Pulse
{
    // -------------------------------------------------------------------------
    // ComputedCell<T>: read-only cell derived from a pure computation.
    // -------------------------------------------------------------------------
    // Lazy: dependency changes only mark the cell dirty; the computation runs
    // on the next read. The first computation sets the baseline silently;
    // later ones notify subscribers only when the result differs from the
    // previous cached value.
    //
    // A throwing computation propagates out of Value()/Recompute() and leaves
    // the cell dirty. TryValue() turns the fault into ComputationFailed.
    template <typename T>
    class ComputedCell final : public IReactiveCell
    {
    public:
        using Computation = std::function<T()>;
        using ValueCallback = std::function<void(const T&)>;
        using PreviousCallback = std::function<void(const T& oldValue, const T& newValue)>;

        explicit ComputedCell(Computation computation) : m_Compute(std::move(computation))
        {
            assert(m_Compute && "ComputedCell requires a computation");
        }

        ~ComputedCell() override { m_Channel.Dispose(); }

        ComputedCell(const ComputedCell&) = delete;
        ComputedCell& operator=(const ComputedCell&) = delete;

        [[nodiscard]] CellKind Kind() const override { return CellKind::Computed; }
        [[nodiscard]] const entt::type_info& ValueType() const override { return entt::type_id<T>(); }

        [[nodiscard]] T Value() const
        {
            {
                std::lock_guard lock(m_State->Mutex);
                if (!m_State->Dirty && m_State->Cache) return *m_State->Cache;
            }
            return ComputeAndCommit();
        }

        [[nodiscard]] Core::Expected<T> TryValue() const
        {
            try
            {
                return Value();
            }
            catch (const std::exception& e)
            {
                Core::Log::Error("ComputedCell: computation failed: {}", e.what());
                return Core::Err<T>(Core::ErrorCode::ComputationFailed);
            }
        }

        // Forces the computation regardless of the dirty flag.
        T Recompute() { return ComputeAndCommit(); }

        // Marks the cached value stale without recomputing.
        void Invalidate() { m_State->MarkDirty(); }

        [[nodiscard]] bool IsDirty() const
        {
            std::lock_guard lock(m_State->Mutex);
            return m_State->Dirty;
        }

        // Invalidates this cell whenever `source` changes. The subscription is
        // owned by this cell and released with it; a change delivered after
        // the cell is gone finds no state to mark.
        void TrackDependency(IReactiveCell& source)
        {
            std::weak_ptr<CacheState> weak = m_State;
            m_Channel.AddDependent(source.SubscribeChanges([weak](const entt::any&, const entt::any&)
            {
                if (auto state = weak.lock()) state->MarkDirty();
            }));
        }

        [[nodiscard]] entt::any GetValue() const override { return entt::any{Value()}; }

        Core::Result SetValue(const entt::any&, bool = false) override
        {
            Core::Log::Warn("ComputedCell: cannot assign a value to a computed cell of type '{}'.",
                            entt::type_id<T>().name());
            return Core::Err(Core::ErrorCode::UnsupportedOperation);
        }

        Subscription Subscribe(ValueCallback callback, bool fireOnSubscribe = false)
        {
            if (!callback) return {};
            if (fireOnSubscribe)
            {
                if (auto current = TryValue()) callback(*current);
            }
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
                if (auto current = TryValue()) callback(*current, *current);
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
            if (fireOnSubscribe)
            {
                if (auto current = TryValue()) callback(entt::any{*current});
            }
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
                if (auto current = TryValue())
                {
                    const entt::any boxed{*current};
                    callback(boxed, boxed);
                }
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

    private:
        struct CacheState
        {
            void MarkDirty()
            {
                std::lock_guard lock(Mutex);
                Dirty = true;
                ++Generation;
            }

            std::mutex Mutex;
            std::optional<T> Cache;
            bool Dirty = true;
            uint64_t Generation = 0;
        };

        // Runs the computation outside the lock. The dirty flag is cleared only
        // if nobody invalidated the cell while the computation was running.
        T ComputeAndCommit() const
        {
            uint64_t generation;
            {
                std::lock_guard lock(m_State->Mutex);
                generation = m_State->Generation;
            }

            T result = m_Compute();

            entt::any oldBoxed;
            bool changed = false;
            {
                std::lock_guard lock(m_State->Mutex);
                if (m_State->Cache)
                {
                    if constexpr (std::equality_comparable<T>)
                        changed = !(*m_State->Cache == result);
                    else
                        changed = true;

                    if (changed) oldBoxed = entt::any{*m_State->Cache};
                }
                m_State->Cache = result;
                if (generation == m_State->Generation) m_State->Dirty = false;
            }

            if (changed)
                m_Channel.Notify(*this, std::move(oldBoxed), entt::any{result});

            return result;
        }

        Computation m_Compute;

        std::shared_ptr<CacheState> m_State = std::make_shared<CacheState>();

        ChangeChannel m_Channel;
    };
}
