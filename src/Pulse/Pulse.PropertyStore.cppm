module;
#include <atomic>
#include <cstddef>
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

export module Pulse.PropertyStore;

import Core.Error;
import Core.Logging;
import Pulse.Subscription;
import Pulse.Threading;
import Pulse.Events;
import Pulse.Reactive;
import Pulse.Computed;

export namespace Pulse
{
    // --- Components ---

    struct PropertyKey
    {
        std::string Value;
    };

    struct PropertyCell
    {
        std::shared_ptr<IReactiveCell> Cell;
    };

    // Tag: survives ClearNonPersistentProperties(). Saving is up to the host.
    struct Persistent
    {
    };

    // --- Property Store ---

    // Central keyed registry of reactive cells. Every record is an entity in
    // an entt::registry; the store keeps a key -> entity lookup and a
    // cell -> entity reverse lookup used to tag PropertyChangedEvents.
    class PropertyStore final : public IKeyResolver
    {
    public:
        using PropertyCallback = std::function<void(const std::shared_ptr<IReactiveCell>&)>;
        using RegisteredCallback = std::function<void(const std::string& key, const std::shared_ptr<IReactiveCell>&)>;

        // Cells registered here are bound to `marshaller` and `events` and
        // resolve their keys through this store.
        explicit PropertyStore(IThreadMarshaller* marshaller = nullptr, EventBus* events = nullptr);
        ~PropertyStore() override;

        PropertyStore(const PropertyStore&) = delete;
        PropertyStore& operator=(const PropertyStore&) = delete;

        // 1. Register: replaces any record under `key`, then resolves every
        // deferred subscription waiting on it (exactly once each).
        Core::Result RegisterProperty(const std::string& key, std::shared_ptr<IReactiveCell> cell,
                                      bool persistent = false);

        // 2. Get-or-create: same instance on every call. TypeMismatch if the
        // existing record holds a different element type or a computed cell.
        template <typename T>
        Core::Expected<std::shared_ptr<ReactiveCell<T>>> GetOrCreateProperty(const std::string& key,
                                                                            T defaultValue = T{},
                                                                            bool persistent = false)
        {
            auto cell = GetOrInsert(key, entt::type_id<T>(), CellKind::Mutable,
                                    [&defaultValue]() -> std::shared_ptr<IReactiveCell>
                                    {
                                        return std::make_shared<ReactiveCell<T>>(std::move(defaultValue));
                                    },
                                    persistent);
            if (!cell) return std::unexpected(cell.error());
            return std::static_pointer_cast<ReactiveCell<T>>(*cell);
        }

        // 3. Lookup. Untyped: nullptr when absent.
        [[nodiscard]] std::shared_ptr<IReactiveCell> GetProperty(const std::string& key) const;

        template <typename T>
        [[nodiscard]] Core::Expected<std::shared_ptr<ReactiveCell<T>>> GetProperty(const std::string& key) const
        {
            auto cell = GetProperty(key);
            if (!cell) return Core::Err<std::shared_ptr<ReactiveCell<T>>>(Core::ErrorCode::PropertyNotFound);
            if (cell->Kind() != CellKind::Mutable || cell->ValueType() != entt::type_id<T>())
                return Core::Err<std::shared_ptr<ReactiveCell<T>>>(Core::ErrorCode::TypeMismatch);
            return std::static_pointer_cast<ReactiveCell<T>>(cell);
        }

        template <typename T>
        [[nodiscard]] Core::Expected<std::shared_ptr<ComputedCell<T>>> GetComputedProperty(const std::string& key) const
        {
            auto cell = GetProperty(key);
            if (!cell) return Core::Err<std::shared_ptr<ComputedCell<T>>>(Core::ErrorCode::PropertyNotFound);
            if (cell->Kind() != CellKind::Computed || cell->ValueType() != entt::type_id<T>())
                return Core::Err<std::shared_ptr<ComputedCell<T>>>(Core::ErrorCode::TypeMismatch);
            return std::static_pointer_cast<ComputedCell<T>>(cell);
        }

        // 4. Deferred subscription: fires synchronously if `key` exists,
        // otherwise once, on the registration of `key`.
        Subscription SubscribeDeferred(const std::string& key, PropertyCallback callback);

        // Observers of every successful registration.
        Subscription OnPropertyRegistered(RegisteredCallback callback);

        bool UnregisterProperty(const std::string& key);
        void ClearNonPersistentProperties();
        void Clear();

        [[nodiscard]] std::optional<std::string> GetKey(const IReactiveCell& cell) const override;

        [[nodiscard]] bool HasProperty(const std::string& key) const;
        [[nodiscard]] bool IsPersistent(const std::string& key) const;
        [[nodiscard]] std::vector<std::string> GetAllPropertyKeys() const;
        [[nodiscard]] std::vector<std::string> GetPersistentPropertyKeys() const;
        [[nodiscard]] size_t PropertyCount() const;

    private:
        using CellFactory = std::function<std::shared_ptr<IReactiveCell>()>;

        struct DeferredEntry
        {
            SubscriptionId Id = kInvalidSubscriptionId;
            PropertyCallback Callback;
        };

        // Shared with disposal tokens so they stay safe after the store dies.
        struct DeferredTable
        {
            std::mutex Mutex;
            std::unordered_map<std::string, std::vector<DeferredEntry>> Pending;
        };

        struct RegisteredTable
        {
            std::mutex Mutex;
            std::vector<std::pair<SubscriptionId, RegisteredCallback>> Entries;
        };

        Core::Expected<std::shared_ptr<IReactiveCell>> GetOrInsert(const std::string& key,
                                                                   const entt::type_info& type, CellKind kind,
                                                                   const CellFactory& factory, bool persistent);

        // Requires m_Mutex held exclusively.
        void InsertLocked(const std::string& key, const std::shared_ptr<IReactiveCell>& cell, bool persistent);
        // Unbinds the removed cell unless another key still holds it or it is
        // `incoming`, the cell about to take the same key.
        void DestroyLocked(entt::entity entity, const IReactiveCell* incoming = nullptr);
        [[nodiscard]] entt::entity FindHolderLocked(const IReactiveCell* cell) const;

        std::vector<PropertyCallback> TakePending(const std::string& key);
        void NotifyRegistered(const std::string& key, const std::shared_ptr<IReactiveCell>& cell);
        static void RunDeferred(const std::string& key, const std::vector<PropertyCallback>& callbacks,
                                const std::shared_ptr<IReactiveCell>& cell);

        [[nodiscard]] CellContext MakeContext() const;

        IThreadMarshaller* m_Marshaller;
        EventBus* m_Events;

        entt::registry m_Registry;
        std::unordered_map<std::string, entt::entity> m_Lookup;
        std::unordered_map<const IReactiveCell*, entt::entity> m_ReverseLookup;

        std::shared_ptr<DeferredTable> m_Deferred = std::make_shared<DeferredTable>();
        std::shared_ptr<RegisteredTable> m_Registered = std::make_shared<RegisteredTable>();
        std::atomic<SubscriptionId> m_NextId{1};

        mutable std::shared_mutex m_Mutex;
    };
}
