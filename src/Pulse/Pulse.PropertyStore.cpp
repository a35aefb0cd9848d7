module;
#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

module Pulse.PropertyStore;

import Core.Error;
import Core.Logging;
import Pulse.Subscription;
import Pulse.Reactive;

namespace Pulse
{
    PropertyStore::PropertyStore(IThreadMarshaller* marshaller, EventBus* events)
        : m_Marshaller(marshaller), m_Events(events)
    {
        // Const queries need the pools to exist up front.
        m_Registry.storage<PropertyKey>();
        m_Registry.storage<PropertyCell>();
        m_Registry.storage<Persistent>();
    }

    PropertyStore::~PropertyStore()
    {
        // Cells may outlive the store; stop them from reaching back into it.
        std::unique_lock lock(m_Mutex);
        for (auto [entity, record] : m_Registry.view<PropertyCell>().each())
        {
            if (record.Cell) record.Cell->BindContext({});
        }
    }

    CellContext PropertyStore::MakeContext() const
    {
        return CellContext{m_Marshaller, m_Events, this};
    }

    Core::Result PropertyStore::RegisterProperty(const std::string& key, std::shared_ptr<IReactiveCell> cell,
                                                 bool persistent)
    {
        if (key.empty() || !cell)
        {
            Core::Log::Warn("PropertyStore: rejected registration (empty key or null cell).");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        // Bind first so no write can slip out between insertion and binding.
        cell->BindContext(MakeContext());

        std::vector<PropertyCallback> pending;
        {
            std::unique_lock lock(m_Mutex);
            InsertLocked(key, cell, persistent);
            // Taken under the same exclusive lock: a concurrent SubscribeDeferred
            // either sees the record or is already in this batch.
            pending = TakePending(key);
        }

        NotifyRegistered(key, cell);
        RunDeferred(key, pending, cell);
        return Core::Ok();
    }

    Core::Expected<std::shared_ptr<IReactiveCell>> PropertyStore::GetOrInsert(const std::string& key,
                                                                              const entt::type_info& type,
                                                                              CellKind kind,
                                                                              const CellFactory& factory,
                                                                              bool persistent)
    {
        if (key.empty())
        {
            Core::Log::Warn("PropertyStore: rejected empty property key.");
            return Core::Err<std::shared_ptr<IReactiveCell>>(Core::ErrorCode::InvalidArgument);
        }

        std::shared_ptr<IReactiveCell> cell;
        std::vector<PropertyCallback> pending;
        {
            std::unique_lock lock(m_Mutex);

            // 1. Check Cache
            if (auto it = m_Lookup.find(key); it != m_Lookup.end())
            {
                const auto& existing = m_Registry.get<PropertyCell>(it->second).Cell;
                if (existing->Kind() != kind || existing->ValueType() != type)
                {
                    Core::Log::Error("PropertyStore: '{}' holds '{}', requested '{}'.",
                                     key, existing->ValueType().name(), type.name());
                    return Core::Err<std::shared_ptr<IReactiveCell>>(Core::ErrorCode::TypeMismatch);
                }
                return existing;
            }

            // 2. Create and register as one step
            cell = factory();
            cell->BindContext(MakeContext());
            InsertLocked(key, cell, persistent);
            pending = TakePending(key);
        }

        NotifyRegistered(key, cell);
        RunDeferred(key, pending, cell);
        return cell;
    }

    void PropertyStore::InsertLocked(const std::string& key, const std::shared_ptr<IReactiveCell>& cell,
                                     bool persistent)
    {
        if (auto it = m_Lookup.find(key); it != m_Lookup.end())
        {
            Core::Log::Debug("PropertyStore: replacing '{}'.", key);
            DestroyLocked(it->second, cell.get());
        }

        const auto entity = m_Registry.create();
        m_Registry.emplace<PropertyKey>(entity, key);
        m_Registry.emplace<PropertyCell>(entity, cell);
        if (persistent) m_Registry.emplace<Persistent>(entity);

        m_Lookup[key] = entity;
        // A cell registered under several keys reports the most recent one.
        m_ReverseLookup[cell.get()] = entity;
    }

    void PropertyStore::DestroyLocked(entt::entity entity, const IReactiveCell* incoming)
    {
        // Copies: the components die with the entity.
        const std::string key = m_Registry.get<PropertyKey>(entity).Value;
        const std::shared_ptr<IReactiveCell> cell = m_Registry.get<PropertyCell>(entity).Cell;

        m_Lookup.erase(key);
        m_Registry.destroy(entity);

        auto rit = m_ReverseLookup.find(cell.get());
        if (rit == m_ReverseLookup.end() || rit->second != entity) return;

        if (const entt::entity holder = FindHolderLocked(cell.get()); holder != entt::null)
        {
            rit->second = holder;
            return;
        }

        m_ReverseLookup.erase(rit);
        if (cell.get() != incoming) cell->BindContext({});
    }

    entt::entity PropertyStore::FindHolderLocked(const IReactiveCell* cell) const
    {
        for (auto [entity, record] : m_Registry.view<PropertyCell>().each())
        {
            if (record.Cell.get() == cell) return entity;
        }
        return entt::null;
    }

    std::vector<PropertyStore::PropertyCallback> PropertyStore::TakePending(const std::string& key)
    {
        std::vector<PropertyCallback> callbacks;

        std::lock_guard lock(m_Deferred->Mutex);
        auto it = m_Deferred->Pending.find(key);
        if (it == m_Deferred->Pending.end()) return callbacks;

        callbacks.reserve(it->second.size());
        for (DeferredEntry& entry : it->second)
            callbacks.push_back(std::move(entry.Callback));
        m_Deferred->Pending.erase(it);
        return callbacks;
    }

    void PropertyStore::RunDeferred(const std::string& key, const std::vector<PropertyCallback>& callbacks,
                                    const std::shared_ptr<IReactiveCell>& cell)
    {
        for (const auto& callback : callbacks)
        {
            try
            {
                callback(cell);
            }
            catch (const std::exception& e)
            {
                Core::Log::Error("PropertyStore: deferred subscriber for '{}' threw: {}", key, e.what());
            }
        }
    }

    void PropertyStore::NotifyRegistered(const std::string& key, const std::shared_ptr<IReactiveCell>& cell)
    {
        std::vector<RegisteredCallback> observers;
        {
            std::lock_guard lock(m_Registered->Mutex);
            observers.reserve(m_Registered->Entries.size());
            for (const auto& [id, fn] : m_Registered->Entries)
                observers.push_back(fn);
        }

        for (const auto& observer : observers)
        {
            try
            {
                observer(key, cell);
            }
            catch (const std::exception& e)
            {
                Core::Log::Error("PropertyStore: registration observer for '{}' threw: {}", key, e.what());
            }
        }
    }

    Subscription PropertyStore::SubscribeDeferred(const std::string& key, PropertyCallback callback)
    {
        if (!callback) return {};

        std::shared_ptr<IReactiveCell> cell;
        const SubscriptionId id = m_NextId.fetch_add(1, std::memory_order_relaxed);
        {
            std::shared_lock lock(m_Mutex);
            if (auto it = m_Lookup.find(key); it != m_Lookup.end())
            {
                cell = m_Registry.get<PropertyCell>(it->second).Cell;
            }
            else
            {
                // Register for future (still under the shared lock, see RegisterProperty).
                std::lock_guard pendingLock(m_Deferred->Mutex);
                m_Deferred->Pending[key].push_back(DeferredEntry{id, std::move(callback)});
            }
        }

        if (cell)
        {
            // Already present: fire immediately, outside the lock.
            RunDeferred(key, {callback}, cell);
            return {};
        }

        std::weak_ptr<DeferredTable> weak = m_Deferred;
        return Subscription(id, [weak, key, id]()
        {
            auto table = weak.lock();
            if (!table) return;

            std::lock_guard lock(table->Mutex);
            auto it = table->Pending.find(key);
            if (it == table->Pending.end()) return;

            std::erase_if(it->second, [id](const DeferredEntry& e) { return e.Id == id; });
            if (it->second.empty()) table->Pending.erase(it);
        });
    }

    Subscription PropertyStore::OnPropertyRegistered(RegisteredCallback callback)
    {
        if (!callback) return {};

        const SubscriptionId id = m_NextId.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(m_Registered->Mutex);
            m_Registered->Entries.emplace_back(id, std::move(callback));
        }

        std::weak_ptr<RegisteredTable> weak = m_Registered;
        return Subscription(id, [weak, id]()
        {
            auto table = weak.lock();
            if (!table) return;

            std::lock_guard lock(table->Mutex);
            std::erase_if(table->Entries, [id](const auto& e) { return e.first == id; });
        });
    }

    std::shared_ptr<IReactiveCell> PropertyStore::GetProperty(const std::string& key) const
    {
        std::shared_lock lock(m_Mutex);
        auto it = m_Lookup.find(key);
        if (it == m_Lookup.end()) return nullptr;
        return m_Registry.get<PropertyCell>(it->second).Cell;
    }

    bool PropertyStore::UnregisterProperty(const std::string& key)
    {
        std::unique_lock lock(m_Mutex);
        auto it = m_Lookup.find(key);
        if (it == m_Lookup.end()) return false;

        DestroyLocked(it->second);
        return true;
    }

    void PropertyStore::ClearNonPersistentProperties()
    {
        std::unique_lock lock(m_Mutex);

        std::vector<entt::entity> doomed;
        for (auto entity : m_Registry.view<PropertyKey>(entt::exclude<Persistent>))
            doomed.push_back(entity);

        for (auto entity : doomed)
            DestroyLocked(entity);

        Core::Log::Debug("PropertyStore: cleared {} non-persistent properties.", doomed.size());
    }

    void PropertyStore::Clear()
    {
        std::unique_lock lock(m_Mutex);
        for (auto [entity, record] : m_Registry.view<PropertyCell>().each())
        {
            if (record.Cell) record.Cell->BindContext({});
        }
        m_Registry.clear();
        m_Lookup.clear();
        m_ReverseLookup.clear();
        {
            std::lock_guard pendingLock(m_Deferred->Mutex);
            m_Deferred->Pending.clear();
        }
    }

    std::optional<std::string> PropertyStore::GetKey(const IReactiveCell& cell) const
    {
        std::shared_lock lock(m_Mutex);
        auto it = m_ReverseLookup.find(&cell);
        if (it == m_ReverseLookup.end()) return std::nullopt;
        return m_Registry.get<PropertyKey>(it->second).Value;
    }

    bool PropertyStore::HasProperty(const std::string& key) const
    {
        std::shared_lock lock(m_Mutex);
        return m_Lookup.contains(key);
    }

    bool PropertyStore::IsPersistent(const std::string& key) const
    {
        std::shared_lock lock(m_Mutex);
        auto it = m_Lookup.find(key);
        return it != m_Lookup.end() && m_Registry.all_of<Persistent>(it->second);
    }

    std::vector<std::string> PropertyStore::GetAllPropertyKeys() const
    {
        std::vector<std::string> keys;
        {
            std::shared_lock lock(m_Mutex);
            keys.reserve(m_Lookup.size());
            for (const auto& [key, entity] : m_Lookup)
                keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    std::vector<std::string> PropertyStore::GetPersistentPropertyKeys() const
    {
        std::vector<std::string> keys;
        {
            std::shared_lock lock(m_Mutex);
            for (auto [entity, key] : m_Registry.view<PropertyKey, Persistent>().each())
                keys.push_back(key.Value);
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    size_t PropertyStore::PropertyCount() const
    {
        std::shared_lock lock(m_Mutex);
        return m_Lookup.size();
    }
}
