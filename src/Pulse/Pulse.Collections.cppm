module;
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

export module Pulse.Collections;

import Core.Error;
import Core.Logging;
import Pulse.Subscription;
import Pulse.Reactive;

export namespace Pulse
{
    enum class CollectionAction : uint8_t
    {
        Added,
        Removed,
        Changed,
        Cleared
    };

    // -------------------------------------------------------------------------
    // ReactiveCollection<T>: a ReactiveCell<std::vector<T>> with per-item
    // notifications.
    // -------------------------------------------------------------------------
    // Every edit commits one new list, so value subscribers and the property
    // bus still see a single (old list, new list) change. Item callbacks go
    // through the same marshaller as the cell and run after the value
    // notification of the same edit. Set() replaces the whole list and raises
    // no item callbacks.
    template <typename T>
    class ReactiveCollection : public ReactiveCell<std::vector<T>>
    {
        using Base = ReactiveCell<std::vector<T>>;

    public:
        using ItemsCallback = std::function<void(const std::vector<T>& items)>;
        using ClearedCallback = std::function<void()>;

        explicit ReactiveCollection(std::vector<T> initial = {}) : Base(std::move(initial)) {}

        ~ReactiveCollection() override { m_Items.Dispose(); }

        void Add(T item)
        {
            std::vector<T> added;
            const bool committed = this->Modify([&](std::vector<T>& items)
            {
                added.assign(1, item);
                items.push_back(item);
                return true;
            });
            if (committed) Raise(CollectionAction::Added, std::move(added));
        }

        // No-op for an empty batch.
        void AddRange(std::vector<T> batch)
        {
            if (batch.empty()) return;

            const bool committed = this->Modify([&](std::vector<T>& items)
            {
                items.insert(items.end(), batch.begin(), batch.end());
                return true;
            });
            if (committed) Raise(CollectionAction::Added, std::move(batch));
        }

        // Removes the first element equal to `item`.
        bool Remove(const T& item)
            requires std::equality_comparable<T>
        {
            std::vector<T> removed;
            const bool committed = this->Modify([&](std::vector<T>& items)
            {
                auto it = std::find(items.begin(), items.end(), item);
                if (it == items.end()) return false;

                removed.assign(1, *it);
                items.erase(it);
                return true;
            });
            if (committed) Raise(CollectionAction::Removed, std::move(removed));
            return committed;
        }

        // False when `index` is out of range.
        bool RemoveAt(size_t index)
        {
            std::vector<T> removed;
            const bool committed = this->Modify([&](std::vector<T>& items)
            {
                if (index >= items.size()) return false;

                removed.assign(1, items[index]);
                items.erase(items.begin() + static_cast<std::ptrdiff_t>(index));
                return true;
            });
            if (committed) Raise(CollectionAction::Removed, std::move(removed));
            return committed;
        }

        // Raises Removed for the old element, then Added for the new one.
        Core::Result SetAt(size_t index, T item)
        {
            std::vector<T> replaced;
            bool outOfRange = false;
            const bool committed = this->Modify([&](std::vector<T>& items)
            {
                outOfRange = index >= items.size();
                if (outOfRange) return false;

                replaced.assign(1, items[index]);
                items[index] = item;
                return true;
            });

            if (outOfRange)
            {
                Core::Log::Warn("ReactiveCollection: index {} is out of range.", index);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
            if (!committed) return Core::Err(Core::ErrorCode::ValidationFailed);

            Raise(CollectionAction::Removed, std::move(replaced));
            Raise(CollectionAction::Added, std::vector<T>{std::move(item)});
            return Core::Ok();
        }

        // No-op when already empty.
        void Clear()
        {
            const bool committed = this->Modify([](std::vector<T>& items)
            {
                if (items.empty()) return false;
                items.clear();
                return true;
            });
            if (committed) Raise(CollectionAction::Cleared, {});
        }

        [[nodiscard]] size_t Count() const { return this->Get().size(); }

        [[nodiscard]] Core::Expected<T> At(size_t index) const
        {
            std::vector<T> items = this->Get();
            if (index >= items.size()) return Core::Err<T>(Core::ErrorCode::InvalidArgument);
            return std::move(items[index]);
        }

        [[nodiscard]] bool Contains(const T& item) const
            requires std::equality_comparable<T>
        {
            return IndexOf(item).has_value();
        }

        [[nodiscard]] std::optional<size_t> IndexOf(const T& item) const
            requires std::equality_comparable<T>
        {
            const std::vector<T> items = this->Get();
            auto it = std::find(items.begin(), items.end(), item);
            if (it == items.end()) return std::nullopt;
            return static_cast<size_t>(it - items.begin());
        }

        Subscription OnItemsAdded(ItemsCallback callback) { return Listen(CollectionAction::Added, std::move(callback)); }

        Subscription OnItemsRemoved(ItemsCallback callback)
        {
            return Listen(CollectionAction::Removed, std::move(callback));
        }

        Subscription OnCleared(ClearedCallback callback)
        {
            if (!callback) return {};
            return Listen(CollectionAction::Cleared, [fn = std::move(callback)](const std::vector<T>&) { fn(); });
        }

        void Dispose() override
        {
            Base::Dispose();
            m_Items.Dispose();
        }

        // Item callbacks share the marshaller but never publish on the bus.
        void BindContext(const CellContext& context) override
        {
            Base::BindContext(context);
            m_Items.BindContext(CellContext{context.Marshaller, nullptr, nullptr});
        }

    private:
        struct ItemChange
        {
            CollectionAction Action;
            std::vector<T> Items;
        };

        void Raise(CollectionAction action, std::vector<T> items)
        {
            m_Items.Notify(*this, entt::any{}, entt::any{ItemChange{action, std::move(items)}});
        }

        Subscription Listen(CollectionAction action, ItemsCallback callback)
        {
            if (!callback) return {};
            return m_Items.Add([action, fn = std::move(callback)](const entt::any&, const entt::any& payload)
            {
                const ItemChange* change = entt::any_cast<ItemChange>(&payload);
                if (change && change->Action == action) fn(change->Items);
            });
        }

        ChangeChannel m_Items;
    };

    // -------------------------------------------------------------------------
    // ValidatedCollection<T>: a ReactiveCollection whose every edit, item
    // edits included, must leave a list that passes all validators.
    // -------------------------------------------------------------------------
    template <typename T>
    class ValidatedCollection final : public ReactiveCollection<T>
    {
        struct CreateTag
        {
            explicit CreateTag() = default;
        };

    public:
        // Returns an error message when `items` is invalid.
        using Validator = std::function<std::optional<std::string>(const std::vector<T>&)>;
        using StateCallback = std::function<void(bool valid, const std::vector<std::string>& errors)>;

        // Fails with ValidationFailed when `initial` does not pass.
        static Core::Expected<std::shared_ptr<ValidatedCollection>> Create(std::vector<T> initial,
                                                                           std::vector<Validator> validators)
        {
            auto collection = std::make_shared<ValidatedCollection>(CreateTag{}, std::move(initial),
                                                                     std::move(validators));
            std::vector<std::string> errors;
            if (!collection->Validate(collection->Get(), errors))
            {
                Core::Log::Error("ValidatedCollection: initial list does not pass validation ({} error(s)).",
                                 errors.size());
                return Core::Err<std::shared_ptr<ValidatedCollection>>(Core::ErrorCode::ValidationFailed);
            }
            return collection;
        }

        ValidatedCollection(CreateTag, std::vector<T> initial, std::vector<Validator> validators)
            : ReactiveCollection<T>(std::move(initial)), m_Validators(std::move(validators))
        {
        }

        ~ValidatedCollection() override { m_StateChannel.Dispose(); }

        [[nodiscard]] bool Validate(const std::vector<T>& items, std::vector<std::string>& errors) const
        {
            errors.clear();
            for (const Validator& validator : m_Validators)
            {
                if (auto message = validator(items))
                    errors.push_back(std::move(*message));
            }
            return errors.empty();
        }

        // Validity of the most recent attempted write.
        [[nodiscard]] bool IsValid() const
        {
            std::lock_guard lock(m_StateMutex);
            return m_LastErrors.empty();
        }

        [[nodiscard]] std::vector<std::string> LastErrors() const
        {
            std::lock_guard lock(m_StateMutex);
            return m_LastErrors;
        }

        // Fires when an attempted write flips validity or changes the messages.
        Subscription OnValidationStateChanged(StateCallback callback)
        {
            if (!callback) return {};
            return m_StateChannel.Add([fn = std::move(callback)](const entt::any&, const entt::any& payload)
            {
                if (const auto* errors = entt::any_cast<std::vector<std::string>>(&payload))
                    fn(errors->empty(), *errors);
            });
        }

        void Dispose() override
        {
            ReactiveCollection<T>::Dispose();
            m_StateChannel.Dispose();
        }

        void BindContext(const CellContext& context) override
        {
            ReactiveCollection<T>::BindContext(context);
            m_StateChannel.BindContext(CellContext{context.Marshaller, nullptr, nullptr});
        }

    protected:
        bool Admit(const std::vector<T>& items) override
        {
            std::vector<std::string> errors;
            const bool valid = Validate(items, errors);

            bool changed = false;
            {
                std::lock_guard lock(m_StateMutex);
                if (m_LastErrors != errors)
                {
                    m_LastErrors = errors;
                    changed = true;
                }
            }
            if (changed) m_StateChannel.Notify(*this, entt::any{}, entt::any{errors});

            if (!valid) Core::Log::Warn("ValidatedCollection: write rejected ({} error(s)).", errors.size());
            return valid;
        }

    private:
        const std::vector<Validator> m_Validators;

        mutable std::mutex m_StateMutex;
        std::vector<std::string> m_LastErrors;
        ChangeChannel m_StateChannel;
    };

    // -------------------------------------------------------------------------
    // ReactiveDictionary<K, V>: a ReactiveCell<std::unordered_map<K, V>> with
    // per-entry notifications.
    // -------------------------------------------------------------------------
    template <typename K, typename V>
    class ReactiveDictionary : public ReactiveCell<std::unordered_map<K, V>>
    {
        using Map = std::unordered_map<K, V>;
        using Base = ReactiveCell<Map>;

    public:
        using EntryCallback = std::function<void(const K& key, const V& value)>;
        using KeyCallback = std::function<void(const K& key)>;
        using ClearedCallback = std::function<void()>;

        explicit ReactiveDictionary(Map initial = {}) : Base(std::move(initial)) {}

        ~ReactiveDictionary() override { m_Entries.Dispose(); }

        // Fails with InvalidArgument when `key` is already present.
        Core::Result Add(K key, V value)
        {
            bool duplicate = false;
            const bool committed = this->Modify([&](Map& map)
            {
                duplicate = map.contains(key);
                if (duplicate) return false;
                map.emplace(key, value);
                return true;
            });

            if (duplicate)
            {
                Core::Log::Warn("ReactiveDictionary: key already present.");
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
            if (!committed) return Core::Err(Core::ErrorCode::ValidationFailed);

            Raise(CollectionAction::Added, std::move(key), std::move(value));
            return Core::Ok();
        }

        // Inserts or overwrites. An overwrite with an equal value is silent.
        void Assign(K key, V value)
        {
            bool existed = false;
            const bool committed = this->Modify([&](Map& map)
            {
                auto it = map.find(key);
                existed = it != map.end();
                if (!existed)
                {
                    map.emplace(key, value);
                    return true;
                }
                if constexpr (std::equality_comparable<V>)
                {
                    if (it->second == value) return false;
                }
                it->second = value;
                return true;
            });

            if (committed)
                Raise(existed ? CollectionAction::Changed : CollectionAction::Added, std::move(key), std::move(value));
        }

        bool Remove(const K& key)
        {
            const bool committed = this->Modify([&](Map& map) { return map.erase(key) > 0; });
            if (committed) Raise(CollectionAction::Removed, key, std::nullopt);
            return committed;
        }

        // No-op when already empty.
        void Clear()
        {
            const bool committed = this->Modify([](Map& map)
            {
                if (map.empty()) return false;
                map.clear();
                return true;
            });
            if (committed) Raise(CollectionAction::Cleared, std::nullopt, std::nullopt);
        }

        [[nodiscard]] size_t Count() const { return this->Get().size(); }
        [[nodiscard]] bool ContainsKey(const K& key) const { return this->Get().contains(key); }

        [[nodiscard]] std::optional<V> TryGetValue(const K& key) const
        {
            const Map map = this->Get();
            auto it = map.find(key);
            if (it == map.end()) return std::nullopt;
            return it->second;
        }

        [[nodiscard]] std::vector<K> Keys() const
        {
            std::vector<K> keys;
            for (const auto& [key, value] : this->Get())
                keys.push_back(key);
            return keys;
        }

        [[nodiscard]] std::vector<V> Values() const
        {
            std::vector<V> values;
            for (const auto& [key, value] : this->Get())
                values.push_back(value);
            return values;
        }

        Subscription OnItemAdded(EntryCallback callback) { return ListenEntry(CollectionAction::Added, std::move(callback)); }

        Subscription OnItemChanged(EntryCallback callback)
        {
            return ListenEntry(CollectionAction::Changed, std::move(callback));
        }

        Subscription OnItemRemoved(KeyCallback callback)
        {
            if (!callback) return {};
            return Listen(CollectionAction::Removed, [fn = std::move(callback)](const EntryChange& change)
            {
                fn(*change.Key);
            });
        }

        Subscription OnCleared(ClearedCallback callback)
        {
            if (!callback) return {};
            return Listen(CollectionAction::Cleared, [fn = std::move(callback)](const EntryChange&) { fn(); });
        }

        void Dispose() override
        {
            Base::Dispose();
            m_Entries.Dispose();
        }

        void BindContext(const CellContext& context) override
        {
            Base::BindContext(context);
            m_Entries.BindContext(CellContext{context.Marshaller, nullptr, nullptr});
        }

    private:
        struct EntryChange
        {
            CollectionAction Action;
            std::optional<K> Key;
            std::optional<V> Value;
        };

        void Raise(CollectionAction action, std::optional<K> key, std::optional<V> value)
        {
            m_Entries.Notify(*this, entt::any{}, entt::any{EntryChange{action, std::move(key), std::move(value)}});
        }

        Subscription Listen(CollectionAction action, std::function<void(const EntryChange&)> callback)
        {
            return m_Entries.Add([action, fn = std::move(callback)](const entt::any&, const entt::any& payload)
            {
                const EntryChange* change = entt::any_cast<EntryChange>(&payload);
                if (change && change->Action == action) fn(*change);
            });
        }

        Subscription ListenEntry(CollectionAction action, EntryCallback callback)
        {
            if (!callback) return {};
            return Listen(action, [fn = std::move(callback)](const EntryChange& change)
            {
                fn(*change.Key, *change.Value);
            });
        }

        ChangeChannel m_Entries;
    };
}
