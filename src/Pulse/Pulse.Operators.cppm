module;
#include <concepts>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

export module Pulse.Operators;

import Core.Error;
import Core.Logging;
import Pulse.Subscription;
import Pulse.Reactive;

export namespace Pulse
{
    // -------------------------------------------------------------------------
    // Cell operators
    // -------------------------------------------------------------------------
    // Each operator returns a new cell that follows its source(s). The
    // subscriptions on the sources are owned by the returned cell: disposing
    // (or destroying) it detaches from the sources.

    // Maps every source value through `fn`.
    template <typename S, typename F>
        requires std::invocable<F&, const S&>
    auto Transform(ReactiveCell<S>& source, F fn)
        -> std::shared_ptr<ReactiveCell<std::decay_t<std::invoke_result_t<F&, const S&>>>>
    {
        using D = std::decay_t<std::invoke_result_t<F&, const S&>>;

        auto target = std::make_shared<ReactiveCell<D>>(fn(source.Get()));
        std::weak_ptr<ReactiveCell<D>> weak = target;
        target->AddDependentSubscription(source.Subscribe([weak, fn](const S& value) mutable
        {
            if (auto cell = weak.lock()) cell->Set(fn(value));
        }));
        return target;
    }

    // Recombines the latest values of both sources whenever either changes.
    // Both sources must outlive the returned cell (or it must be disposed first).
    template <typename A, typename B, typename F>
        requires std::invocable<F&, const A&, const B&>
    auto CombineWith(ReactiveCell<A>& first, ReactiveCell<B>& second, F combiner)
        -> std::shared_ptr<ReactiveCell<std::decay_t<std::invoke_result_t<F&, const A&, const B&>>>>
    {
        using R = std::decay_t<std::invoke_result_t<F&, const A&, const B&>>;

        auto result = std::make_shared<ReactiveCell<R>>(combiner(first.Get(), second.Get()));
        std::weak_ptr<ReactiveCell<R>> weak = result;

        ReactiveCell<B>* other = &second;
        result->AddDependentSubscription(first.Subscribe([weak, combiner, other](const A& value) mutable
        {
            if (auto cell = weak.lock()) cell->Set(combiner(value, other->Get()));
        }));

        ReactiveCell<A>* self = &first;
        result->AddDependentSubscription(second.Subscribe([weak, combiner, self](const B& value) mutable
        {
            if (auto cell = weak.lock()) cell->Set(combiner(self->Get(), value));
        }));
        return result;
    }

    // Starts at the source's current value; afterwards only accepts source
    // values that satisfy `predicate`.
    template <typename T, typename P>
        requires std::predicate<P&, const T&>
    std::shared_ptr<ReactiveCell<T>> Where(ReactiveCell<T>& source, P predicate)
    {
        auto filtered = std::make_shared<ReactiveCell<T>>(source.Get());
        std::weak_ptr<ReactiveCell<T>> weak = filtered;
        filtered->AddDependentSubscription(source.Subscribe([weak, predicate](const T& value) mutable
        {
            if (!predicate(value)) return;
            if (auto cell = weak.lock()) cell->Set(value);
        }));
        return filtered;
    }

    // Forwards source values, suppressing repeats. Useful after a source that
    // is written with forceNotify.
    template <typename T>
    std::shared_ptr<ReactiveCell<T>> DistinctUntilChanged(ReactiveCell<T>& source)
    {
        auto distinct = std::make_shared<ReactiveCell<T>>(source.Get());
        std::weak_ptr<ReactiveCell<T>> weak = distinct;
        distinct->AddDependentSubscription(source.Subscribe([weak](const T& value)
        {
            if (auto cell = weak.lock()) cell->Set(value);
        }));
        return distinct;
    }

    // -------------------------------------------------------------------------
    // ValidatedCell<T>: rejects writes that fail any validator.
    // -------------------------------------------------------------------------
    template <typename T>
    class ValidatedCell final : public ReactiveCell<T>
    {
        struct CreateTag
        {
            explicit CreateTag() = default;
        };

    public:
        // Returns an error message when `value` is invalid.
        using Validator = std::function<std::optional<std::string>(const T&)>;
        using FailureCallback = std::function<void(const T& rejected, const std::vector<std::string>& errors)>;

        // Fails with ValidationFailed when `initial` does not pass.
        static Core::Expected<std::shared_ptr<ValidatedCell>> Create(T initial, std::vector<Validator> validators)
        {
            auto cell = std::make_shared<ValidatedCell>(CreateTag{}, std::move(initial), std::move(validators));

            std::vector<std::string> errors;
            if (!cell->Validate(cell->Get(), errors))
            {
                Core::Log::Error("ValidatedCell: initial value does not pass validation ({} error(s)): {}",
                                 errors.size(), Join(errors));
                return Core::Err<std::shared_ptr<ValidatedCell>>(Core::ErrorCode::ValidationFailed);
            }
            return cell;
        }

        // Only reachable through Create.
        ValidatedCell(CreateTag, T initial, std::vector<Validator> validators)
            : ReactiveCell<T>(std::move(initial)), m_Validators(std::move(validators))
        {
        }

        // Runs every validator; `errors` receives all messages.
        [[nodiscard]] bool Validate(const T& value, std::vector<std::string>& errors) const
        {
            errors.clear();
            for (const Validator& validator : m_Validators)
            {
                if (auto message = validator(value))
                    errors.push_back(std::move(*message));
            }
            return errors.empty();
        }

        Subscription OnValidationFailed(FailureCallback callback)
        {
            if (!callback) return {};

            std::lock_guard lock(m_Listeners->Mutex);
            const SubscriptionId id = m_Listeners->NextId++;
            m_Listeners->Entries.emplace_back(id, std::move(callback));

            std::weak_ptr<Listeners> weak = m_Listeners;
            return Subscription(id, [weak, id]()
            {
                auto listeners = weak.lock();
                if (!listeners) return;

                std::lock_guard inner(listeners->Mutex);
                std::erase_if(listeners->Entries, [id](const auto& e) { return e.first == id; });
            });
        }

    protected:
        bool Admit(const T& value) override
        {
            std::vector<std::string> errors;
            if (Validate(value, errors)) return true;

            std::vector<FailureCallback> callbacks;
            {
                std::lock_guard lock(m_Listeners->Mutex);
                for (const auto& [id, fn] : m_Listeners->Entries)
                    callbacks.push_back(fn);
            }
            for (const FailureCallback& fn : callbacks)
                fn(value, errors);

            Core::Log::Warn("ValidatedCell: write rejected: {}", Join(errors));
            return false;
        }

    private:
        struct Listeners
        {
            std::mutex Mutex;
            std::vector<std::pair<SubscriptionId, FailureCallback>> Entries;
            SubscriptionId NextId = 1;
        };

        static std::string Join(const std::vector<std::string>& errors)
        {
            std::string joined;
            for (const std::string& e : errors)
            {
                if (!joined.empty()) joined += ", ";
                joined += e;
            }
            return joined;
        }

        const std::vector<Validator> m_Validators;
        std::shared_ptr<Listeners> m_Listeners = std::make_shared<Listeners>();
    };

    // Single-predicate shorthand for ValidatedCell<T>::Create.
    template <typename T, typename P>
        requires std::predicate<P&, const T&>
    Core::Expected<std::shared_ptr<ValidatedCell<T>>> WithValidation(T initial, P predicate,
                                                                     std::string message = "value rejected")
    {
        typename ValidatedCell<T>::Validator validator =
            [predicate, message](const T& value) mutable -> std::optional<std::string>
        {
            if (predicate(value)) return std::nullopt;
            return message;
        };
        return ValidatedCell<T>::Create(std::move(initial), {std::move(validator)});
    }
}
