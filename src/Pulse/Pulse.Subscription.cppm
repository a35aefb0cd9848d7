module;
#include <cstdint>
#include <functional>
#include <utility>

export module Pulse.Subscription;

export namespace Pulse
{
    // Monotonic id of one registration inside a cell, bus or store table.
    using SubscriptionId = uint64_t;
    inline constexpr SubscriptionId kInvalidSubscriptionId = 0;

    // -------------------------------------------------------------------------
    // Subscription: disposal token returned by every Subscribe call.
    // -------------------------------------------------------------------------
    // Dispose() removes exactly the registration that produced the token.
    // Disposing twice, or disposing after the source is gone, is a no-op.
    // The token does NOT dispose on destruction: dropping it keeps the
    // registration alive (hand it to AddDependentSubscription or keep it
    // around to cancel later).
    class Subscription
    {
    public:
        using Disposer = std::function<void()>;

        Subscription() = default;
        Subscription(SubscriptionId id, Disposer disposer)
            : m_Id(id), m_Disposer(std::move(disposer))
        {
        }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : m_Id(std::exchange(other.m_Id, kInvalidSubscriptionId)),
              m_Disposer(std::exchange(other.m_Disposer, nullptr))
        {
        }

        Subscription& operator=(Subscription&& other) noexcept
        {
            if (this != &other)
            {
                m_Id = std::exchange(other.m_Id, kInvalidSubscriptionId);
                m_Disposer = std::exchange(other.m_Disposer, nullptr);
            }
            return *this;
        }

        ~Subscription() = default;

        void Dispose();

        [[nodiscard]] bool IsActive() const noexcept { return static_cast<bool>(m_Disposer); }
        [[nodiscard]] SubscriptionId Id() const noexcept { return m_Id; }

    private:
        SubscriptionId m_Id = kInvalidSubscriptionId;
        Disposer m_Disposer;
    };
}
