module;
#include <functional>
#include <utility>

module Pulse.Subscription;

namespace Pulse
{
    void Subscription::Dispose()
    {
        // Move out first so a disposer that re-enters (or throws) cannot run twice.
        Disposer disposer = std::exchange(m_Disposer, nullptr);
        if (disposer) disposer();
    }
}
