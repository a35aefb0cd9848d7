module;
#include <cstddef>
#include <cstdint>
#include <memory>

export module Pulse.Runtime;

import Core.Logging;
import Pulse.Threading;
import Pulse.Events;
import Pulse.PropertyStore;
import Pulse.Converters;

export namespace Pulse
{
    enum class MarshalMode : uint8_t
    {
        Immediate, // Every caller counts as the main context; work runs inline.
        Queued     // Off-thread work is queued and drained by Tick().
    };

    struct RuntimeConfig
    {
        MarshalMode Mode = MarshalMode::Queued;
        uint32_t MaxActionsPerTick = 256; // 0 = unbounded
        bool InlineOnMainThread = true;
        Core::Log::Level LogLevel = Core::Log::Level::Info;
        bool RegisterBuiltins = true;
    };

    // Owns and wires the reactive services. Construct one per application
    // (or per test); nothing here is process-global.
    class ReactiveRuntime
    {
    public:
        explicit ReactiveRuntime(const RuntimeConfig& config = {});
        ~ReactiveRuntime();

        ReactiveRuntime(const ReactiveRuntime&) = delete;
        ReactiveRuntime& operator=(const ReactiveRuntime&) = delete;
        ReactiveRuntime(ReactiveRuntime&&) = delete;
        ReactiveRuntime& operator=(ReactiveRuntime&&) = delete;

        // Call once per frame on the main thread. Returns the number of
        // queued actions executed (always 0 in Immediate mode).
        size_t Tick();

        [[nodiscard]] IThreadMarshaller& Threading() { return *m_Marshaller; }
        // nullptr in Immediate mode.
        [[nodiscard]] MainThreadDispatcher* Dispatcher() { return m_Dispatcher; }
        [[nodiscard]] EventBus& Events() { return *m_Events; }
        [[nodiscard]] PropertyStore& Properties() { return *m_Properties; }
        [[nodiscard]] ConverterRegistry& Converters() { return *m_Converters; }

        [[nodiscard]] const RuntimeConfig& Config() const { return m_Config; }

    private:
        RuntimeConfig m_Config;

        std::unique_ptr<IThreadMarshaller> m_Marshaller;
        MainThreadDispatcher* m_Dispatcher = nullptr;
        std::unique_ptr<EventBus> m_Events;
        std::unique_ptr<ConverterRegistry> m_Converters;
        std::unique_ptr<PropertyStore> m_Properties;
    };
}
