module;
#include <cstddef>
#include <memory>

module Pulse.Runtime;

import Core.Logging;
import Pulse.Threading;
import Pulse.Events;
import Pulse.PropertyStore;
import Pulse.Converters;

namespace Pulse
{
    ReactiveRuntime::ReactiveRuntime(const RuntimeConfig& config)
        : m_Config(config)
    {
        Core::Log::SetLevel(config.LogLevel);

        if (config.Mode == MarshalMode::Queued)
        {
            DispatcherConfig dispatcherConfig{};
            dispatcherConfig.MaxActionsPerTick = config.MaxActionsPerTick;
            dispatcherConfig.InlineOnMainThread = config.InlineOnMainThread;

            auto dispatcher = std::make_unique<MainThreadDispatcher>(dispatcherConfig);
            m_Dispatcher = dispatcher.get();
            m_Marshaller = std::move(dispatcher);
        }
        else
        {
            m_Marshaller = std::make_unique<ImmediateMarshaller>();
        }

        m_Events = std::make_unique<EventBus>(m_Marshaller.get());
        m_Events->Initialize();

        m_Converters = std::make_unique<ConverterRegistry>();
        if (config.RegisterBuiltins)
            m_Converters->AddRegistrar(&Pulse::RegisterBuiltinConverters);

        m_Properties = std::make_unique<PropertyStore>(m_Marshaller.get(), m_Events.get());

        Core::Log::Info("ReactiveRuntime: started ({} marshalling).",
                        config.Mode == MarshalMode::Queued ? "queued" : "immediate");
    }

    ReactiveRuntime::~ReactiveRuntime()
    {
        // Store first: it unbinds its cells from the bus and marshaller.
        m_Properties.reset();
        m_Converters.reset();
        m_Events.reset();
        m_Dispatcher = nullptr;
        m_Marshaller.reset();
        Core::Log::Info("ReactiveRuntime: shut down.");
    }

    size_t ReactiveRuntime::Tick()
    {
        return m_Dispatcher ? m_Dispatcher->ProcessQueue() : 0;
    }
}
