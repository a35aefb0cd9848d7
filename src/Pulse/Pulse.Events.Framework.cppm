module;
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <entt/entt.hpp>

export module Pulse.Events.Framework;

import Core.Error;
import Pulse.Events;

export namespace Pulse
{
    // Emitted by every cell after its direct subscribers were notified.
    // Key is empty when the cell is not registered in a PropertyStore.
    class PropertyChangedEvent final : public EventBase
    {
    public:
        PropertyChangedEvent(std::string key, entt::any oldValue, entt::any newValue,
                             const entt::type_info& valueType)
            : EventBase("Pulse.PropertyStore"),
              Key(std::move(key)),
              OldValue(std::move(oldValue)),
              NewValue(std::move(newValue)),
              ValueType(valueType)
        {
        }

        std::string Key;
        entt::any OldValue;
        entt::any NewValue;
        entt::type_info ValueType;
    };

    enum class ErrorSeverity : uint8_t
    {
        Info,
        Warning,
        Error,
        Critical
    };

    constexpr std::string_view ErrorSeverityToString(ErrorSeverity severity)
    {
        switch (severity)
        {
            case ErrorSeverity::Info:     return "Info";
            case ErrorSeverity::Warning:  return "Warning";
            case ErrorSeverity::Error:    return "Error";
            case ErrorSeverity::Critical: return "Critical";
        }
        return "Unknown";
    }

    // Recoverable framework faults (type mismatches, rejected writes) that a
    // host may want to surface in its own diagnostics.
    class FrameworkErrorEvent final : public EventBase
    {
    public:
        FrameworkErrorEvent(std::string message, Core::ErrorCode code,
                            ErrorSeverity severity = ErrorSeverity::Error,
                            std::string context = {})
            : EventBase("Pulse.Framework"),
              Message(std::move(message)),
              Context(std::move(context)),
              Code(code),
              Severity(severity)
        {
        }

        std::string Message;
        std::string Context;
        Core::ErrorCode Code;
        ErrorSeverity Severity;
    };

    // Ad-hoc payload carrier for hosts that do not want a dedicated event type.
    template <typename T>
    class GenericDataEvent final : public EventBase
    {
    public:
        GenericDataEvent(std::string dataKey, T data, std::string source = "Pulse.Generic")
            : EventBase(std::move(source)), DataKey(std::move(dataKey)), Data(std::move(data))
        {
        }

        std::string DataKey;
        T Data;
    };
}
