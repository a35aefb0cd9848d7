module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core.Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Receives every message that passes the level threshold.
    using Sink = std::function<void(Level, std::string_view)>;

    // Messages below this level are discarded. Default: Debug.
    void SetLevel(Level level);
    [[nodiscard]] Level GetLevel();

    // Replace the console sink (e.g. to capture reports in tests).
    void SetSink(Sink sink);
    void ResetSink();

    void Write(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template <typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template <typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
