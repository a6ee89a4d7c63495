module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Info,
        Warning,
        Error,
        Debug
    };

    // Receives every formatted message instead of stdout while installed.
    using SinkFn = std::function<void(Level, std::string_view)>;

    void SetSink(SinkFn sink);
    void ResetSink();

    // Routes an already formatted message to the sink, or prints it colored.
    void Write(Level level, std::string_view msg);

    [[nodiscard]] constexpr std::string_view LevelToString(Level level)
    {
        switch (level)
        {
            case Level::Info:    return "INFO";
            case Level::Warning: return "WARN";
            case Level::Error:   return "ERR";
            case Level::Debug:   return "DBG";
        }
        return "INFO";
    }

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#else
        (void)fmt;
        ((void)args, ...);
#endif
    }
}
