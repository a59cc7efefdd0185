#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docket {

/// @brief Log severity levels
enum class LogLevel : uint8_t
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

/// @brief Parse a level name ("trace", "debug", "info", "warn"/"warning", "error", "fatal")
/// @return Level, or empty if the name is not recognized (case-insensitive)
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// @brief Lower-case name of a level
const char* toString(LogLevel level);

/// @brief Log system construction options
struct LogSystemConfig
{
    std::string loggerName{"docket"};
    LogLevel level{LogLevel::Info};
    std::string filePath;           // Empty = console only
    size_t asyncQueueSize{8192};
};

/// @brief Async logging system based on spdlog
/// Console output always, file output when a path is configured; fatal level throws
class LogSystem final
{
public:
    /// @throws std::runtime_error if the log file cannot be opened
    explicit LogSystem(const LogSystemConfig& config = {});
    ~LogSystem();

    LogSystem(const LogSystem&) = delete;
    LogSystem& operator=(const LogSystem&) = delete;

    /// @brief Log a message with the specified level
    /// @tparam ...Args Format argument types
    /// @param level Log severity level
    /// @param fmt Format string (fmt library syntax)
    /// @param ...args Format arguments
    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        switch (level)
        {
            case LogLevel::Trace:
                m_logger->trace(fmt, std::forward<Args>(args)...);
                break;
            case LogLevel::Debug:
                m_logger->debug(fmt, std::forward<Args>(args)...);
                break;
            case LogLevel::Info:
                m_logger->info(fmt, std::forward<Args>(args)...);
                break;
            case LogLevel::Warn:
                m_logger->warn(fmt, std::forward<Args>(args)...);
                break;
            case LogLevel::Error:
                m_logger->error(fmt, std::forward<Args>(args)...);
                break;
            case LogLevel::Fatal:
                m_logger->critical(fmt, std::forward<Args>(args)...);
                fatalCallback(fmt, std::forward<Args>(args)...);
                break;
        }
    }

    /// @brief Set the minimum log level to display
    void setLevel(LogLevel level);

    [[nodiscard]] LogLevel level() const { return m_level; }

    /// @brief Flush all pending log messages
    void flush();

private:
    template<typename... Args>
    void fatalCallback(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        const std::string message = fmt::format(fmt, std::forward<Args>(args)...);
        m_logger->flush();
        throw std::runtime_error(message);
    }

    std::shared_ptr<spdlog::logger> m_logger;
    LogLevel m_level{LogLevel::Info};
};

} // namespace docket

// =============================================================================
// Global logger access - must be defined by application
// =============================================================================
namespace docket {
    LogSystem* getLogSystem();
}

// =============================================================================
// Logging Macros
// =============================================================================

#define LOG_TRACE(...) \
    if (::docket::getLogSystem()) { ::docket::getLogSystem()->log(::docket::LogLevel::Trace, __VA_ARGS__); }

#define LOG_DEBUG(...) \
    if (::docket::getLogSystem()) { ::docket::getLogSystem()->log(::docket::LogLevel::Debug, __VA_ARGS__); }

#define LOG_INFO(...) \
    if (::docket::getLogSystem()) { ::docket::getLogSystem()->log(::docket::LogLevel::Info, __VA_ARGS__); }

#define LOG_WARN(...) \
    if (::docket::getLogSystem()) { ::docket::getLogSystem()->log(::docket::LogLevel::Warn, __VA_ARGS__); }

#define LOG_ERROR(...) \
    if (::docket::getLogSystem()) { ::docket::getLogSystem()->log(::docket::LogLevel::Error, __VA_ARGS__); }

#define LOG_FATAL(...) \
    if (::docket::getLogSystem()) { ::docket::getLogSystem()->log(::docket::LogLevel::Fatal, __VA_ARGS__); }
