#include "log_system.h"

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace docket {

namespace {

spdlog::level::level_enum toSpdlogLevel(LogLevel level)
{
    static constexpr spdlog::level::level_enum levelMap[] = {
        spdlog::level::trace,
        spdlog::level::debug,
        spdlog::level::info,
        spdlog::level::warn,
        spdlog::level::err,
        spdlog::level::critical
    };

    return levelMap[static_cast<uint8_t>(level)];
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::Fatal;
    return std::nullopt;
}

const char* toString(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

LogSystem::LogSystem(const LogSystemConfig& config)
    : m_level(config.level)
{
    // Console sink with colored output; worker threads are named, so show the thread id
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::trace);
    consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (!config.filePath.empty())
    {
        // Opened before any spdlog global state changes, so a bad path leaves nothing behind
        std::shared_ptr<spdlog::sinks::basic_file_sink_mt> fileSink;
        try
        {
            fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.filePath, false);
        }
        catch (const spdlog::spdlog_ex& e)
        {
            throw std::runtime_error("cannot open log file '" + config.filePath + "': " + e.what());
        }
        fileSink->set_level(spdlog::level::trace);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }

    // Async thread pool: 1 background thread
    spdlog::init_thread_pool(config.asyncQueueSize, 1);

    m_logger = std::make_shared<spdlog::async_logger>(
        config.loggerName,
        sinks.begin(),
        sinks.end(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block
    );

    m_logger->set_level(toSpdlogLevel(m_level));
    m_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(m_logger);
    spdlog::set_default_logger(m_logger);

    m_logger->debug("Docket LogSystem initialized (level: {})", toString(m_level));
}

LogSystem::~LogSystem()
{
    m_logger->debug("Docket LogSystem shutting down");
    flush();
    spdlog::drop_all();
    spdlog::shutdown();
}

void LogSystem::setLevel(LogLevel level)
{
    m_level = level;
    m_logger->set_level(toSpdlogLevel(level));
}

void LogSystem::flush()
{
    m_logger->flush();
}

} // namespace docket
