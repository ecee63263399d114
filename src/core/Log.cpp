#include "Log.h"
#include "Text.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <cstdio>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>

namespace hillclimb::core {

static std::mutex g_mutex;
static std::shared_ptr<spdlog::logger> g_logger;

static spdlog::level::level_enum ToSpd(LogLevel lvl) noexcept
{
    switch (lvl)
    {
    case LogLevel::Trace:    return spdlog::level::trace;
    case LogLevel::Debug:    return spdlog::level::debug;
    case LogLevel::Info:     return spdlog::level::info;
    case LogLevel::Warn:     return spdlog::level::warn;
    case LogLevel::Error:    return spdlog::level::err;
    case LogLevel::Critical: return spdlog::level::critical;
    case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

const char* LogLevelName(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:    return "trace";
    case LogLevel::Debug:    return "debug";
    case LogLevel::Info:     return "info";
    case LogLevel::Warn:     return "warn";
    case LogLevel::Error:    return "error";
    case LogLevel::Critical: return "critical";
    case LogLevel::Off:      return "off";
    }
    return "info";
}

bool ParseLogLevel(std::string_view text, LogLevel& out) noexcept
{
    text = TrimView(text);

    static constexpr LogLevel kAll[] = {
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
        LogLevel::Error, LogLevel::Critical, LogLevel::Off,
    };
    for (LogLevel lvl : kAll)
    {
        if (EqualsI(text, LogLevelName(lvl)))
        {
            out = lvl;
            return true;
        }
    }
    if (EqualsI(text, "warning"))
    {
        out = LogLevel::Warn;
        return true;
    }
    return false;
}

void LogInit(const LogOptions& opt)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (opt.color)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    else
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

    bool fileFailed = false;
    if (!opt.file.empty())
    {
        std::error_code ec;
        if (opt.file.has_parent_path())
            std::filesystem::create_directories(opt.file.parent_path(), ec);

        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opt.file.string(), /*truncate=*/true));
        }
        catch (const spdlog::spdlog_ex&)
        {
            fileFailed = true;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("hillclimb", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    logger->set_level(ToSpd(opt.level));
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_logger = logger;
        spdlog::set_default_logger(logger);
    }

    if (fileFailed)
        LogMessage(LogLevel::Warn, "Log file %s could not be opened; logging to console only", opt.file.string().c_str());
    else if (!opt.file.empty())
        LogMessage(LogLevel::Debug, "Logger initialized at %s", opt.file.string().c_str());
}

void LogShutdown()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger)
    {
        g_logger->flush();
        g_logger.reset();
    }
}

void SetLogLevel(LogLevel level)
{
    spdlog::default_logger_raw()->set_level(ToSpd(level));
}

bool ShouldLog(LogLevel level) noexcept
{
    return spdlog::default_logger_raw()->should_log(ToSpd(level));
}

void LogMessageV(LogLevel level, const char* fmt, va_list args)
{
    if (!fmt || !ShouldLog(level))
        return;

    char msg[2048]{};
    (void)vsnprintf(msg, sizeof(msg), fmt, args);

    spdlog::default_logger_raw()->log(ToSpd(level), "{}", static_cast<const char*>(msg));
}

void LogMessage(LogLevel level, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    LogMessageV(level, fmt, args);
    va_end(args);
}

} // namespace hillclimb::core
