#include "core/Log.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace outpost::core {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

[[nodiscard]] spdlog::level::level_enum ToSpd(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:    return spdlog::level::trace;
    case LogLevel::Debug:    return spdlog::level::debug;
    case LogLevel::Info:     return spdlog::level::info;
    case LogLevel::Warn:     return spdlog::level::warn;
    case LogLevel::Error:    return spdlog::level::err;
    case LogLevel::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

[[nodiscard]] std::shared_ptr<spdlog::logger> CurrentLogger()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger)
        return g_logger;
    return spdlog::default_logger();
}

} // namespace

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
    }
    return "info";
}

bool LogLevelFromName(std::string_view name, LogLevel& out) noexcept
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "trace")    { out = LogLevel::Trace;    return true; }
    if (lower == "debug")    { out = LogLevel::Debug;    return true; }
    if (lower == "info")     { out = LogLevel::Info;     return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error")    { out = LogLevel::Error;    return true; }
    if (lower == "critical") { out = LogLevel::Critical; return true; }
    return false;
}

void LogInit(const std::filesystem::path& logDir)
{
    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    const auto file = (logDir / "outpost.log").string();
    if (!ec)
    {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1u << 20, 4)); // 1MB * 4
        }
        catch (const spdlog::spdlog_ex& e)
        {
            std::fprintf(stderr, "outpost: file logging disabled (%s)\n", e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("outpost", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_logger = logger;
    }
    spdlog::set_default_logger(logger);

    LogMessage(LogLevel::Info, "Logger initialized at %s", sinks.size() > 1 ? file.c_str() : "<stderr only>");
}

void LogShutdown()
{
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        logger = std::move(g_logger);
    }
    if (logger)
        logger->flush();
}

void SetLogLevel(LogLevel level)
{
    CurrentLogger()->set_level(ToSpd(level));
}

void LogMessageV(LogLevel level, const char* fmt, va_list ap)
{
    if (!fmt)
        return;

    auto logger = CurrentLogger();
    const auto lvl = ToSpd(level);
    if (!logger->should_log(lvl))
        return;

    char msg[2048]{};
    (void)std::vsnprintf(msg, sizeof(msg), fmt, ap);
    msg[sizeof(msg) - 1] = '\0';

    logger->log(lvl, "{}", msg);
}

void LogMessage(LogLevel level, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    LogMessageV(level, fmt, ap);
    va_end(ap);
}

} // namespace outpost::core
