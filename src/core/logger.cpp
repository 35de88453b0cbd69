#include <lectern/logger.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace lectern
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_ && !sinks_.empty();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level     = level;
    entry.category  = std::string(category);
    entry.message   = std::string(message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_)
        return;
    for (const auto& sink : sinks_)
        sink(entry);
}

// ─── Names and formatting ───────────────────────────────────────────────────

std::string Logger::level_to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    static const struct
    {
        const char* name;
        LogLevel    level;
    } table[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warning},
        {"warning", LogLevel::Warning},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
    };
    for (const auto& row : table)
    {
        if (lower == row.name)
            return row.level;
    }
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    const auto        ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(ms));
    return out;
}

std::string Logger::format_line(const LogEntry& entry)
{
    std::string line = timestamp_to_string(entry.timestamp);
    line += ' ';
    line += level_to_string(entry.level);
    line += " [";
    line += entry.category;
    line += "] ";
    line += entry.message;
    return line;
}

// ─── Sinks ──────────────────────────────────────────────────────────────────

namespace sinks
{

static const char* level_color(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[37m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[35m";
    }
    return "";
}

Logger::LogSink console_sink()
{
    const bool color = ::isatty(STDERR_FILENO) != 0;
    return [color](const Logger::LogEntry& entry)
    {
        std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        if (color)
            out << level_color(entry.level) << Logger::format_line(entry) << "\033[0m\n";
        else
            out << Logger::format_line(entry) << '\n';
        out.flush();
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    if (!file->is_open())
        std::cerr << "lectern: cannot open log file " << filename << '\n';
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        *file << Logger::format_line(entry) << '\n';
        file->flush();
    };
}

Logger::LogSink capture_sink(std::shared_ptr<std::vector<Logger::LogEntry>> into)
{
    return [into = std::move(into)](const Logger::LogEntry& entry) { into->push_back(entry); };
}

}   // namespace sinks

}   // namespace lectern
