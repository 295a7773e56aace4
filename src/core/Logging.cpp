#include "lockbox/core/Logging.hpp"
#include "lockbox/core/Clock.hpp"
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <utility>
#include <string>

namespace lockbox::core
{
namespace
{

std::mutex g_sinkMutex;
LogSink g_sink;
std::atomic<LogLevel> g_minLevel{ LogLevel::Info };

constexpr std::string_view g_hexDigits{ "0123456789abcdef" };

void writeToClog([[maybe_unused]] LogLevel level, std::string_view line)
{
    std::clog << line << '\n';
}

std::string formatLine(LogLevel level, std::string_view event, std::string_view detail)
{
    std::string line{ "{\"ts\":" };
    line.append(std::to_string(toUnixSeconds(Clock::now())));
    line.append(",\"level\":\"");
    line.append(levelName(level));
    line.append("\",\"event\":\"");
    line.append(escapeJson(event));
    line.push_back('"');
    if (!detail.empty())
    {
        line.append(",\"detail\":\"");
        line.append(escapeJson(detail));
        line.push_back('"');
    }
    line.push_back('}');
    return line;
}

} // namespace

std::string_view levelName(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

std::string escapeJson(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 8U);
    for (const unsigned char c : text)
    {
        switch (c)
        {
        case '\\':
            out += "\\\\";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (c < 0x20U)
            {
                out += "\\u00";
                out.push_back(g_hexDigits[c >> 4U]);
                out.push_back(g_hexDigits[c & 0x0FU]);
            }
            else
            {
                out.push_back(static_cast<char>(c));
            }
            break;
        }
    }
    return out;
}

void setLogSink(LogSink sink)
{
    const std::scoped_lock lock{ g_sinkMutex };
    g_sink = std::move(sink);
}

void setMinLogLevel(LogLevel level) noexcept
{
    g_minLevel.store(level);
}

LogLevel minLogLevel() noexcept
{
    return g_minLevel.load();
}

void log(LogLevel level, std::string_view event, std::string_view detail) noexcept
{
    if (level < g_minLevel.load())
    {
        return;
    }
    try
    {
        const std::string line{ formatLine(level, event, detail) };
        const std::scoped_lock lock{ g_sinkMutex };
        if (g_sink)
        {
            g_sink(level, line);
        }
        else
        {
            writeToClog(level, line);
        }
    }
    catch (const std::exception& e)
    {
        std::clog << "{\"event\":\"log_sink_error\",\"detail\":\"" << e.what() << "\"}\n";
    }
}

} // namespace lockbox::core
