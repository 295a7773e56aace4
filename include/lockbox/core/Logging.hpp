#ifndef INCLUDE_LOCKBOX_CORE_LOGGING_HPP
#define INCLUDE_LOCKBOX_CORE_LOGGING_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace lockbox::core
{

enum class LogLevel : std::uint8_t
{
    Debug,
    Info,
    Warning,
    Error,
};

// Receives one complete JSON line (no trailing newline).
using LogSink = std::function<void(LogLevel, std::string_view)>;

// Diagnostic logging, separate from the audit log. Detail must never carry passphrases, secrets or keys.
void log(LogLevel level, std::string_view event, std::string_view detail = {}) noexcept;

// An empty sink restores the default std::clog writer.
void setLogSink(LogSink sink);
void setMinLogLevel(LogLevel level) noexcept;
[[nodiscard]] LogLevel minLogLevel() noexcept;

[[nodiscard]] std::string_view levelName(LogLevel level) noexcept;
[[nodiscard]] std::string escapeJson(std::string_view text);

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_LOGGING_HPP
