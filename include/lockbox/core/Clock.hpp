#ifndef INCLUDE_LOCKBOX_CORE_CLOCK_HPP
#define INCLUDE_LOCKBOX_CORE_CLOCK_HPP

#include <chrono>
#include <cstdint>
#include <functional>

namespace lockbox::core
{

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::seconds;
using NowProvider = std::function<TimePoint()>;

[[nodiscard]] inline std::int64_t toUnixSeconds(TimePoint tp) noexcept
{
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint fromUnixSeconds(std::int64_t secs) noexcept
{
    return TimePoint{ std::chrono::duration_cast<Clock::duration>(Seconds{ secs }) };
}

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_CLOCK_HPP
