//
// Log.hpp
//

#ifndef CARDARENA_LOG_HPP
#define CARDARENA_LOG_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

namespace arena::core::log
{
    enum class Level : std::uint8_t
    {
        Trace = 0,
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    inline auto Threshold() -> std::atomic<Level>&
    {
        static std::atomic<Level> level{Level::Info};
        return level;
    }

    inline auto SetLevel(Level l) -> void { Threshold().store(l); }

    inline auto Enabled(Level l) -> bool
    {
        return l != Level::Off && l >= Threshold().load();
    }

    inline auto ToString(Level l) -> std::string_view
    {
        switch (l)
        {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
        }
        return "?";
    }

    template <typename... Args>
    auto Write(Level l, std::string_view tag, std::format_string<Args...> fmt, Args&&... args) -> void
    {
        if (!Enabled(l))
        {
            return;
        }
        std::print(stderr, "[{}] {}\n", tag, std::format(fmt, std::forward<Args>(args)...));
    }
}

#define ARN_LOG_TRACE(tag, ...) ::arena::core::log::Write(::arena::core::log::Level::Trace, (tag), __VA_ARGS__)
#define ARN_LOG_DEBUG(tag, ...) ::arena::core::log::Write(::arena::core::log::Level::Debug, (tag), __VA_ARGS__)
#define ARN_LOG_INFO(tag, ...)  ::arena::core::log::Write(::arena::core::log::Level::Info, (tag), __VA_ARGS__)
#define ARN_LOG_WARN(tag, ...)  ::arena::core::log::Write(::arena::core::log::Level::Warn, (tag), __VA_ARGS__)
#define ARN_LOG_ERROR(tag, ...) ::arena::core::log::Write(::arena::core::log::Level::Error, (tag), __VA_ARGS__)

#endif //CARDARENA_LOG_HPP
