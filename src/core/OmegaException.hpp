//
// OmegaException.hpp
//

#ifndef CARDARENA_OMEGAEXCEPTION_HPP
#define CARDARENA_OMEGAEXCEPTION_HPP

#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>

namespace arena::core
{
    // Thrown for programming and serialization faults only; protocol and transport
    // problems travel as value errors instead. `Code` names the failing subsystem and
    // must have a `to_string(Code)` reachable by ADL.
    template <typename Code>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       Code code,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            code_{code},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto code() const noexcept -> Code { return code_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        // Throw site followed by the frames above it, runtime start-up frames cut off.
        [[nodiscard]]
        auto trace(std::size_t max_frames = 16) const -> std::string
        {
            std::string s = std::format("  at {}:{} in `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.function_name());
            std::size_t const usable = backtrace_.size() > StartupFrames ? backtrace_.size() - StartupFrames : 0;
            std::size_t const shown = usable < max_frames ? usable : max_frames;
            for (std::size_t i{}; i < shown; ++i)
            {
                auto const& entry = backtrace_[i];
                s += std::format("  #{} {}({}) {}\n", i, entry.source_file(), entry.source_line(), entry.description());
            }
            return s;
        }

    private:
        static constexpr std::size_t StartupFrames = 3;

        std::string err_str_;
        Code code_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

// std::print("{}", e) shows the subsystem, the message and the trace.
template <class Code>
struct std::formatter<arena::core::OmegaException<Code>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(arena::core::OmegaException<Code> const& p, FormatContext& ctx) const
    {
        std::string const s = std::format("[{}] {}\n{}", to_string(p.code()), p.what(), p.trace());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //CARDARENA_OMEGAEXCEPTION_HPP
