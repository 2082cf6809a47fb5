//
// Created by Malik T on 13/08/2025.
//

#ifndef ROBOTRACE_OMEGAEXCEPTION_HPP
#define ROBOTRACE_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace robotrace::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    // One exception type per code enum; the code says which layer gave up.
    template <typename Code>
    class OmegaException
    {
    public:
        OmegaException(std::string message,
                       Code code,
                       std::source_location const& origin = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            message_{std::move(message)},
            code_{code},
            origin_{origin},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto code() const noexcept -> Code { return code_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return origin_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        // "file:line in function"
        [[nodiscard]]
        auto origin() const -> std::string
        {
            return std::format("{}:{} in `{}`", origin_.file_name(), origin_.line(), origin_.function_name());
        }

        // One line per frame, without the C runtime frames below main
        [[nodiscard]]
        auto trace() const -> std::string
        {
            std::size_t const shown = backtrace_.size() > 3 ? backtrace_.size() - 3 : backtrace_.size();
            std::string s;
            for (std::size_t i = 0; i < shown; ++i)
            {
                std::stacktrace_entry const& f = backtrace_[i];
                s += std::format("    {}({}): {}\n", f.source_file(), f.source_line(), f.description());
            }
            return s;
        }

    private:
        std::string message_;
        Code code_;
        std::source_location origin_;
        std::stacktrace backtrace_;
    };
}

// std::print support; the code's name comes from an ADL to_string(Code)
template <class Code>
struct std::formatter<robotrace::core::OmegaException<Code>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(robotrace::core::OmegaException<Code> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("[{}] {}\n  at {}\n{}", to_string(e.code()), e.what(), e.origin(),
                                          e.trace());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //ROBOTRACE_OMEGAEXCEPTION_HPP
