//
// Created by Malik T on 14/08/2025.
//

#ifndef ROBOTRACE_UTIL_HPP
#define ROBOTRACE_UTIL_HPP

#include <charconv>
#include <optional>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace robotrace::core::util
{
    inline auto IsBlank(char const c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }

    inline auto Trim(std::string_view s) -> std::string
    {
        std::size_t b = 0;
        std::size_t e = s.size();
        while (b < e && IsBlank(s[b])) ++b;
        while (e > b && IsBlank(s[e - 1])) --e;
        return std::string{s.substr(b, e - b)};
    }

    // Accepts "2" and spreadsheet-style "2.0"; anything else is rejected
    inline auto ParseLevel(std::string_view s) -> std::optional<std::uint8_t>
    {
        std::string const t = Trim(s);
        std::string_view v{t};
        if (auto const dot = v.find('.'); dot != std::string_view::npos)
        {
            if (v.substr(dot + 1).find_first_not_of('0') != std::string_view::npos) return std::nullopt;
            v = v.substr(0, dot);
        }
        if (v.empty()) return std::nullopt;

        unsigned value{};
        auto const [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
        if (ec != std::errc{} || ptr != v.data() + v.size()) return std::nullopt;
        if (value < constants::MinLevel || value > constants::MaxLevel) return std::nullopt;
        return static_cast<std::uint8_t>(value);
    }

    inline auto IsValidLevel(int const level) noexcept -> bool
    {
        return level >= constants::MinLevel && level <= constants::MaxLevel;
    }
}

#endif //ROBOTRACE_UTIL_HPP
