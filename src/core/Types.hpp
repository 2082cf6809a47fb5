//
// Created by Malik T on 14/08/2025.
//

#ifndef ROBOTRACE_TYPES_HPP
#define ROBOTRACE_TYPES_HPP

#define RR_ENABLE_TEST_HOOKS true

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace robotrace::core::constants
{
    inline constexpr std::size_t OptionCount = 3;
    inline constexpr std::size_t PlayerCount = 2;
    inline constexpr std::uint8_t MinLevel = 1;
    inline constexpr std::uint8_t MaxLevel = 3;
    inline constexpr double FinishLine = 100.0;
    inline constexpr int CountdownSteps = 3;
}

namespace robotrace::core
{
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Millis = std::chrono::milliseconds;

    enum class PlayerId : std::uint8_t
    {
        P1 = 0,
        P2
    };

    inline constexpr std::array<PlayerId, constants::PlayerCount> AllPlayers{PlayerId::P1, PlayerId::P2};

    inline constexpr auto IndexOf(PlayerId const p) noexcept -> std::size_t
    {
        return static_cast<std::size_t>(p);
    }

    inline constexpr auto Other(PlayerId const p) noexcept -> PlayerId
    {
        return p == PlayerId::P1 ? PlayerId::P2 : PlayerId::P1;
    }

    // 1-based number used in logs and on screen
    inline constexpr auto NumberOf(PlayerId const p) noexcept -> int
    {
        return static_cast<int>(p) + 1;
    }

    enum class RuleVariant : std::uint8_t
    {
        BuzzerRace = 0,
        OpenAnswer
    };

    struct Question
    {
        std::uint8_t level{};
        std::string prompt;
        std::string correct;
        std::array<std::string, 2> distractors;
    };

    // Unvalidated row as it comes out of a question source
    struct QuestionRecord
    {
        std::string level;
        std::string prompt;
        std::string correct;
        std::string distractor1;
        std::string distractor2;
    };

    struct OptionSet
    {
        std::array<std::string, constants::OptionCount> options;
        std::size_t correct_index{};

        [[nodiscard]]
        auto CorrectText() const -> std::string const& { return options[correct_index]; }
    };

    struct Config
    {
        RuleVariant variant{RuleVariant::BuzzerRace};
        std::uint64_t seed{std::random_device{}()};

        // Buzzer-Race timings
        Millis reading_time{std::chrono::seconds(10)};
        // zero keeps the buzzer open until somebody presses
        Millis buzzer_window{Millis::zero()};
        Millis buzzer_pause{1500};
        Millis answer_time{std::chrono::seconds(15)};

        // Open-Answer timings
        Millis countdown_step{std::chrono::seconds(1)};
        Millis question_time{std::chrono::seconds(30)};

        Millis result_pause{2000};

        int position_increment{20};
    };
}

#endif //ROBOTRACE_TYPES_HPP
