//
// Created by Malik T on 14/08/2025.
//

#ifndef ROBOTRACE_STATE_HPP
#define ROBOTRACE_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"
#include "ScoreBoard.hpp"

namespace robotrace::core
{
    struct PlayerRoundState
    {
        Attempt attempt{Attempt::Unattempted};

        auto IsLocked() const noexcept -> bool { return attempt == Attempt::Locked; }

        auto Outcome() const noexcept -> LastOutcome
        {
            switch (attempt)
            {
            case Attempt::Unattempted: return LastOutcome::None;
            case Attempt::Locked:
            case Attempt::Incorrect:   return LastOutcome::Incorrect;
            case Attempt::Correct:     return LastOutcome::Correct;
            case Attempt::Skipped:     return LastOutcome::Skipped;
            case Attempt::TimedOut:    return LastOutcome::Timeout;
            }
            return LastOutcome::None;
        }
    };

    // Everything that lives for exactly one question
    struct RoundContext
    {
        Question question;
        OptionSet options;
        std::size_t number{}; // 1-based within the match

        std::array<PlayerRoundState, constants::PlayerCount> players{};
        std::optional<PlayerId> buzzer_winner{};
        std::optional<PlayerId> round_winner{};
        std::optional<RoundResolution> resolution{};

        TimePoint phase_started{};
    };

    struct PlayerView
    {
        Attempt attempt{Attempt::Unattempted};
        int score{};
        double track_position{};
    };

    // Immutable snapshot handed to presentation/wire (owning copies, no engine refs)
    struct SessionSnapshot
    {
        Phase phase{Phase::Menu};
        RuleVariant variant{RuleVariant::BuzzerRace};
        std::uint8_t level{};

        bool has_question{false};
        std::size_t question_number{};
        std::size_t questions_remaining{};
        std::string prompt;
        std::array<std::string, constants::OptionCount> options{};

        // only filled once the round is resolved
        std::optional<std::size_t> revealed_index{};
        std::optional<std::string> revealed_answer{};

        std::optional<Millis> time_remaining{};
        int countdown{}; // 3-2-1 during Countdown, 0 otherwise

        std::optional<PlayerId> buzzer_winner{};
        std::optional<PlayerId> round_winner{};
        std::optional<ResolutionKind> resolution{};

        std::array<PlayerView, constants::PlayerCount> players{};
        std::optional<MatchResult> match{};
    };

} // namespace robotrace::core

#endif //ROBOTRACE_STATE_HPP
