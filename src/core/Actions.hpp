//
// Created by Malik T on 14/08/2025.
//

#ifndef ROBOTRACE_ACTIONS_HPP
#define ROBOTRACE_ACTIONS_HPP

#include <variant>

#include "Types.hpp"

namespace robotrace::core
{
    // Contest actions, routed to the round engine
    struct ClaimBuzzerAction  { PlayerId player; };
    struct SelectOptionAction { PlayerId player; std::size_t index; };
    struct SkipAction         { PlayerId player; };

    // Session actions, handled by the session controller
    struct SelectLevelAction  { std::uint8_t level; };
    struct CancelAction       {};
    struct RestartAction      {};

    using PlayerAction = std::variant<
      ClaimBuzzerAction, SelectOptionAction, SkipAction,
      SelectLevelAction, CancelAction, RestartAction>;

    inline auto IsContestAction(PlayerAction const& a) noexcept -> bool
    {
        return std::holds_alternative<ClaimBuzzerAction>(a)
            || std::holds_alternative<SelectOptionAction>(a)
            || std::holds_alternative<SkipAction>(a);
    }

    enum class StepOutcome : std::uint8_t
    {
        Ignored,       // action rejected, nothing changed
        Idle,          // tick with no transition
        Applied,       // transition inside the round
        RoundResolved, // outcome decided, result display started
        RoundEnded     // result display over, next question wanted
    };

    enum class Phase : std::uint8_t
    {
        Menu,
        Reading,
        Buzzer,
        BuzzerPause,
        Answering,
        Countdown,
        Question,
        Result,
        Finished
    };

    enum class Epoch : std::uint8_t
    {
        Idle,
        LeadIn,
        Contest,
        Resolution
    };

    inline constexpr auto EpochOf(Phase const p) noexcept -> Epoch
    {
        switch (p)
        {
        case Phase::Reading:
        case Phase::Countdown:   return Epoch::LeadIn;
        case Phase::Buzzer:
        case Phase::BuzzerPause:
        case Phase::Answering:
        case Phase::Question:    return Epoch::Contest;
        case Phase::Result:      return Epoch::Resolution;
        case Phase::Menu:
        case Phase::Finished:    return Epoch::Idle;
        }
        return Epoch::Idle;
    }

    // Single tag per player per round
    enum class Attempt : std::uint8_t
    {
        Unattempted,
        Locked,     // answered wrong in Open-Answer, may not try again
        Correct,
        Incorrect,
        Skipped,
        TimedOut
    };

    enum class LastOutcome : std::uint8_t
    {
        None,
        Correct,
        Incorrect,
        Skipped,
        Timeout
    };

    enum class ResolutionKind : std::uint8_t
    {
        Correct,
        Incorrect,
        Skipped,
        Timeout,
        NobodyCorrect
    };

    struct RoundResolution
    {
        std::optional<PlayerId> winner{};
        ResolutionKind kind{ResolutionKind::Timeout};
    };
} // namespace robotrace::core

#endif //ROBOTRACE_ACTIONS_HPP
