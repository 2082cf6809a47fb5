//
// Created by Malik T on 15/08/2025.
//

#include "BuzzerRacePolicy.hpp"

#include <type_traits>
#include <variant>

#include "RoundEngine.hpp"

namespace
{
    inline auto Viol(robotrace::core::error::RuleViolationCode code) -> robotrace::core::error::RuleViolation
    {
        return robotrace::core::error::RuleViolation{ .code = code };
    }
}

namespace robotrace::core
{
    auto BuzzerRacePolicy::PhaseLimit(Phase const p, Config const& cfg) const -> std::optional<Millis>
    {
        switch (p)
        {
        case Phase::Reading:     return cfg.reading_time;
        case Phase::Buzzer:
            if (cfg.buzzer_window <= Millis::zero()) return std::nullopt;
            return cfg.buzzer_window;
        case Phase::BuzzerPause: return cfg.buzzer_pause;
        case Phase::Answering:   return cfg.answer_time;
        default:
            break;
        }
        RR_THROW(error::Code::Rules, std::format("Buzzer race has no {} phase", error::to_string(p)));
    }

    auto BuzzerRacePolicy::Validate(RoundEngine const& engine, PlayerAction const& a) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        RoundContext const& round = *engine.round_;
        Phase const phase = engine.phase_;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, ClaimBuzzerAction>)
            {
                if (round.buzzer_winner)
                    return std::unexpected(Viol(RVC::Buzzer_AlreadyClaimed)
                                           .with_phase(phase).with_actor(act.player)
                                           .with_buzzer_winner(round.buzzer_winner));

                if (phase != Phase::Buzzer)
                    return std::unexpected(Viol(RVC::WrongPhase_BuzzerRequired)
                                           .with_phase(phase).with_actor(act.player));
                return {};
            }
            else if constexpr (std::is_same_v<T, SelectOptionAction>)
            {
                if (phase != Phase::Answering)
                    return std::unexpected(Viol(RVC::WrongPhase_AnsweringRequired)
                                           .with_phase(phase).with_actor(act.player));

                if (round.buzzer_winner != act.player)
                    return std::unexpected(Viol(RVC::Answer_NotBuzzerWinner)
                                           .with_actor(act.player)
                                           .with_buzzer_winner(round.buzzer_winner));

                if (act.index >= constants::OptionCount)
                    return std::unexpected(Viol(RVC::Option_IndexOutOfRange)
                                           .with_actor(act.player).with_option(act.index));
                return {};
            }
            else if constexpr (std::is_same_v<T, SkipAction>)
            {
                if (phase != Phase::Answering)
                    return std::unexpected(Viol(RVC::WrongPhase_AnsweringRequired)
                                           .with_phase(phase).with_actor(act.player));

                if (round.buzzer_winner != act.player)
                    return std::unexpected(Viol(RVC::Skip_NotBuzzerWinner)
                                           .with_actor(act.player)
                                           .with_buzzer_winner(round.buzzer_winner));
                return {};
            }
            else
            {
                RR_THROW(error::Code::Rules, "Session action handed to the buzzer race policy");
            }
        }, a);
    }

    auto BuzzerRacePolicy::Apply(RoundEngine& engine, PlayerAction const& a, TimePoint const now) -> StepOutcome
    {
        return std::visit([&]<typename T0>(T0 const& act) -> StepOutcome
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, ClaimBuzzerAction>)
            {
                engine.round_->buzzer_winner = act.player;
                engine.EnterPhase(Phase::BuzzerPause, now);
                return StepOutcome::Applied;
            }
            else if constexpr (std::is_same_v<T, SelectOptionAction>)
            {
                PlayerRoundState& st = engine.PlayerState(act.player);
                if (engine.IsCorrectOption(act.index))
                {
                    st.attempt = Attempt::Correct;
                    return engine.Resolve({.winner = act.player, .kind = ResolutionKind::Correct}, now);
                }
                // wrong answer ends the round, no penalty
                st.attempt = Attempt::Incorrect;
                return engine.Resolve({.winner = std::nullopt, .kind = ResolutionKind::Incorrect}, now);
            }
            else if constexpr (std::is_same_v<T, SkipAction>)
            {
                engine.PlayerState(act.player).attempt = Attempt::Skipped;
                return engine.Resolve({.winner = std::nullopt, .kind = ResolutionKind::Skipped}, now);
            }
            else
            {
                RR_THROW(error::Code::Rules, "Session action handed to the buzzer race policy");
            }
        }, a);
    }

    auto BuzzerRacePolicy::OnExpired(RoundEngine& engine, TimePoint const now) -> StepOutcome
    {
        using error::Code;

        switch (engine.phase_)
        {
        case Phase::Reading:
            engine.EnterPhase(Phase::Buzzer, now);
            return StepOutcome::Applied;

        case Phase::Buzzer:
            // nobody pressed within the window
            return engine.Resolve({.winner = std::nullopt, .kind = ResolutionKind::Timeout}, now);

        case Phase::BuzzerPause:
            engine.EnterPhase(Phase::Answering, now);
            return StepOutcome::Applied;

        case Phase::Answering:
        {
            std::optional<PlayerId> const holder = engine.round_->buzzer_winner;
            if (!holder)
                RR_THROW(Code::State, "Answering reached without a buzzer winner");

            engine.PlayerState(*holder).attempt = Attempt::TimedOut;
            return engine.Resolve({.winner = std::nullopt, .kind = ResolutionKind::Timeout}, now);
        }

        default:
            break;
        }
        RR_THROW(Code::State, std::format("Buzzer race timer expired in {}", error::to_string(engine.phase_)));
    }
}
