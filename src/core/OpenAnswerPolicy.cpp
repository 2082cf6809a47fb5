//
// Created by Malik T on 16/08/2025.
//

#include "OpenAnswerPolicy.hpp"

#include <algorithm>
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
    auto OpenAnswerPolicy::PhaseLimit(Phase const p, Config const& cfg) const -> std::optional<Millis>
    {
        switch (p)
        {
        case Phase::Countdown: return cfg.countdown_step * constants::CountdownSteps;
        case Phase::Question:  return cfg.question_time;
        default:
            break;
        }
        RR_THROW(error::Code::Rules, std::format("Open answer has no {} phase", error::to_string(p)));
    }

    auto OpenAnswerPolicy::Validate(RoundEngine const& engine, PlayerAction const& a) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        Phase const phase = engine.phase_;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, ClaimBuzzerAction> || std::is_same_v<T, SkipAction>)
            {
                return std::unexpected(Viol(RVC::NotSupportedByVariant)
                                       .with_phase(phase).with_actor(act.player));
            }
            else if constexpr (std::is_same_v<T, SelectOptionAction>)
            {
                if (phase != Phase::Question)
                    return std::unexpected(Viol(RVC::WrongPhase_QuestionRequired)
                                           .with_phase(phase).with_actor(act.player));

                PlayerRoundState const& st = engine.PlayerState(act.player);
                if (st.IsLocked())
                    return std::unexpected(Viol(RVC::Answer_PlayerLocked).with_actor(act.player));

                if (act.index >= constants::OptionCount)
                    return std::unexpected(Viol(RVC::Option_IndexOutOfRange)
                                           .with_actor(act.player).with_option(act.index));
                return {};
            }
            else
            {
                RR_THROW(error::Code::Rules, "Session action handed to the open answer policy");
            }
        }, a);
    }

    auto OpenAnswerPolicy::Apply(RoundEngine& engine, PlayerAction const& a, TimePoint const now) -> StepOutcome
    {
        auto const* select = std::get_if<SelectOptionAction>(&a);
        if (!select)
            RR_THROW(error::Code::Rules, "Open answer only applies option selections");

        PlayerRoundState& st = engine.PlayerState(select->player);
        if (engine.IsCorrectOption(select->index))
        {
            st.attempt = Attempt::Correct;
            return engine.Resolve({.winner = select->player, .kind = ResolutionKind::Correct}, now);
        }

        st.attempt = Attempt::Locked;

        bool const all_locked = std::ranges::all_of(AllPlayers, [&](PlayerId const p)
        {
            return engine.PlayerState(p).IsLocked();
        });
        if (all_locked)
            return engine.Resolve({.winner = std::nullopt, .kind = ResolutionKind::NobodyCorrect}, now);

        return StepOutcome::Applied;
    }

    auto OpenAnswerPolicy::OnExpired(RoundEngine& engine, TimePoint const now) -> StepOutcome
    {
        switch (engine.phase_)
        {
        case Phase::Countdown:
            engine.EnterPhase(Phase::Question, now);
            return StepOutcome::Applied;

        case Phase::Question:
            for (PlayerId const p : AllPlayers)
            {
                PlayerRoundState& st = engine.PlayerState(p);
                if (st.attempt == Attempt::Unattempted) st.attempt = Attempt::TimedOut;
            }
            return engine.Resolve({.winner = std::nullopt, .kind = ResolutionKind::Timeout}, now);

        default:
            break;
        }
        RR_THROW(error::Code::State, std::format("Open answer timer expired in {}", error::to_string(engine.phase_)));
    }
}
