//
// Created by Malik T on 04/10/2025.
//

#include "SessionController.hpp"

#include <cstdio>
#include <exception>
#include <format>
#include <print>
#include <type_traits>
#include <utility>
#include <variant>

#include "Exception.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(robotrace::core::error::RuleViolationCode code) -> robotrace::core::error::RuleViolation
    {
        return robotrace::core::error::RuleViolation{ .code = code };
    }
}

namespace robotrace::core
{
    auto to_string(SessionEventKind const k) -> std::string_view
    {
        switch (k)
        {
        case SessionEventKind::LevelStarted:   return "LevelStarted";
        case SessionEventKind::PhaseChanged:   return "PhaseChanged";
        case SessionEventKind::BuzzerClaimed:  return "BuzzerClaimed";
        case SessionEventKind::AttemptJudged:  return "AttemptJudged";
        case SessionEventKind::RoundResolved:  return "RoundResolved";
        case SessionEventKind::MatchEnded:     return "MatchEnded";
        case SessionEventKind::Cancelled:      return "Cancelled";
        case SessionEventKind::Restarted:      return "Restarted";
        case SessionEventKind::ActuatorFailed: return "ActuatorFailed";
        }
        return "?";
    }

    auto to_string(Attempt const a) -> std::string_view
    {
        switch (a)
        {
        case Attempt::Unattempted: return "Unattempted";
        case Attempt::Locked:      return "Locked";
        case Attempt::Correct:     return "Correct";
        case Attempt::Incorrect:   return "Incorrect";
        case Attempt::Skipped:     return "Skipped";
        case Attempt::TimedOut:    return "TimedOut";
        }
        return "?";
    }

    auto to_string(ResolutionKind const r) -> std::string_view
    {
        switch (r)
        {
        case ResolutionKind::Correct:       return "Correct";
        case ResolutionKind::Incorrect:     return "Incorrect";
        case ResolutionKind::Skipped:       return "Skipped";
        case ResolutionKind::Timeout:       return "Timeout";
        case ResolutionKind::NobodyCorrect: return "NobodyCorrect";
        }
        return "?";
    }

    auto describe(SessionEvent const& e) -> std::string
    {
        auto s = std::format("{} | phase={} | q={}", to_string(e.kind), error::to_string(e.phase), e.question_number);
        if (e.player) s += std::format(" | P{}", NumberOf(*e.player));
        if (e.attempt) s += std::format(" | attempt={}", to_string(*e.attempt));
        if (e.resolution) s += std::format(" | resolution={}", to_string(*e.resolution));
        if (e.match)
        {
            s += e.match->winner ? std::format(" | winner=P{}", NumberOf(*e.match->winner)) : std::string{" | draw"};
            s += e.match->reason == MatchEndReason::TrackCompleted ? " (track)" : " (bank)";
        }
        if (!e.detail.empty()) s += std::format(" | {}", e.detail);
        return s;
    }

    template <class F>
    auto SessionController::GuardActuator(char const* what, F&& call) -> void
    {
        // the robots are best-effort; a failure must not stall the quiz
        try
        {
            std::forward<F>(call)();
        }
        catch (OmegaException<error::Code> const& e)
        {
            std::print(stderr, "[session] actuator {} failed: {}", what, e);
            Emit({.kind = SessionEventKind::ActuatorFailed, .detail = std::format("{}: {}", what, e.what())});
        }
        catch (std::exception const& e)
        {
            std::println(stderr, "[session] actuator {} failed: {}", what, e.what());
            Emit({.kind = SessionEventKind::ActuatorFailed, .detail = std::format("{}: {}", what, e.what())});
        }
    }

    SessionController::SessionController(Config const& config,
                                         QuestionBank bank,
                                         std::unique_ptr<RoundPolicy> policy,
                                         std::unique_ptr<ActuatorPort> actuator) :
        cfg_(config),
        bank_(std::move(bank)),
        engine_(config, std::move(policy)),
        actuator_(std::move(actuator))
    {
        RR_ASSERT(actuator_ != nullptr, "Session built without an actuator");
        RR_ASSERT(cfg_.position_increment >= 0, "Negative position increment");
    }

    auto SessionController::Tick(TimePoint const now, std::span<PlayerAction const> inputs) -> TickReport
    {
        TickReport report{};
        report.inputs.reserve(inputs.size());
        std::size_t const first_event = events_.size();

        // arrival order is the tie-break
        for (PlayerAction const& a : inputs)
        {
            StepOutcome const out = Handle(a, now);
            if (out == StepOutcome::Ignored) ++report.ignored;
            report.inputs.push_back(out);
        }

        report.timer = AfterStep(engine_.Tick(now), now);

        for (std::size_t i = first_event; i < events_.size(); ++i)
        {
            if (events_[i].kind == SessionEventKind::MatchEnded) report.match_ended = true;
        }
        return report;
    }

    auto SessionController::Handle(PlayerAction const& action, TimePoint const now) -> StepOutcome
    {
        return std::visit([&]<typename T0>(T0 const& act) -> StepOutcome
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SelectLevelAction>)
                return StartLevel(act.level, now);
            else if constexpr (std::is_same_v<T, CancelAction>)
                return Cancel();
            else if constexpr (std::is_same_v<T, RestartAction>)
                return Restart();
            else
                return HandleContest(action, now);
        }, action);
    }

    auto SessionController::HandleContest(PlayerAction const& action, TimePoint const now) -> StepOutcome
    {
        StepOutcome const out = engine_.Handle(action, now);
        if (out == StepOutcome::Ignored)
        {
            last_violation_ = engine_.LastViolation();
            return out;
        }

        RoundContext const* round = engine_.Round();
        RR_ASSERT(round != nullptr, "Accepted action without a round");

        if (auto const* claim = std::get_if<ClaimBuzzerAction>(&action))
        {
            Emit({.kind = SessionEventKind::BuzzerClaimed, .player = claim->player});
        }
        else if (auto const* select = std::get_if<SelectOptionAction>(&action))
        {
            Emit({.kind = SessionEventKind::AttemptJudged,
                  .player = select->player,
                  .attempt = round->players[IndexOf(select->player)].attempt,
                  .detail = std::format("option={}", select->index)});
        }
        else if (auto const* skip = std::get_if<SkipAction>(&action))
        {
            Emit({.kind = SessionEventKind::AttemptJudged,
                  .player = skip->player,
                  .attempt = Attempt::Skipped});
        }

        return AfterStep(out, now);
    }

    auto SessionController::AfterStep(StepOutcome const outcome, TimePoint const now) -> StepOutcome
    {
        if (outcome == StepOutcome::RoundResolved)
        {
            NotePhase();
            OnRoundResolved();
        }
        else if (outcome == StepOutcome::RoundEnded)
        {
            NextRoundOrFinish(now);
        }
        NotePhase();
        return outcome;
    }

    auto SessionController::OnRoundResolved() -> void
    {
        RoundContext const* round = engine_.Round();
        RR_ASSERT(round != nullptr && round->resolution.has_value(), "Resolution without a resolved round");

        RoundResolution const res = *round->resolution;
        Emit({.kind = SessionEventKind::RoundResolved, .player = res.winner, .resolution = res.kind});

        if (!res.winner) return;

        PlayerId const winner = *res.winner;
        std::optional<MatchResult> const done = board_.ApplyCorrect(winner, cfg_.position_increment);

        GuardActuator("advance", [&] { actuator_->Advance(winner, cfg_.position_increment); });

        if (done) EndMatch(*done);
    }

    auto SessionController::NextRoundOrFinish(TimePoint const now) -> void
    {
        std::optional<Question> next = bank_.DrawNext();
        if (!next)
        {
            EndMatch(board_.FinalizeOnBankExhausted());
            return;
        }

        OptionSet options = bank_.ShuffleOptions(*next);
        ++asked_;
        engine_.BeginRound(std::move(*next), std::move(options), asked_, now);
    }

    auto SessionController::EndMatch(MatchResult const& result) -> void
    {
        engine_.Finish();
        NotePhase();
        Emit({.kind = SessionEventKind::MatchEnded, .player = result.winner, .match = result});

        if (result.winner && !celebrated_)
        {
            celebrated_ = true;
            PlayerId const winner = *result.winner;
            GuardActuator("celebrate", [&] { actuator_->Celebrate(winner); });
        }
    }

    auto SessionController::StartLevel(std::uint8_t const level, TimePoint const now) -> StepOutcome
    {
        using RVC = error::RuleViolationCode;

        if (engine_.PhaseNow() != Phase::Menu)
            return Reject(Viol(RVC::Session_MenuRequired).with_phase(engine_.PhaseNow()).with_level(level));

        if (!util::IsValidLevel(level))
            return Reject(Viol(RVC::Session_LevelOutOfRange).with_level(level));

        ResetMatch();
        level_ = level;
        std::size_t const count = bank_.StartSession(level);
        Emit({.kind = SessionEventKind::LevelStarted, .detail = std::format("level={} questions={}", level, count)});

        if (count == 0)
        {
            std::println(stderr, "[session] level {} has no questions", level);
            EndMatch(board_.FinalizeOnBankExhausted());
            return StepOutcome::Applied;
        }

        NextRoundOrFinish(now);
        NotePhase();
        return StepOutcome::Applied;
    }

    auto SessionController::Cancel() -> StepOutcome
    {
        if (engine_.PhaseNow() == Phase::Menu)
            return Reject(Viol(error::RuleViolationCode::Session_AlreadyInMenu).with_phase(Phase::Menu));

        Emit({.kind = SessionEventKind::Cancelled});
        ResetMatch();
        engine_.ResetToMenu();
        NotePhase();
        return StepOutcome::Applied;
    }

    auto SessionController::Restart() -> StepOutcome
    {
        if (engine_.PhaseNow() != Phase::Finished)
            return Reject(Viol(error::RuleViolationCode::Session_FinishedRequired).with_phase(engine_.PhaseNow()));

        Emit({.kind = SessionEventKind::Restarted});
        ResetMatch();
        engine_.ResetToMenu();
        NotePhase();
        return StepOutcome::Applied;
    }

    auto SessionController::ResetMatch() -> void
    {
        board_.Reset();
        bank_.EndSession();
        level_ = 0;
        asked_ = 0;
        celebrated_ = false;
    }

    auto SessionController::Reject(error::RuleViolation v) -> StepOutcome
    {
        last_violation_ = std::move(v);
        return StepOutcome::Ignored;
    }

    auto SessionController::SnapshotFor(TimePoint const now) const -> std::shared_ptr<SessionSnapshot const>
    {
        auto snap = std::make_shared<SessionSnapshot>();
        engine_.FillSnapshot(*snap, now);

        snap->level = level_;
        snap->questions_remaining = bank_.Remaining();
        for (PlayerId const p : AllPlayers)
        {
            PlayerMatchState const& st = board_.Of(p);
            snap->players[IndexOf(p)].score = st.score;
            snap->players[IndexOf(p)].track_position = st.track_position;
        }
        snap->match = board_.Result();
        return snap;
    }

    auto SessionController::TakeEvents() -> std::vector<SessionEvent>
    {
        return std::exchange(events_, {});
    }

    auto SessionController::Emit(SessionEvent e) -> void
    {
        e.phase = engine_.PhaseNow();
        if (e.question_number == 0) e.question_number = asked_;
        events_.push_back(std::move(e));
    }

    auto SessionController::NotePhase() -> void
    {
        Phase const now_phase = engine_.PhaseNow();
        if (now_phase == last_phase_) return;

        last_phase_ = now_phase;
        Emit({.kind = SessionEventKind::PhaseChanged});
    }
}
