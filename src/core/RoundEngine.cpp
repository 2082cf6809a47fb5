//
// Created by Malik T on 15/08/2025.
//
#include "RoundEngine.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>
#include <variant>

#include "BuzzerRacePolicy.hpp"
#include "OpenAnswerPolicy.hpp"

namespace robotrace::core
{
    auto MakePolicy(RuleVariant const v) -> std::unique_ptr<RoundPolicy>
    {
        switch (v)
        {
        case RuleVariant::BuzzerRace: return std::make_unique<BuzzerRacePolicy>();
        case RuleVariant::OpenAnswer: return std::make_unique<OpenAnswerPolicy>();
        }
        RR_THROW(error::Code::Config, "Unknown rule variant");
    }

    auto ActorOf(PlayerAction const& a) noexcept -> std::optional<PlayerId>
    {
        return std::visit([]<typename T0>(T0 const& act) -> std::optional<PlayerId>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ClaimBuzzerAction> ||
                          std::is_same_v<T, SelectOptionAction> ||
                          std::is_same_v<T, SkipAction>)
            {
                return act.player;
            }
            else
            {
                return std::nullopt;
            }
        }, a);
    }

    RoundEngine::RoundEngine(Config const& config, std::unique_ptr<RoundPolicy> policy) :
        cfg_(config),
        policy_(std::move(policy))
    {
        RR_ASSERT(policy_ != nullptr, "Round engine built without a policy");
    }

    auto RoundEngine::BeginRound(Question question, OptionSet options,
                                 std::size_t const number, TimePoint const now) -> void
    {
        round_.emplace();
        round_->question = std::move(question);
        round_->options = std::move(options);
        round_->number = number;
        last_violation_.reset();

        RR_ASSERT(round_->options.CorrectText() == round_->question.correct,
                  "Option set does not carry the correct answer");

        EnterPhase(policy_->LeadIn(), now);
    }

    auto RoundEngine::EnterPhase(Phase const p, TimePoint const now) -> void
    {
        RR_ASSERT(round_.has_value(), "Round phase entered without a round");

        phase_ = p;
        round_->phase_started = now;

        std::optional<Millis> const limit = (p == Phase::Result)
                                                ? std::optional<Millis>{cfg_.result_pause}
                                                : policy_->PhaseLimit(p, cfg_);
        timer_.Start(now, limit);
    }

    auto RoundEngine::Resolve(RoundResolution const resolution, TimePoint const now) -> StepOutcome
    {
        RR_ASSERT(round_.has_value(), "Resolve without a round");
        RR_ASSERT(!round_->resolution.has_value(), "Round resolved twice");
        RR_ASSERT(EpochOf(phase_) == Epoch::Contest, "Round resolved outside the contest");

        round_->resolution = resolution;
        round_->round_winner = resolution.winner;
        EnterPhase(Phase::Result, now);
        return StepOutcome::RoundResolved;
    }

    auto RoundEngine::IsCorrectOption(std::size_t const index) const -> bool
    {
        RR_ASSERT(round_.has_value(), "No round to judge against");
        RR_ASSERT(index < constants::OptionCount, "Option index not validated");
        return round_->options.options[index] == round_->question.correct;
    }

    auto RoundEngine::PlayerState(PlayerId const p) -> PlayerRoundState&
    {
        RR_ASSERT(round_.has_value(), "No round for player state");
        return round_->players[IndexOf(p)];
    }

    auto RoundEngine::PlayerState(PlayerId const p) const -> PlayerRoundState const&
    {
        RR_ASSERT(round_.has_value(), "No round for player state");
        return round_->players[IndexOf(p)];
    }

    auto RoundEngine::Reject(error::RuleViolation v) -> StepOutcome
    {
        last_violation_ = std::move(v);
        return StepOutcome::Ignored;
    }

    auto RoundEngine::Handle(PlayerAction const& action, TimePoint const now) -> StepOutcome
    {
        using RVC = error::RuleViolationCode;

        std::optional<PlayerId> const actor = ActorOf(action);
        if (!actor)
            RR_THROW(error::Code::State, "Session action routed to the round engine");

        if (!round_ || EpochOf(phase_) != Epoch::Contest)
        {
            return Reject(error::RuleViolation{.code = RVC::WrongPhase_ContestRequired}
                          .with_phase(phase_).with_actor(*actor));
        }

        if (auto const ok = policy_->Validate(*this, action); !ok.has_value())
        {
            return Reject(ok.error());
        }
        return policy_->Apply(*this, action, now);
    }

    auto RoundEngine::Tick(TimePoint const now) -> StepOutcome
    {
        if (!round_ || phase_ == Phase::Menu || phase_ == Phase::Finished)
            return StepOutcome::Idle;

        if (!timer_.Fire(now))
            return StepOutcome::Idle;

        // result display over; the session decides what comes next
        if (phase_ == Phase::Result)
            return StepOutcome::RoundEnded;

        return policy_->OnExpired(*this, now);
    }

    auto RoundEngine::Finish() -> void
    {
        phase_ = Phase::Finished;
        timer_.Start(TimePoint{}, std::nullopt);
    }

    auto RoundEngine::ResetToMenu() -> void
    {
        round_.reset();
        last_violation_.reset();
        phase_ = Phase::Menu;
        timer_.Start(TimePoint{}, std::nullopt);
    }

    auto RoundEngine::CountdownValue(TimePoint const now) const noexcept -> int
    {
        if (phase_ != Phase::Countdown || cfg_.countdown_step <= Millis::zero()) return 0;

        auto const step = static_cast<int>(timer_.Elapsed(now) / cfg_.countdown_step);
        return std::clamp(constants::CountdownSteps - step, 1, constants::CountdownSteps);
    }

    auto RoundEngine::FillSnapshot(SessionSnapshot& snap, TimePoint const now) const -> void
    {
        snap.phase = phase_;
        snap.variant = policy_->Variant();
        snap.time_remaining = timer_.Remaining(now);
        snap.countdown = CountdownValue(now);

        snap.has_question = round_.has_value();
        if (!round_) return;

        snap.question_number = round_->number;
        snap.prompt = round_->question.prompt;
        snap.options = round_->options.options;
        snap.buzzer_winner = round_->buzzer_winner;
        snap.round_winner = round_->round_winner;

        for (PlayerId const p : AllPlayers)
        {
            snap.players[IndexOf(p)].attempt = round_->players[IndexOf(p)].attempt;
        }

        if (round_->resolution)
        {
            snap.resolution = round_->resolution->kind;
            snap.revealed_index = round_->options.correct_index;
            snap.revealed_answer = round_->question.correct;
        }
    }
}
