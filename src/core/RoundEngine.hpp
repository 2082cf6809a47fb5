//
// Created by Malik T on 15/08/2025.
//

#ifndef ROBOTRACE_ROUNDENGINE_HPP
#define ROBOTRACE_ROUNDENGINE_HPP

#include <memory>
#include <optional>

#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "RoundPolicy.hpp"
#include "PhaseTimer.hpp"

namespace robotrace::core::debug {struct Inspector;}
namespace robotrace::core
{
    // Phase skeleton shared by every rule variant. The injected policy decides
    // what a contest action means; the engine owns phases, timers and context.
    class RoundEngine
    {
    public:
        RoundEngine() = delete;
        RoundEngine(Config const& config, std::unique_ptr<RoundPolicy> policy);

        // Drops any previous round and enters the policy's lead-in phase.
        auto BeginRound(Question question, OptionSet options, std::size_t number, TimePoint now) -> void;

        // Contest actions only (claim/select/skip). Anything else is engine misuse.
        auto Handle(PlayerAction const& action, TimePoint now) -> StepOutcome;

        // Timer expiry check, at most one transition per call.
        auto Tick(TimePoint now) -> StepOutcome;

        // Terminal screen; the last round stays readable for the reveal.
        auto Finish() -> void;
        auto ResetToMenu() -> void;

        auto FillSnapshot(SessionSnapshot& snap, TimePoint now) const -> void;

        auto PhaseNow() const noexcept      -> Phase { return phase_; }
        auto Variant() const noexcept       -> RuleVariant { return policy_->Variant(); }
        auto Round() const noexcept         -> RoundContext const* { return round_ ? &*round_ : nullptr; }
        auto Cfg() const noexcept           -> Config const& { return cfg_; }
        auto TimeRemaining(TimePoint now) const noexcept -> std::optional<Millis> { return timer_.Remaining(now); }
        auto CountdownValue(TimePoint now) const noexcept -> int;
        auto LastViolation() const noexcept -> std::optional<error::RuleViolation> const& { return last_violation_; }

        //allows policies to directly access private data on an instance
        friend class BuzzerRacePolicy;
        friend class OpenAnswerPolicy;
        friend struct debug::Inspector;

        // Helpers used by the policies
        auto EnterPhase(Phase p, TimePoint now) -> void;
        auto Resolve(RoundResolution resolution, TimePoint now) -> StepOutcome;
        auto IsCorrectOption(std::size_t index) const -> bool;
        auto PlayerState(PlayerId p) -> PlayerRoundState&;
        auto PlayerState(PlayerId p) const -> PlayerRoundState const&;

    private:
        auto Reject(error::RuleViolation v) -> StepOutcome;

    private:
        Config cfg_;
        std::unique_ptr<RoundPolicy> policy_;

        Phase phase_{Phase::Menu};
        PhaseTimer timer_{};
        std::optional<RoundContext> round_{};
        std::optional<error::RuleViolation> last_violation_{};
    };

    // Player carried by a contest action, nullopt for session actions
    auto ActorOf(PlayerAction const& a) noexcept -> std::optional<PlayerId>;
}
#endif //ROBOTRACE_ROUNDENGINE_HPP
