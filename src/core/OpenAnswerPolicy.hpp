//
// Created by Malik T on 16/08/2025.
//

#ifndef ROBOTRACE_OPENANSWERPOLICY_HPP
#define ROBOTRACE_OPENANSWERPOLICY_HPP
#include "RoundPolicy.hpp"

namespace robotrace::core
{
    // Countdown -> Question. Both players answer the same question; a wrong
    // answer locks that player out, the first correct one takes the round.
    class OpenAnswerPolicy final : public RoundPolicy
    {
    public:
        auto Variant() const noexcept -> RuleVariant override { return RuleVariant::OpenAnswer; }
        auto LeadIn() const noexcept -> Phase override { return Phase::Countdown; }
        auto PhaseLimit(Phase p, Config const& cfg) const -> std::optional<Millis> override;
        auto Validate(RoundEngine const& engine, PlayerAction const& a) const -> CheckResult override;
        auto Apply(RoundEngine& engine, PlayerAction const& a, TimePoint now) -> StepOutcome override;
        auto OnExpired(RoundEngine& engine, TimePoint now) -> StepOutcome override;
    };
}

#endif //ROBOTRACE_OPENANSWERPOLICY_HPP
