//
// Created by Malik T on 15/08/2025.
//

#ifndef ROBOTRACE_BUZZERRACEPOLICY_HPP
#define ROBOTRACE_BUZZERRACEPOLICY_HPP
#include "RoundPolicy.hpp"

namespace robotrace::core
{
    // Reading -> Buzzer -> BuzzerPause -> Answering. Only the first player to
    // claim the buzzer may answer or skip.
    class BuzzerRacePolicy final : public RoundPolicy
    {
    public:
        auto Variant() const noexcept -> RuleVariant override { return RuleVariant::BuzzerRace; }
        auto LeadIn() const noexcept -> Phase override { return Phase::Reading; }
        auto PhaseLimit(Phase p, Config const& cfg) const -> std::optional<Millis> override;
        auto Validate(RoundEngine const& engine, PlayerAction const& a) const -> CheckResult override;
        auto Apply(RoundEngine& engine, PlayerAction const& a, TimePoint now) -> StepOutcome override;
        auto OnExpired(RoundEngine& engine, TimePoint now) -> StepOutcome override;
    };
}

#endif //ROBOTRACE_BUZZERRACEPOLICY_HPP
