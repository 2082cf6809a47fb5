//
// Created by Malik T on 15/08/2025.
//

#ifndef ROBOTRACE_ROUNDPOLICY_HPP
#define ROBOTRACE_ROUNDPOLICY_HPP

#include <memory>

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace robotrace::core
{
    //forward declaration
    class RoundEngine;

    class RoundPolicy
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~RoundPolicy() = default;

        virtual auto Variant() const noexcept -> RuleVariant = 0;

        // Phase a fresh question starts in (Reading / Countdown)
        virtual auto LeadIn() const noexcept -> Phase = 0;

        // nullopt = no time limit. Throws for phases the variant does not own.
        virtual auto PhaseLimit(Phase p, Config const& cfg) const -> std::optional<Millis> = 0;

        // Returns unexpected(reason) for spurious/late inputs (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(RoundEngine const& engine, PlayerAction const& a) const -> CheckResult = 0;

        // Only called after a successful Validate.
        virtual auto Apply(RoundEngine& engine, PlayerAction const& a, TimePoint now) -> StepOutcome = 0;

        // The current lead-in/contest phase ran out of time.
        virtual auto OnExpired(RoundEngine& engine, TimePoint now) -> StepOutcome = 0;
    };

    auto MakePolicy(RuleVariant v) -> std::unique_ptr<RoundPolicy>;
}

#endif //ROBOTRACE_ROUNDPOLICY_HPP
