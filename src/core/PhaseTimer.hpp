//
// Created by Malik T on 03/10/2025.
//

#ifndef ROBOTRACE_PHASETIMER_HPP
#define ROBOTRACE_PHASETIMER_HPP

#include <algorithm>
#include <optional>

#include "Types.hpp"

namespace robotrace::core
{
    // Wall-clock phase timer. Time is always handed in by the caller.
    class PhaseTimer
    {
    public:
        // nullopt limit = runs until the phase is left by an action
        auto Start(TimePoint const now, std::optional<Millis> const limit) noexcept -> void
        {
            started_ = now;
            limit_ = limit;
            fired_ = false;
        }

        auto StartedAt() const noexcept -> TimePoint { return started_; }
        auto Limit() const noexcept -> std::optional<Millis> { return limit_; }

        auto Elapsed(TimePoint const now) const noexcept -> Millis
        {
            if (now <= started_) return Millis::zero();
            return std::chrono::duration_cast<Millis>(now - started_);
        }

        auto Remaining(TimePoint const now) const noexcept -> std::optional<Millis>
        {
            if (!limit_) return std::nullopt;
            return std::max(Millis::zero(), *limit_ - Elapsed(now));
        }

        auto Expired(TimePoint const now) const noexcept -> bool
        {
            std::optional<Millis> const left = Remaining(now);
            return left.has_value() && *left <= Millis::zero();
        }

        // True exactly once per Start()
        auto Fire(TimePoint const now) noexcept -> bool
        {
            if (fired_ || !Expired(now)) return false;
            fired_ = true;
            return true;
        }

        auto Fired() const noexcept -> bool { return fired_; }

    private:
        TimePoint started_{};
        std::optional<Millis> limit_{};
        bool fired_{false};
    };
}

#endif //ROBOTRACE_PHASETIMER_HPP
