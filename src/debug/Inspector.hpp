//
// Created by Malik T on 19/08/2025.
//

#ifndef ROBOTRACE_INSPECTOR_HPP
#define ROBOTRACE_INSPECTOR_HPP

#include <array>
#include <cstddef>
#include <optional>

#include "../core/Types.hpp"
#include "../core/RoundEngine.hpp"
#include "../core/SessionController.hpp"

namespace robotrace::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            Phase phase{};
            RuleVariant variant{};
            std::optional<RoundContext> round{};
            std::optional<Millis> phase_limit{};
            bool timer_fired{};

            std::array<PlayerMatchState, constants::PlayerCount> players{};
            std::optional<MatchResult> result{};

            std::uint8_t level{};
            std::size_t asked{};
            std::size_t remaining{};
            bool celebrated{};
            int increment{};
        };

        static inline auto Gather(RoundEngine const& e, SnapshotAll& ret) -> void
        {
            ret.phase = e.phase_;
            ret.variant = e.policy_->Variant();
            ret.round = e.round_;
            ret.phase_limit = e.timer_.Limit();
            ret.timer_fired = e.timer_.Fired();
        }

        static inline auto Gather(SessionController const& s) -> SnapshotAll
        {
            SnapshotAll ret{};
            Gather(s.engine_, ret);

            for (PlayerId const p : AllPlayers)
            {
                ret.players[IndexOf(p)] = s.board_.Of(p);
            }
            ret.result = s.board_.Result();
            ret.level = s.level_;
            ret.asked = s.asked_;
            ret.remaining = s.bank_.Remaining();
            ret.celebrated = s.celebrated_;
            ret.increment = s.cfg_.position_increment;
            return ret;
        }
    };
}

#endif //ROBOTRACE_INSPECTOR_HPP
