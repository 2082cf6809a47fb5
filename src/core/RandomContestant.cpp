//
// Created by Malik T on 18/08/2025.
//

#include "RandomContestant.hpp"

#include "Exception.hpp"

namespace robotrace::core
{
    RandomContestant::RandomContestant(PlayerId const seat, std::uint64_t const rng_seed, double const act_chance) :
        seat_(seat),
        act_chance_(act_chance),
        rng_(static_cast<std::mt19937::result_type>(rng_seed))
    {
        RR_ASSERT(act_chance_ >= 0.0 && act_chance_ <= 1.0, "act_chance must be a probability");
    }

    auto RandomContestant::Play(SessionSnapshot const& s) -> std::optional<PlayerAction>
    {
        if (!s.has_question || !Chance(act_chance_)) return std::nullopt;

        PlayerView const& me = s.players[IndexOf(seat_)];

        switch (s.phase)
        {
        case Phase::Buzzer:
            if (s.buzzer_winner) return std::nullopt;
            return ClaimBuzzerAction{seat_};

        case Phase::Answering:
            if (s.buzzer_winner != seat_) return std::nullopt;
            if (Chance(0.1)) return SkipAction{seat_};
            return SelectOptionAction{seat_, PickOption()};

        case Phase::Question:
            if (me.attempt != Attempt::Unattempted) return std::nullopt;
            return SelectOptionAction{seat_, PickOption()};

        default:
            break;
        }

        // now and then press something out of turn; the engine has to shrug it off
        if (Chance(0.05)) return ClaimBuzzerAction{seat_};
        return std::nullopt;
    }
}
