//
// Created by Malik T on 18/08/2025.
//

#ifndef ROBOTRACE_RANDOMCONTESTANT_HPP
#define ROBOTRACE_RANDOMCONTESTANT_HPP

#include <optional>
#include <random>

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace robotrace::core
{
    // Plays one seat by reacting to snapshots with random, mostly legal inputs.
    // Used by self-play tests and the network bot.
    class RandomContestant final
    {
    public:
        // act_chance: probability of pressing anything on a given frame
        RandomContestant(PlayerId seat, std::uint64_t rng_seed, double act_chance = 0.25);

        auto Play(SessionSnapshot const& snapshot) -> std::optional<PlayerAction>;

        auto Seat() const noexcept -> PlayerId { return seat_; }

    private:
        auto Chance(double p) -> bool { return std::bernoulli_distribution{p}(rng_); }
        auto PickOption() -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, constants::OptionCount - 1}(rng_);
        }

    private:
        PlayerId seat_;
        double act_chance_;
        std::mt19937 rng_;
    };
}

#endif //ROBOTRACE_RANDOMCONTESTANT_HPP
