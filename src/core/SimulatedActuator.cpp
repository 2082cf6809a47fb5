//
// Created by Malik T on 21/08/2025.
//

#include "SimulatedActuator.hpp"

#include <print>

namespace robotrace::core
{
    auto SimulatedActuator::Advance(PlayerId const player, int const distance) -> void
    {
        travelled_[IndexOf(player)] += distance;
        std::println(out_, "[robot-sim] P{} advances {} (total {})",
                     NumberOf(player), distance, travelled_[IndexOf(player)]);
    }

    auto SimulatedActuator::Celebrate(PlayerId const player) -> void
    {
        std::println(out_, "[robot-sim] P{} celebrates", NumberOf(player));
    }
}
