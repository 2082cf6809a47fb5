//
// Created by Malik T on 14/08/2025.
//

#ifndef ROBOTRACE_ACTUATORPORT_HPP
#define ROBOTRACE_ACTUATORPORT_HPP

#include "Types.hpp"

namespace robotrace::core
{
    // The physical (or simulated) race track. Fire-and-forget: the session
    // never waits on it, and a throwing implementation is logged and ignored.
    class ActuatorPort
    {
    public:
        virtual ~ActuatorPort() = default;

        // Move the player's robot forward by `distance` track units.
        virtual auto Advance(PlayerId player, int distance) -> void = 0;

        // Victory routine, at most once per match.
        virtual auto Celebrate(PlayerId player) -> void = 0;
    };
}
#endif //ROBOTRACE_ACTUATORPORT_HPP
