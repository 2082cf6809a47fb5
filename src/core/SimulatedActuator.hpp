//
// Created by Malik T on 21/08/2025.
//

#ifndef ROBOTRACE_SIMULATEDACTUATOR_HPP
#define ROBOTRACE_SIMULATEDACTUATOR_HPP

#include <array>
#include <cstdio>

#include "ActuatorPort.hpp"

namespace robotrace::core
{
    // Stand-in for the robots: logs every command and tracks where each
    // robot would be.
    class SimulatedActuator final : public ActuatorPort
    {
    public:
        explicit SimulatedActuator(std::FILE* out = stdout) : out_(out) {}

        auto Advance(PlayerId player, int distance) -> void override;
        auto Celebrate(PlayerId player) -> void override;

        auto Travelled(PlayerId const p) const noexcept -> int { return travelled_[IndexOf(p)]; }

    private:
        std::FILE* out_;
        std::array<int, constants::PlayerCount> travelled_{};
    };
}
#endif //ROBOTRACE_SIMULATEDACTUATOR_HPP
