//
// RemoteActuator.hpp: ActuatorPort that ships commands to robot-bridge peers
//

#ifndef ROBOTRACE_REMOTEACTUATOR_HPP
#define ROBOTRACE_REMOTEACTUATOR_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "core/ActuatorPort.hpp"
#include "core/Types.hpp"

namespace robotrace::net
{
    class RemoteActuator final : public core::ActuatorPort
    {
    public:
        // Delivers one encoded ActuatorMsg; returns how many peers took it
        using Sink = std::function<std::size_t(std::span<std::byte const>)>;

        explicit RemoteActuator(Sink sink);

        auto Advance(core::PlayerId player, int distance) -> void override;
        auto Celebrate(core::PlayerId player) -> void override;

        auto Sent() const noexcept -> std::uint64_t { return sent_; }
        auto Dropped() const noexcept -> std::uint64_t { return dropped_; }

    private:
        auto Deliver(std::span<std::byte const> bytes, char const* what, core::PlayerId player) -> void;

    private:
        Sink sink_;
        std::uint64_t msg_id_{1};
        std::uint64_t sent_{0};
        std::uint64_t dropped_{0};
    };
}

#endif // ROBOTRACE_REMOTEACTUATOR_HPP
