
#ifndef ROBOTRACE_CODEC_HPP
#define ROBOTRACE_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/robotrace_wire_generated.h"

namespace robotrace::net
{
    struct ParseError
    {
        std::string message;
    };

    enum class MessageKind : std::uint8_t
    {
        Snapshot,
        Input,
        Actuator
    };

    // Robot bridge side of an ActuatorMsg
    struct ActuatorCommand
    {
        enum class Kind : std::uint8_t { Advance, Celebrate };

        Kind kind{Kind::Advance};
        core::PlayerId player{core::PlayerId::P1};
        int distance{};
        std::uint64_t msg_id{};
    };

    auto ToFbPhase(core::Phase p) noexcept -> gen::net::Phase;
    auto FromFbPhase(gen::net::Phase p) noexcept -> core::Phase;
    auto ToFbPlayer(std::optional<core::PlayerId> p) noexcept -> gen::net::Player;
    auto FromFbPlayer(gen::net::Player p) noexcept -> std::optional<core::PlayerId>;

    // Verifies the buffer and reports which message it carries
    auto PeekKind(std::span<std::byte const> bytes) -> std::expected<MessageKind, ParseError>;

    // --- server -> display / input peers ---
    auto BuildSnapshot(core::SessionSnapshot const& snap, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto DecodeSnapshot(std::span<std::byte const> bytes)
        -> std::expected<core::SessionSnapshot, ParseError>;

    // --- input peer -> server ---
    auto BuildInput(core::PlayerAction const& action, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Player seats are checked here; option index and level are left to the rules.
    auto DecodeInput(std::span<std::byte const> bytes)
        -> std::expected<core::PlayerAction, ParseError>;

    // --- server -> robot bridge ---
    auto BuildAdvance(core::PlayerId player, int distance, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildCelebrate(core::PlayerId player, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto DecodeActuatorCommand(std::span<std::byte const> bytes)
        -> std::expected<ActuatorCommand, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace robotrace::net


#endif //ROBOTRACE_CODEC_HPP
