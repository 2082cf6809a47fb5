//
// RemoteActuator.cpp
//

#include "net/RemoteActuator.hpp"

#include <cstdio>
#include <print>
#include <utility>

#include "core/Exception.hpp"
#include "net/codec.hpp"

namespace robotrace::net
{
    RemoteActuator::RemoteActuator(Sink sink)
        : sink_{std::move(sink)}
    {
        RR_ASSERT(static_cast<bool>(sink_), "RemoteActuator needs a sink");
    }

    auto RemoteActuator::Advance(core::PlayerId const player, int const distance) -> void
    {
        auto const buf = BuildAdvance(player, distance, msg_id_++);
        Deliver(AsBytes(buf), "advance", player);
    }

    auto RemoteActuator::Celebrate(core::PlayerId const player) -> void
    {
        auto const buf = BuildCelebrate(player, msg_id_++);
        Deliver(AsBytes(buf), "celebrate", player);
    }

    auto RemoteActuator::Deliver(std::span<std::byte const> bytes, char const* what, core::PlayerId const player) -> void
    {
        if (sink_(bytes) == 0)
        {
            ++dropped_;
            std::println(stderr, "[robot] no robot peer connected, {} for P{} dropped", what, core::NumberOf(player));
            return;
        }
        ++sent_;
    }
}
