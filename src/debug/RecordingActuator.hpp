//
// Created by malikt on 8/20/25.
//

#ifndef ROBOTRACE_RECORDINGACTUATOR_HPP
#define ROBOTRACE_RECORDINGACTUATOR_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/ActuatorPort.hpp"
#include "../core/Exception.hpp"

namespace robotrace::core::debug
{
    struct ActuatorCall
    {
        enum class Kind : std::uint8_t { Advance, Celebrate };

        Kind kind{Kind::Advance};
        PlayerId player{PlayerId::P1};
        int distance{}; // Advance only

        auto operator==(ActuatorCall const&) const -> bool = default;
    };

    // Records every command, then forwards to an optional inner actuator.
    class RecordingActuator final : public ActuatorPort
    {
    public:
        RecordingActuator() = default;
        explicit RecordingActuator(std::unique_ptr<ActuatorPort> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Advance(PlayerId player, int distance) -> void override
        {
            calls_.push_back({.kind = ActuatorCall::Kind::Advance, .player = player, .distance = distance});
            if (fail_next_)
            {
                fail_next_ = false;
                RR_THROW(error::Code::Actuator, "robot did not acknowledge advance");
            }
            if (inner_) inner_->Advance(player, distance);
        }

        auto Celebrate(PlayerId player) -> void override
        {
            calls_.push_back({.kind = ActuatorCall::Kind::Celebrate, .player = player});
            if (fail_next_)
            {
                fail_next_ = false;
                RR_THROW(error::Code::Actuator, "robot did not acknowledge celebrate");
            }
            if (inner_) inner_->Celebrate(player);
        }

        // Next command throws an ActuatorError after being recorded
        auto FailNext() noexcept -> void { fail_next_ = true; }

        auto Calls() const noexcept -> std::vector<ActuatorCall> const& { return calls_; }

        auto CountOf(ActuatorCall::Kind const k) const -> std::size_t
        {
            std::size_t n{};
            for (ActuatorCall const& c : calls_) n += (c.kind == k);
            return n;
        }

    private:
        std::unique_ptr<ActuatorPort> inner_{};
        std::vector<ActuatorCall> calls_{};
        bool fail_next_{false};
    };

    // Hands ownership to the session while the test keeps a view on the calls
    inline auto MakeRecording() -> std::pair<std::unique_ptr<ActuatorPort>, RecordingActuator*>
    {
        auto rec = std::make_unique<RecordingActuator>();
        RecordingActuator* view = rec.get();
        return {std::move(rec), view};
    }
} // namespace robotrace::core::debug

#endif //ROBOTRACE_RECORDINGACTUATOR_HPP
