//
// Created by Malik T on 20/08/2025.
//

#ifndef ROBOTRACE_AUDITLOGGER_HPP
#define ROBOTRACE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <string_view>

#include "../core/Actions.hpp"
#include "../core/SessionController.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace robotrace::core::debug
{
    // Plain-text match transcript, one line per record
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (seed, variant, timings)
        auto start(Config const& cfg) -> void;

        // One input and what the session made of it
        auto input(PlayerAction const& a, StepOutcome out) -> void;

        // Journal drained from the session
        auto events(std::span<SessionEvent const> evs) -> void;

        // Footer with scores and the match result
        auto end(SessionController const& session) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto to_string(PlayerAction const& a) -> std::string;
    auto to_string(StepOutcome o) -> std::string_view;
}

#endif //ROBOTRACE_AUDITLOGGER_HPP
