//
// Created by Malik T on 14/08/2025.
//

#ifndef ROBOTRACE_EXCEPTION_HPP
#define ROBOTRACE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace robotrace::core::error
{
    enum class Code : unsigned
    {
        Rules, // round policy misuse (not a spurious player input)
        State, // engine/session misuse (not a spurious player input)
        Catalog, // question source unusable
        Config, // bad host configuration
        Actuator, // robot side failed
        Serialization, // FlatBuffers verification/build errors
        Network, // transport failure
        Assertion // internal assertion failed
    };

    inline auto to_string(Code const c) -> std::string_view
    {
        switch (c)
        {
        case Code::Rules: return "Rules";
        case Code::State: return "State";
        case Code::Catalog: return "Catalog";
        case Code::Config: return "Config";
        case Code::Actuator: return "Actuator";
        case Code::Serialization: return "Serialization";
        case Code::Network: return "Network";
        case Code::Assertion: return "Assertion";
        }
        return "?";
    }

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct CatalogError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ActuatorError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Catalog: throw CatalogError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Actuator: throw ActuatorError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define RR_THROW(code_enum, msg) ::robotrace::core::error::fail((code_enum), (msg))
#define RR_ASSERT(cond, msg) do { if(!(cond)) ::robotrace::core::error::fail(::robotrace::core::error::Code::Assertion, (msg)); } while(0)

    // Why a player input was dropped. Never raised, only reported.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase_ContestRequired,
        WrongPhase_BuzzerRequired,
        WrongPhase_AnsweringRequired,
        WrongPhase_QuestionRequired,
        NotSupportedByVariant,

        // Buzzer-Race
        Buzzer_AlreadyClaimed,
        Answer_NotBuzzerWinner,
        Skip_NotBuzzerWinner,

        // Open-Answer
        Answer_PlayerLocked,

        // Option
        Option_IndexOutOfRange,

        // Session
        Session_LevelOutOfRange,
        Session_MenuRequired,
        Session_FinishedRequired,
        Session_AlreadyInMenu
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlayerId> actor{};
        std::optional<PlayerId> buzzer_winner{};
        std::optional<std::size_t> option_index{};
        std::optional<int> level{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlayerId p) -> RuleViolation&
        {
            actor = p;
            return *this;
        }

        auto with_buzzer_winner(std::optional<PlayerId> p) -> RuleViolation&
        {
            buzzer_winner = p;
            return *this;
        }

        auto with_option(std::size_t i) -> RuleViolation&
        {
            option_index = i;
            return *this;
        }

        auto with_level(int l) -> RuleViolation&
        {
            level = l;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::WrongPhase_ContestRequired: return "Wrong phase (contest required)";
        case E::WrongPhase_BuzzerRequired: return "Wrong phase (buzzer required)";
        case E::WrongPhase_AnsweringRequired: return "Wrong phase (answering required)";
        case E::WrongPhase_QuestionRequired: return "Wrong phase (question required)";
        case E::NotSupportedByVariant: return "Action not part of this rule variant";

        // Buzzer-Race
        case E::Buzzer_AlreadyClaimed: return "Buzzer: already claimed";
        case E::Answer_NotBuzzerWinner: return "Answer: only the buzzer winner may answer";
        case E::Skip_NotBuzzerWinner: return "Skip: only the buzzer winner may skip";

        // Open-Answer
        case E::Answer_PlayerLocked: return "Answer: player locked out this round";

        case E::Option_IndexOutOfRange: return "Option: index out of range";

        // Session
        case E::Session_LevelOutOfRange: return "Session: level out of range";
        case E::Session_MenuRequired: return "Session: menu required";
        case E::Session_FinishedRequired: return "Session: finished screen required";
        case E::Session_AlreadyInMenu: return "Session: already in menu";
        }
        return "Unknown";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Menu: return "Menu";
        case Phase::Reading: return "Reading";
        case Phase::Buzzer: return "Buzzer";
        case Phase::BuzzerPause: return "BuzzerPause";
        case Phase::Answering: return "Answering";
        case Phase::Countdown: return "Countdown";
        case Phase::Question: return "Question";
        case Phase::Result: return "Result";
        case Phase::Finished: return "Finished";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", NumberOf(*v.actor));
        if (v.buzzer_winner) s += std::format(" | buzzer=P{}", NumberOf(*v.buzzer_winner));
        if (v.option_index) s += std::format(" | option={}", *v.option_index);
        if (v.level) s += std::format(" | level={}", *v.level);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //ROBOTRACE_EXCEPTION_HPP
