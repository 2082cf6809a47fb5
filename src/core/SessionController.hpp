//
// Created by Malik T on 04/10/2025.
//

#ifndef ROBOTRACE_SESSIONCONTROLLER_HPP
#define ROBOTRACE_SESSIONCONTROLLER_HPP

#include <memory>
#include <span>
#include <string>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "QuestionBank.hpp"
#include "ScoreBoard.hpp"
#include "RoundEngine.hpp"
#include "ActuatorPort.hpp"

namespace robotrace::core::debug {struct Inspector;}
namespace robotrace::core
{
    enum class SessionEventKind : std::uint8_t
    {
        LevelStarted,
        PhaseChanged,
        BuzzerClaimed,
        AttemptJudged,
        RoundResolved,
        MatchEnded,
        Cancelled,
        Restarted,
        ActuatorFailed
    };

    // Journal entry; only the fields meaningful for `kind` are set.
    struct SessionEvent
    {
        SessionEventKind kind{};
        Phase phase{Phase::Menu};
        std::size_t question_number{};
        std::optional<PlayerId> player{};
        std::optional<Attempt> attempt{};
        std::optional<ResolutionKind> resolution{};
        std::optional<MatchResult> match{};
        std::string detail{};
    };

    auto to_string(SessionEventKind k) -> std::string_view;
    auto to_string(Attempt a) -> std::string_view;
    auto to_string(ResolutionKind r) -> std::string_view;
    auto describe(SessionEvent const& e) -> std::string;

    struct TickReport
    {
        std::vector<StepOutcome> inputs{}; // one per input, arrival order
        StepOutcome timer{StepOutcome::Idle};
        std::size_t ignored{};
        bool match_ended{false};
    };

    // Owns one match from the level menu to the final screen. Inputs are
    // applied in arrival order before the phase timer is checked.
    class SessionController
    {
    public:
        SessionController() = delete;
        SessionController(Config const& config,
                          QuestionBank bank,
                          std::unique_ptr<RoundPolicy> policy,
                          std::unique_ptr<ActuatorPort> actuator);

        auto Tick(TimePoint now, std::span<PlayerAction const> inputs) -> TickReport;

        // Single input, contest or session action.
        auto Handle(PlayerAction const& action, TimePoint now) -> StepOutcome;

        auto StartLevel(std::uint8_t level, TimePoint now) -> StepOutcome;
        auto Cancel() -> StepOutcome;
        auto Restart() -> StepOutcome;

        auto SnapshotFor(TimePoint now) const -> std::shared_ptr<SessionSnapshot const>;
        auto TakeEvents() -> std::vector<SessionEvent>;

        auto PhaseNow() const noexcept          -> Phase { return engine_.PhaseNow(); }
        auto Level() const noexcept             -> std::uint8_t { return level_; }
        auto QuestionsAsked() const noexcept    -> std::size_t { return asked_; }
        auto QuestionsRemaining() const noexcept -> std::size_t { return bank_.Remaining(); }
        auto Scores() const noexcept            -> ScoreBoard const& { return board_; }
        auto Engine() const noexcept            -> RoundEngine const& { return engine_; }
        auto Bank() noexcept                    -> QuestionBank& { return bank_; }
        auto Cfg() const noexcept               -> Config const& { return cfg_; }
        auto LastViolation() const noexcept     -> std::optional<error::RuleViolation> const& { return last_violation_; }

        friend struct debug::Inspector;

    private:
        auto HandleContest(PlayerAction const& action, TimePoint now) -> StepOutcome;
        auto AfterStep(StepOutcome outcome, TimePoint now) -> StepOutcome;
        auto OnRoundResolved() -> void;
        auto NextRoundOrFinish(TimePoint now) -> void;
        auto EndMatch(MatchResult const& result) -> void;
        auto ResetMatch() -> void;
        auto Reject(error::RuleViolation v) -> StepOutcome;

        auto Emit(SessionEvent e) -> void;
        auto NotePhase() -> void;

        template <class F>
        auto GuardActuator(char const* what, F&& call) -> void;

    private:
        Config cfg_;
        QuestionBank bank_;
        RoundEngine engine_;
        ScoreBoard board_{};
        std::unique_ptr<ActuatorPort> actuator_;

        std::uint8_t level_{0};
        std::size_t asked_{0};
        bool celebrated_{false};
        Phase last_phase_{Phase::Menu};

        std::vector<SessionEvent> events_{};
        std::optional<error::RuleViolation> last_violation_{};
    };
}

#endif //ROBOTRACE_SESSIONCONTROLLER_HPP
