#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <type_traits>
#include <variant>

namespace robotrace::core::debug
{
auto to_string(PlayerAction const& a) -> std::string
{
    return std::visit(
        []<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, ClaimBuzzerAction>)
            {
                return std::format("Claim(P{})", NumberOf(act.player));
            }
            else if constexpr (std::is_same_v<T, SelectOptionAction>)
            {
                return std::format("Select(P{}, {})", NumberOf(act.player), act.index);
            }
            else if constexpr (std::is_same_v<T, SkipAction>)
            {
                return std::format("Skip(P{})", NumberOf(act.player));
            }
            else if constexpr (std::is_same_v<T, SelectLevelAction>)
            {
                return std::format("SelectLevel({})", static_cast<int>(act.level));
            }
            else if constexpr (std::is_same_v<T, CancelAction>)
            {
                return "Cancel";
            }
            else
            {
                return "Restart";
            }
        },
        a
    );
}

auto to_string(StepOutcome const o) -> std::string_view
{
    switch (o)
    {
        case StepOutcome::Ignored:       return "Ignored";
        case StepOutcome::Idle:          return "Idle";
        case StepOutcome::Applied:       return "Applied";
        case StepOutcome::RoundResolved: return "RoundResolved";
        case StepOutcome::RoundEnded:    return "RoundEnded";
    }
    return "?";
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Config const& cfg) -> void
{
    out_ << std::format("Seed={}\n", cfg.seed);
    out_ << std::format("Variant={}\n", cfg.variant == RuleVariant::BuzzerRace ? "buzzer" : "open");
    out_ << std::format("Timings reading={}ms buzzer={}ms answer={}ms question={}ms result={}ms\n",
                        cfg.reading_time.count(), cfg.buzzer_window.count(), cfg.answer_time.count(),
                        cfg.question_time.count(), cfg.result_pause.count());
    out_ << std::format("Increment={}\n", cfg.position_increment);
    out_.flush();
}

auto AuditLogger::input(PlayerAction const& a, StepOutcome const out) -> void
{
    out_ << std::format("Input: {} -> {}\n", to_string(a), to_string(out));
}

auto AuditLogger::events(std::span<SessionEvent const> evs) -> void
{
    for (SessionEvent const& e : evs)
    {
        out_ << std::format("Event: {}\n", describe(e));
    }
}

auto AuditLogger::end(SessionController const& session) -> void
{
    ScoreBoard const& board = session.Scores();
    out_ << std::format("Level={} Asked={}\n", static_cast<int>(session.Level()), session.QuestionsAsked());
    for (PlayerId const p : AllPlayers)
    {
        out_ << std::format("P{} score={} track={:.1f}\n", NumberOf(p), board.Of(p).score, board.Of(p).track_position);
    }

    std::optional<MatchResult> const& r = board.Result();
    if (!r) out_ << "Result=undecided\n";
    else if (!r->winner) out_ << "Result=draw\n";
    else out_ << std::format("Result=P{}\n", NumberOf(*r->winner));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace robotrace::core::debug
