//
// Created by Malik T on 03/10/2025.
//

#ifndef ROBOTRACE_SCOREBOARD_HPP
#define ROBOTRACE_SCOREBOARD_HPP

#include <array>
#include <optional>

#include "Types.hpp"

namespace robotrace::core
{
    struct PlayerMatchState
    {
        int score{0};
        double track_position{0.0};
    };

    enum class MatchEndReason : std::uint8_t
    {
        TrackCompleted,
        BankExhausted
    };

    struct MatchResult
    {
        // empty means a draw
        std::optional<PlayerId> winner{};
        MatchEndReason reason{MatchEndReason::BankExhausted};
    };

    class ScoreBoard
    {
    public:
        ScoreBoard() = default;

        // Returns the match result when this point carried the player over the finish line.
        auto ApplyCorrect(PlayerId player, int increment) -> std::optional<MatchResult>;
        auto FinalizeOnBankExhausted() -> MatchResult;
        auto Reset() noexcept -> void;

        auto Of(PlayerId p) const noexcept -> PlayerMatchState const& { return players_[IndexOf(p)]; }
        auto Result() const noexcept -> std::optional<MatchResult> const& { return result_; }
        auto Decided() const noexcept -> bool { return result_.has_value(); }

    private:
        std::array<PlayerMatchState, constants::PlayerCount> players_{};
        std::optional<MatchResult> result_{};
    };
}

#endif //ROBOTRACE_SCOREBOARD_HPP
