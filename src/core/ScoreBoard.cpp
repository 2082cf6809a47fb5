//
// Created by Malik T on 03/10/2025.
//

#include "ScoreBoard.hpp"

#include <algorithm>

#include "Exception.hpp"

namespace robotrace::core
{
    auto ScoreBoard::ApplyCorrect(PlayerId const player, int const increment) -> std::optional<MatchResult>
    {
        RR_ASSERT(!result_.has_value(), "Point awarded after the match was decided");
        RR_ASSERT(increment >= 0, "Negative track increment");

        PlayerMatchState& st = players_[IndexOf(player)];
        st.track_position = std::min(constants::FinishLine, st.track_position + static_cast<double>(increment));
        st.score += 1;

        if (st.track_position >= constants::FinishLine)
        {
            result_ = MatchResult{.winner = player, .reason = MatchEndReason::TrackCompleted};
        }
        return result_;
    }

    auto ScoreBoard::FinalizeOnBankExhausted() -> MatchResult
    {
        if (result_) return *result_;

        int const s1 = players_[IndexOf(PlayerId::P1)].score;
        int const s2 = players_[IndexOf(PlayerId::P2)].score;

        MatchResult r{.winner = std::nullopt, .reason = MatchEndReason::BankExhausted};
        if (s1 > s2) r.winner = PlayerId::P1;
        else if (s2 > s1) r.winner = PlayerId::P2;

        result_ = r;
        return r;
    }

    auto ScoreBoard::Reset() noexcept -> void
    {
        players_ = {};
        result_.reset();
    }
}
