//
// Created by Malik T on 19/08/2025.
//

#ifndef ROBOTRACE_INVARIANTS_HPP
#define ROBOTRACE_INVARIANTS_HPP

#include <algorithm>
#include <cmath>
#include <ranges>

#include "../core/Exception.hpp"
#include "../core/SessionController.hpp"
#include "Inspector.hpp"

namespace robotrace::core::debug
{
    // Second layer of checks run after every tick in self-play. Throws an
    // AssertionError on the first broken rule.
    inline auto CheckInvariants(SessionController const& session) -> void
    {
#if RR_ENABLE_TEST_HOOKS == false
        (void)session;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(session);
        Epoch const epoch = EpochOf(s.phase);

        // 1) Menu holds nothing; every round phase has a round
        if (s.phase == Phase::Menu)
        {
            RR_ASSERT(!s.round.has_value(), "Round alive in Menu");
            RR_ASSERT(!s.result.has_value(), "Match result survives in Menu");
            RR_ASSERT(s.asked == 0 && s.level == 0, "Match counters survive in Menu");
        }
        if (epoch == Epoch::LeadIn || epoch == Epoch::Contest || epoch == Epoch::Resolution)
        {
            RR_ASSERT(s.round.has_value(), "Round phase without a round");
        }

        // 2) Phases belong to the running variant
        bool const buzzer_phase = s.phase == Phase::Reading || s.phase == Phase::Buzzer ||
                                  s.phase == Phase::BuzzerPause || s.phase == Phase::Answering;
        bool const open_phase = s.phase == Phase::Countdown || s.phase == Phase::Question;
        if (s.variant == RuleVariant::BuzzerRace) RR_ASSERT(!open_phase, "Open-answer phase in a buzzer race");
        if (s.variant == RuleVariant::OpenAnswer) RR_ASSERT(!buzzer_phase, "Buzzer phase in an open-answer round");

        if (s.round)
        {
            RoundContext const& r = *s.round;

            // 3) Options carry the correct answer exactly once, at the recorded slot
            RR_ASSERT(r.options.CorrectText() == r.question.correct, "Correct slot does not hold the answer");
            RR_ASSERT(std::ranges::count(r.options.options, r.question.correct) == 1,
                      "Correct answer shown more than once");

            // 4) Resolution is present exactly from Result on
            if (s.phase == Phase::Result)
                RR_ASSERT(r.resolution.has_value(), "Result without a resolution");
            if (epoch == Epoch::LeadIn || epoch == Epoch::Contest)
                RR_ASSERT(!r.resolution.has_value(), "Resolution before the contest ended");

            // 5) A round winner answered correctly; nobody else did
            auto const correct = std::ranges::count_if(r.players, [](PlayerRoundState const& p)
            {
                return p.attempt == Attempt::Correct;
            });
            RR_ASSERT(correct <= 1, "Two correct answers in one round");
            if (r.round_winner)
            {
                RR_ASSERT(r.resolution && r.resolution->kind == ResolutionKind::Correct,
                          "Round winner without a correct resolution");
                RR_ASSERT(r.players[IndexOf(*r.round_winner)].attempt == Attempt::Correct,
                          "Round winner did not answer correctly");
            }
            else
            {
                RR_ASSERT(correct == 0, "Correct answer without a round winner");
            }

            // 6) Variant specific round state
            if (s.variant == RuleVariant::BuzzerRace)
            {
                if (s.phase == Phase::Reading || s.phase == Phase::Buzzer)
                    RR_ASSERT(!r.buzzer_winner.has_value(), "Buzzer claimed before the buzzer opened");
                if (s.phase == Phase::BuzzerPause || s.phase == Phase::Answering)
                    RR_ASSERT(r.buzzer_winner.has_value(), "Answering without a buzzer winner");

                for (PlayerId const p : AllPlayers)
                {
                    Attempt const a = r.players[IndexOf(p)].attempt;
                    if (a != Attempt::Unattempted)
                        RR_ASSERT(r.buzzer_winner == p, "Non buzzer winner has an attempt");
                    RR_ASSERT(a != Attempt::Locked, "Lock-out in a buzzer race");
                }
            }
            else
            {
                RR_ASSERT(!r.buzzer_winner.has_value(), "Buzzer winner in an open-answer round");
                for (PlayerRoundState const& p : r.players)
                {
                    RR_ASSERT(p.attempt != Attempt::Skipped && p.attempt != Attempt::Incorrect,
                              "Open-answer attempt outside {Locked, Correct, TimedOut}");
                }
                if (r.resolution && r.resolution->kind == ResolutionKind::NobodyCorrect)
                {
                    RR_ASSERT(std::ranges::all_of(r.players, &PlayerRoundState::IsLocked),
                              "NobodyCorrect while a player was still free");
                }
            }
        }

        // 7) Track positions follow from scores and never pass the finish line
        int total_score = 0;
        for (PlayerMatchState const& p : s.players)
        {
            RR_ASSERT(p.score >= 0, "Negative score");
            RR_ASSERT(p.track_position >= 0.0 && p.track_position <= constants::FinishLine,
                      "Track position outside the track");
            double const expect = std::min(constants::FinishLine, static_cast<double>(p.score * s.increment));
            RR_ASSERT(std::abs(p.track_position - expect) < 1e-9, "Track position out of step with score");
            total_score += p.score;
        }
        RR_ASSERT(static_cast<std::size_t>(total_score) <= s.asked, "More points than questions asked");

        // 8) A decided match sits on the final screen; only a winner is celebrated
        if (s.result) RR_ASSERT(s.phase == Phase::Finished, "Match decided but not finished");
        if (s.phase == Phase::Finished) RR_ASSERT(s.result.has_value(), "Finished without a match result");
        if (s.celebrated) RR_ASSERT(s.result && s.result->winner, "Celebrated a draw");
        if (s.result && s.result->reason == MatchEndReason::BankExhausted && s.phase == Phase::Finished)
            RR_ASSERT(s.remaining == 0, "Bank exhausted with questions left");

#endif // RR_ENABLE_TEST_HOOKS == true
    }
}
#endif //ROBOTRACE_INVARIANTS_HPP
