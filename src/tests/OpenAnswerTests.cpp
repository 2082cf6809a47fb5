#include <gtest/gtest.h>
#include <memory>

#include "../core/RoundEngine.hpp"
#include "../core/Exception.hpp"
#include "TestSupport.hpp"

using namespace robotrace::core;
using namespace robotrace::test;
using RVC = robotrace::core::error::RuleViolationCode;

namespace
{
    auto MakeEngine() -> RoundEngine
    {
        RoundEngine e(FastConfig(RuleVariant::OpenAnswer), MakePolicy(RuleVariant::OpenAnswer));
        e.BeginRound(SampleQuestion(), SampleOptions(), 1, At(0));
        return e;
    }

    // Countdown is three one-second steps
    auto ToQuestion(RoundEngine& e) -> void
    {
        ASSERT_EQ(e.Tick(At(3000)), StepOutcome::Applied);
        ASSERT_EQ(e.PhaseNow(), Phase::Question);
    }
}

TEST(OpenAnswer, Countdown_Shows_Three_Two_One)
{
    RoundEngine e = MakeEngine();
    EXPECT_EQ(e.PhaseNow(), Phase::Countdown);
    EXPECT_EQ(e.CountdownValue(At(0)), 3);
    EXPECT_EQ(e.CountdownValue(At(999)), 3);
    EXPECT_EQ(e.CountdownValue(At(1000)), 2);
    EXPECT_EQ(e.CountdownValue(At(2500)), 1);
    EXPECT_EQ(e.Tick(At(2999)), StepOutcome::Idle);

    ToQuestion(e);
    EXPECT_EQ(e.CountdownValue(At(3000)), 0);
}

TEST(OpenAnswer, Wrong_Locks_Then_Other_Player_Wins)
{
    RoundEngine e = MakeEngine();
    ToQuestion(e);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleWrong}, At(3100)), StepOutcome::Applied);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::Locked);
    EXPECT_EQ(e.PhaseNow(), Phase::Question);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleCorrect}, At(3200)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::Answer_PlayerLocked);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P2, SampleCorrect}, At(3300)), StepOutcome::RoundResolved);
    EXPECT_EQ(e.Round()->round_winner, PlayerId::P2);
    EXPECT_EQ(e.Round()->resolution->kind, ResolutionKind::Correct);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::Locked);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P2)].attempt, Attempt::Correct);
}

TEST(OpenAnswer, Both_Wrong_Is_NobodyCorrect_With_Reveal)
{
    RoundEngine e = MakeEngine();
    ToQuestion(e);

    ASSERT_EQ(e.Handle(SelectOptionAction{PlayerId::P2, 2}, At(3100)), StepOutcome::Applied);
    ASSERT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleWrong}, At(3200)), StepOutcome::RoundResolved);

    EXPECT_EQ(e.PhaseNow(), Phase::Result);
    EXPECT_FALSE(e.Round()->round_winner.has_value());
    EXPECT_EQ(e.Round()->resolution->kind, ResolutionKind::NobodyCorrect);

    SessionSnapshot s{};
    e.FillSnapshot(s, At(3200));
    EXPECT_EQ(s.revealed_index, SampleCorrect);
    EXPECT_EQ(s.revealed_answer, "A");
}

TEST(OpenAnswer, First_Correct_Answer_Wins_Immediately)
{
    RoundEngine e = MakeEngine();
    ToQuestion(e);

    ASSERT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleCorrect}, At(3001)), StepOutcome::RoundResolved);
    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P2, SampleCorrect}, At(3001)), StepOutcome::Ignored);
    EXPECT_EQ(e.Round()->round_winner, PlayerId::P1);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P2)].attempt, Attempt::Unattempted);
}

TEST(OpenAnswer, Timeout_Marks_Silent_Players)
{
    RoundEngine e = MakeEngine();
    ToQuestion(e);
    ASSERT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleWrong}, At(4000)), StepOutcome::Applied);

    EXPECT_EQ(e.Tick(At(7999)), StepOutcome::Idle);
    EXPECT_EQ(e.Tick(At(8000)), StepOutcome::RoundResolved);
    EXPECT_EQ(e.Round()->resolution->kind, ResolutionKind::Timeout);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::Locked);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P2)].attempt, Attempt::TimedOut);
}

TEST(OpenAnswer, Buzzer_And_Skip_Are_Not_Part_Of_The_Variant)
{
    RoundEngine e = MakeEngine();
    ToQuestion(e);

    EXPECT_EQ(e.Handle(ClaimBuzzerAction{PlayerId::P1}, At(3100)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::NotSupportedByVariant);
    EXPECT_EQ(e.Handle(SkipAction{PlayerId::P2}, At(3100)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::NotSupportedByVariant);
}

TEST(OpenAnswer, Answers_During_Countdown_Are_Ignored)
{
    RoundEngine e = MakeEngine();
    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleCorrect}, At(500)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::WrongPhase_ContestRequired);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::Unattempted);
}

TEST(OpenAnswer, Out_Of_Range_Option_Does_Not_Lock)
{
    RoundEngine e = MakeEngine();
    ToQuestion(e);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, 7}, At(3100)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::Option_IndexOutOfRange);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::Unattempted);
}
