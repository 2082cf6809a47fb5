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
    auto MakeEngine(Config cfg = FastConfig(RuleVariant::BuzzerRace)) -> RoundEngine
    {
        RoundEngine e(cfg, MakePolicy(RuleVariant::BuzzerRace));
        e.BeginRound(SampleQuestion(), SampleOptions(), 1, At(0));
        return e;
    }

    // Reading over at 1000, P1 claims at 1100, answering opens at 1600
    auto ToAnswering(RoundEngine& e, PlayerId holder) -> void
    {
        ASSERT_EQ(e.Tick(At(1000)), StepOutcome::Applied);
        ASSERT_EQ(e.PhaseNow(), Phase::Buzzer);
        ASSERT_EQ(e.Handle(ClaimBuzzerAction{holder}, At(1100)), StepOutcome::Applied);
        ASSERT_EQ(e.PhaseNow(), Phase::BuzzerPause);
        ASSERT_EQ(e.Tick(At(1600)), StepOutcome::Applied);
        ASSERT_EQ(e.PhaseNow(), Phase::Answering);
    }
}

TEST(BuzzerRace, Correct_Answer_By_Buzzer_Winner)
{
    RoundEngine e = MakeEngine();
    EXPECT_EQ(e.PhaseNow(), Phase::Reading);
    EXPECT_EQ(e.Tick(At(999)), StepOutcome::Idle);

    ToAnswering(e, PlayerId::P1);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleCorrect}, At(2000)), StepOutcome::RoundResolved);
    EXPECT_EQ(e.PhaseNow(), Phase::Result);

    RoundContext const* r = e.Round();
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->round_winner, PlayerId::P1);
    ASSERT_TRUE(r->resolution.has_value());
    EXPECT_EQ(r->resolution->kind, ResolutionKind::Correct);
    EXPECT_EQ(r->players[IndexOf(PlayerId::P1)].attempt, Attempt::Correct);
    EXPECT_EQ(r->players[IndexOf(PlayerId::P2)].attempt, Attempt::Unattempted);

    EXPECT_EQ(e.Tick(At(2999)), StepOutcome::Idle);
    EXPECT_EQ(e.Tick(At(3000)), StepOutcome::RoundEnded);
}

TEST(BuzzerRace, Wrong_Answer_Ends_Round_Without_Winner)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P2);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P2, SampleWrong}, At(1700)), StepOutcome::RoundResolved);
    EXPECT_FALSE(e.Round()->round_winner.has_value());
    EXPECT_EQ(e.Round()->resolution->kind, ResolutionKind::Incorrect);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P2)].attempt, Attempt::Incorrect);
}

TEST(BuzzerRace, Skip_Resolves_As_Skipped)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P1);

    EXPECT_EQ(e.Handle(SkipAction{PlayerId::P1}, At(1700)), StepOutcome::RoundResolved);
    EXPECT_EQ(e.Round()->resolution->kind, ResolutionKind::Skipped);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::Skipped);
    EXPECT_FALSE(e.Round()->round_winner.has_value());
}

TEST(BuzzerRace, Answer_Timeout_Marks_Holder_TimedOut)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P1);

    EXPECT_EQ(e.Tick(At(3599)), StepOutcome::Idle);
    EXPECT_EQ(e.Tick(At(3600)), StepOutcome::RoundResolved);
    EXPECT_EQ(e.Round()->resolution->kind, ResolutionKind::Timeout);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::TimedOut);
}

TEST(BuzzerRace, Open_Buzzer_Waits_Forever_By_Default)
{
    RoundEngine e = MakeEngine();
    ASSERT_EQ(e.Tick(At(1000)), StepOutcome::Applied);
    EXPECT_EQ(e.Tick(At(10'000'000)), StepOutcome::Idle);
    EXPECT_EQ(e.PhaseNow(), Phase::Buzzer);
    EXPECT_FALSE(e.TimeRemaining(At(5000)).has_value());
}

TEST(BuzzerRace, Limited_Buzzer_Window_Times_Out)
{
    Config cfg = FastConfig(RuleVariant::BuzzerRace);
    cfg.buzzer_window = Millis(3000);
    RoundEngine e = MakeEngine(cfg);

    ASSERT_EQ(e.Tick(At(1000)), StepOutcome::Applied);
    EXPECT_EQ(e.Tick(At(3999)), StepOutcome::Idle);
    EXPECT_EQ(e.Tick(At(4000)), StepOutcome::RoundResolved);
    EXPECT_EQ(e.Round()->resolution->kind, ResolutionKind::Timeout);
    EXPECT_FALSE(e.Round()->buzzer_winner.has_value());
}

TEST(BuzzerRace, Early_Press_During_Reading_Is_Ignored)
{
    RoundEngine e = MakeEngine();
    EXPECT_EQ(e.Handle(ClaimBuzzerAction{PlayerId::P1}, At(10)), StepOutcome::Ignored);
    ASSERT_TRUE(e.LastViolation().has_value());
    EXPECT_EQ(e.LastViolation()->code, RVC::WrongPhase_ContestRequired);
    EXPECT_EQ(e.PhaseNow(), Phase::Reading);
    EXPECT_FALSE(e.Round()->buzzer_winner.has_value());
}

TEST(BuzzerRace, Second_Claim_Does_Not_Steal_The_Buzzer)
{
    RoundEngine e = MakeEngine();
    ASSERT_EQ(e.Tick(At(1000)), StepOutcome::Applied);
    ASSERT_EQ(e.Handle(ClaimBuzzerAction{PlayerId::P2}, At(1001)), StepOutcome::Applied);

    EXPECT_EQ(e.Handle(ClaimBuzzerAction{PlayerId::P1}, At(1001)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::Buzzer_AlreadyClaimed);
    EXPECT_EQ(e.Round()->buzzer_winner, PlayerId::P2);
}

TEST(BuzzerRace, Other_Player_Cannot_Answer_Or_Skip)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P1);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P2, SampleCorrect}, At(1700)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::Answer_NotBuzzerWinner);

    EXPECT_EQ(e.Handle(SkipAction{PlayerId::P2}, At(1700)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::Skip_NotBuzzerWinner);

    EXPECT_EQ(e.PhaseNow(), Phase::Answering);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P2)].attempt, Attempt::Unattempted);
    EXPECT_FALSE(e.Round()->resolution.has_value());
}

TEST(BuzzerRace, Answer_Before_Answering_Phase_Is_Ignored)
{
    RoundEngine e = MakeEngine();
    ASSERT_EQ(e.Tick(At(1000)), StepOutcome::Applied);
    ASSERT_EQ(e.Handle(ClaimBuzzerAction{PlayerId::P1}, At(1100)), StepOutcome::Applied);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleCorrect}, At(1200)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::WrongPhase_AnsweringRequired);
    EXPECT_EQ(e.PhaseNow(), Phase::BuzzerPause);
}

TEST(BuzzerRace, Out_Of_Range_Option_Is_Ignored)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P1);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, 3}, At(1700)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::Option_IndexOutOfRange);
    EXPECT_EQ(e.Round()->players[IndexOf(PlayerId::P1)].attempt, Attempt::Unattempted);
}

TEST(BuzzerRace, Nothing_Counts_After_Resolution)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P1);
    ASSERT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleWrong}, At(1700)), StepOutcome::RoundResolved);

    EXPECT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleCorrect}, At(1701)), StepOutcome::Ignored);
    EXPECT_EQ(e.LastViolation()->code, RVC::WrongPhase_ContestRequired);
    EXPECT_FALSE(e.Round()->round_winner.has_value());
}

TEST(BuzzerRace, Timer_Fires_Once)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P1);
    ASSERT_EQ(e.Handle(SkipAction{PlayerId::P1}, At(1700)), StepOutcome::RoundResolved);

    EXPECT_EQ(e.Tick(At(2700)), StepOutcome::RoundEnded);
    EXPECT_EQ(e.Tick(At(2701)), StepOutcome::Idle);
    EXPECT_EQ(e.Tick(At(9000)), StepOutcome::Idle);
}

TEST(BuzzerRace, Session_Action_Is_Engine_Misuse)
{
    RoundEngine e = MakeEngine();
    EXPECT_THROW((void)e.Handle(SelectLevelAction{1}, At(0)), error::StateError);
}

TEST(BuzzerRace, Snapshot_Hides_Answer_Until_Resolved)
{
    RoundEngine e = MakeEngine();
    ToAnswering(e, PlayerId::P1);

    SessionSnapshot before{};
    e.FillSnapshot(before, At(1700));
    EXPECT_TRUE(before.has_question);
    EXPECT_EQ(before.buzzer_winner, PlayerId::P1);
    EXPECT_FALSE(before.revealed_index.has_value());
    EXPECT_FALSE(before.revealed_answer.has_value());
    ASSERT_TRUE(before.time_remaining.has_value());
    EXPECT_EQ(*before.time_remaining, Millis(1900));

    ASSERT_EQ(e.Handle(SelectOptionAction{PlayerId::P1, SampleWrong}, At(1800)), StepOutcome::RoundResolved);
    SessionSnapshot after{};
    e.FillSnapshot(after, At(1800));
    EXPECT_EQ(after.revealed_index, SampleCorrect);
    EXPECT_EQ(after.revealed_answer, "A");
    EXPECT_EQ(after.resolution, ResolutionKind::Incorrect);
}
