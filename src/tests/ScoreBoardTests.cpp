#include <gtest/gtest.h>

#include "../core/ScoreBoard.hpp"
#include "../core/Exception.hpp"

using namespace robotrace::core;

TEST(ScoreBoard, Exactly_One_Hundred_Completes_The_Track)
{
    ScoreBoard b;
    for (int i = 0; i < 4; ++i)
    {
        EXPECT_FALSE(b.ApplyCorrect(PlayerId::P2, 25).has_value());
    }
    EXPECT_DOUBLE_EQ(b.Of(PlayerId::P2).track_position, 75.0);

    auto r = b.ApplyCorrect(PlayerId::P2, 25);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->winner, PlayerId::P2);
    EXPECT_EQ(r->reason, MatchEndReason::TrackCompleted);
    EXPECT_DOUBLE_EQ(b.Of(PlayerId::P2).track_position, 100.0);
    EXPECT_EQ(b.Of(PlayerId::P2).score, 5);
    EXPECT_TRUE(b.Decided());
}

TEST(ScoreBoard, Position_Is_Clamped_At_The_Finish_Line)
{
    ScoreBoard b;
    (void)b.ApplyCorrect(PlayerId::P1, 30);
    (void)b.ApplyCorrect(PlayerId::P1, 30);
    (void)b.ApplyCorrect(PlayerId::P1, 30);
    auto r = b.ApplyCorrect(PlayerId::P1, 30);

    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(b.Of(PlayerId::P1).track_position, 100.0);
    EXPECT_EQ(b.Of(PlayerId::P1).score, 4);
    EXPECT_EQ(b.Of(PlayerId::P2).score, 0);
}

TEST(ScoreBoard, Bank_Exhausted_Higher_Score_Wins)
{
    ScoreBoard b;
    (void)b.ApplyCorrect(PlayerId::P1, 20);
    (void)b.ApplyCorrect(PlayerId::P2, 20);
    (void)b.ApplyCorrect(PlayerId::P2, 20);

    MatchResult const r = b.FinalizeOnBankExhausted();
    EXPECT_EQ(r.winner, PlayerId::P2);
    EXPECT_EQ(r.reason, MatchEndReason::BankExhausted);
}

TEST(ScoreBoard, Bank_Exhausted_Equal_Scores_Is_A_Draw)
{
    ScoreBoard b;
    (void)b.ApplyCorrect(PlayerId::P1, 20);
    (void)b.ApplyCorrect(PlayerId::P2, 20);

    MatchResult const r = b.FinalizeOnBankExhausted();
    EXPECT_FALSE(r.winner.has_value());

    ScoreBoard empty;
    EXPECT_FALSE(empty.FinalizeOnBankExhausted().winner.has_value());
}

TEST(ScoreBoard, Finalize_Keeps_An_Earlier_Track_Result)
{
    ScoreBoard b;
    (void)b.ApplyCorrect(PlayerId::P1, 100);
    MatchResult const r = b.FinalizeOnBankExhausted();
    EXPECT_EQ(r.winner, PlayerId::P1);
    EXPECT_EQ(r.reason, MatchEndReason::TrackCompleted);
}

TEST(ScoreBoard, No_Points_After_The_Match_Is_Decided)
{
    ScoreBoard b;
    (void)b.ApplyCorrect(PlayerId::P1, 100);
    EXPECT_THROW((void)b.ApplyCorrect(PlayerId::P2, 20), error::AssertionError);
}

TEST(ScoreBoard, Reset_Clears_Everything)
{
    ScoreBoard b;
    (void)b.ApplyCorrect(PlayerId::P1, 100);
    b.Reset();
    EXPECT_FALSE(b.Decided());
    EXPECT_EQ(b.Of(PlayerId::P1).score, 0);
    EXPECT_DOUBLE_EQ(b.Of(PlayerId::P1).track_position, 0.0);
}
