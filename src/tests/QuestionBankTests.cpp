#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "../core/QuestionBank.hpp"
#include "TestSupport.hpp"

using namespace robotrace::core;
using robotrace::test::LevelRecords;

TEST(QuestionBank, Validate_Rejects_Malformed_Records)
{
    EXPECT_FALSE(QuestionBank::Validate({"4", "q", "a", "b", "c"}).has_value());
    EXPECT_FALSE(QuestionBank::Validate({"x", "q", "a", "b", "c"}).has_value());
    EXPECT_FALSE(QuestionBank::Validate({"2.5", "q", "a", "b", "c"}).has_value());
    EXPECT_FALSE(QuestionBank::Validate({"1", "  ", "a", "b", "c"}).has_value());
    EXPECT_FALSE(QuestionBank::Validate({"1", "q", "", "b", "c"}).has_value());
    EXPECT_FALSE(QuestionBank::Validate({"1", "q", "a", "", "c"}).has_value());
    EXPECT_FALSE(QuestionBank::Validate({"1", "q", "a", "b", "a"}).has_value());
}

TEST(QuestionBank, Validate_Trims_And_Accepts_Spreadsheet_Levels)
{
    auto q = QuestionBank::Validate({"2.0", "  What?  ", " yes", "no ", "maybe"});
    ASSERT_TRUE(q.has_value()) << q.error();
    EXPECT_EQ(q->level, 2);
    EXPECT_EQ(q->prompt, "What?");
    EXPECT_EQ(q->correct, "yes");
    EXPECT_EQ(q->distractors[0], "no");
    EXPECT_EQ(q->distractors[1], "maybe");
}

TEST(QuestionBank, Load_Drops_Bad_Records_Keeps_Good)
{
    std::vector<QuestionRecord> recs = LevelRecords(1, 3);
    recs.push_back({"9", "bad level", "a", "b", "c"});
    recs.push_back({"1", "dup", "a", "a", "c"});

    QuestionBank bank(1);
    auto loaded = bank.Load(recs);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 3u);
    EXPECT_EQ(bank.CountForLevel(1), 3u);
}

TEST(QuestionBank, Load_Nothing_Usable_Is_An_Error)
{
    std::vector<QuestionRecord> recs{{"0", "q", "a", "b", "c"}, {"1", "", "a", "b", "c"}};
    QuestionBank bank(1);
    auto loaded = bank.Load(recs);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().rejected, 2u);
    EXPECT_EQ(bank.CatalogSize(), 0u);
}

TEST(QuestionBank, LoadOrDefault_Falls_Back_To_Builtin_Catalog)
{
    QuestionBank bank(1);
    std::size_t const n = bank.LoadOrDefault({});
    EXPECT_EQ(n, DefaultCatalog().size());
    EXPECT_EQ(bank.CountForLevel(1), 12u);
    EXPECT_EQ(bank.CountForLevel(2), 10u);
    EXPECT_EQ(bank.CountForLevel(3), 10u);
}

TEST(QuestionBank, Builtin_Catalog_Is_Valid)
{
    for (QuestionRecord const& r : DefaultCatalog())
    {
        auto q = QuestionBank::Validate(r);
        EXPECT_TRUE(q.has_value()) << r.prompt << ": " << (q ? "" : q.error());
    }
}

TEST(QuestionBank, Session_Draws_Each_Question_Of_The_Level_Once)
{
    std::vector<QuestionRecord> recs = LevelRecords(1, 5);
    std::vector<QuestionRecord> const l2 = LevelRecords(2, 4);
    recs.insert(recs.end(), l2.begin(), l2.end());

    QuestionBank bank(42);
    ASSERT_TRUE(bank.Load(recs).has_value());

    ASSERT_EQ(bank.StartSession(2), 4u);
    std::set<std::string> seen;
    while (auto q = bank.DrawNext())
    {
        EXPECT_EQ(q->level, 2);
        EXPECT_TRUE(seen.insert(q->prompt).second) << "repeated " << q->prompt;
    }
    EXPECT_EQ(seen.size(), 4u);
    EXPECT_EQ(bank.Remaining(), 0u);
    EXPECT_FALSE(bank.DrawNext().has_value());
}

TEST(QuestionBank, Level_Without_Questions_Starts_Empty)
{
    QuestionBank bank(3);
    ASSERT_TRUE(bank.Load(LevelRecords(1, 2)).has_value());
    EXPECT_EQ(bank.StartSession(3), 0u);
    EXPECT_FALSE(bank.DrawNext().has_value());
}

TEST(QuestionBank, Same_Seed_Same_Draw_And_Option_Order)
{
    auto const recs = LevelRecords(1, 8);
    QuestionBank a(1234);
    QuestionBank b(1234);
    ASSERT_TRUE(a.Load(recs).has_value());
    ASSERT_TRUE(b.Load(recs).has_value());

    a.StartSession(1);
    b.StartSession(1);
    for (int i = 0; i < 8; ++i)
    {
        auto qa = a.DrawNext();
        auto qb = b.DrawNext();
        ASSERT_TRUE(qa && qb);
        EXPECT_EQ(qa->prompt, qb->prompt);

        OptionSet const oa = a.ShuffleOptions(*qa);
        OptionSet const ob = b.ShuffleOptions(*qb);
        EXPECT_EQ(oa.options, ob.options);
        EXPECT_EQ(oa.correct_index, ob.correct_index);
    }
}

TEST(QuestionBank, ShuffleOptions_Keeps_Correct_Answer_Exactly_Once)
{
    QuestionBank bank(99);
    Question const q{.level = 1, .prompt = "p", .correct = "yes", .distractors = {"no", "maybe"}};

    std::set<std::size_t> slots;
    for (int i = 0; i < 60; ++i)
    {
        OptionSet const o = bank.ShuffleOptions(q);
        EXPECT_EQ(o.CorrectText(), "yes");
        EXPECT_EQ(std::ranges::count(o.options, std::string{"yes"}), 1);
        EXPECT_EQ(std::ranges::count(o.options, std::string{"no"}), 1);
        EXPECT_EQ(std::ranges::count(o.options, std::string{"maybe"}), 1);
        slots.insert(o.correct_index);
    }
    // 60 shuffles land the answer in every slot
    EXPECT_EQ(slots.size(), constants::OptionCount);
}
