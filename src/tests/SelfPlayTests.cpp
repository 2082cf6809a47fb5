#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <print>
#include <vector>

#include "../core/SessionController.hpp"
#include "../core/RandomContestant.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingActuator.hpp"
#include "TestSupport.hpp"

using namespace robotrace::core;
using robotrace::test::At;
using robotrace::test::FastConfig;

namespace
{
    auto make_session(RuleVariant const v, std::uint64_t const seed, debug::RecordingActuator*& robot) -> SessionController
    {
        Config cfg = FastConfig(v);
        cfg.seed = seed;

        QuestionBank bank(seed);
        bank.LoadOrDefault({});

        auto [port, rec] = debug::MakeRecording();
        robot = rec;
        return SessionController(cfg, std::move(bank), MakePolicy(v), std::move(port));
    }

    auto variant_name(RuleVariant const v) -> char const*
    {
        return v == RuleVariant::BuzzerRace ? "buzzer" : "open";
    }
} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (RuleVariant const variant : {RuleVariant::BuzzerRace, RuleVariant::OpenAnswer})
        {
            for (std::uint64_t seed : {111ull, 222ull, 333ull})
            {
                debug::RecordingActuator* robot{};
                SessionController session = make_session(variant, seed, robot);

                auto const path = fs::path(std::format("_artifacts/match_{}_{}.log", variant_name(variant), seed));
                debug::AuditLogger log(path.string());
                ASSERT_TRUE(log.is_open());
                log.start(session.Cfg());

                std::vector<RandomContestant> bots{
                    RandomContestant(PlayerId::P1, seed + 1, 0.3),
                    RandomContestant(PlayerId::P2, seed + 2, 0.3)
                };

                std::uint8_t const level = static_cast<std::uint8_t>(1 + seed % 3);
                ASSERT_EQ(session.StartLevel(level, At(0)), StepOutcome::Applied);

                bool ended = false;
                // 20 ms frames; a whole level fits easily in ten simulated minutes
                for (long long t = 20; t < 600'000 && !ended; t += 20)
                {
                    auto const snap = session.SnapshotFor(At(t));

                    std::vector<PlayerAction> inputs;
                    for (RandomContestant& bot : bots)
                    {
                        if (auto act = bot.Play(*snap)) inputs.push_back(*act);
                    }

                    TickReport const report = session.Tick(At(t), inputs);
                    debug::CheckInvariants(session);

                    for (std::size_t i = 0; i < inputs.size(); ++i) log.input(inputs[i], report.inputs[i]);
                    log.events(session.TakeEvents());

                    ended = report.match_ended;
                }

                ASSERT_TRUE(ended) << "match did not finish, seed " << seed;
                EXPECT_EQ(session.PhaseNow(), Phase::Finished);
                log.end(session);
                log.flush();

                ASSERT_TRUE(session.Scores().Result().has_value());
                std::size_t const expected_celebrations = session.Scores().Result()->winner ? 1u : 0u;
                EXPECT_EQ(robot->CountOf(debug::ActuatorCall::Kind::Celebrate), expected_celebrations);

                int const points = session.Scores().Of(PlayerId::P1).score + session.Scores().Of(PlayerId::P2).score;
                EXPECT_EQ(robot->CountOf(debug::ActuatorCall::Kind::Advance), static_cast<std::size_t>(points));

                ASSERT_TRUE(fs::exists(path));
                ASSERT_GT(fs::file_size(path), 0u);
            }
        }
    }
    catch (robotrace::core::OmegaException<robotrace::core::error::Code> const& e)
    {
        std::print("{}", e);
        FAIL() << e.what();
    }
}

TEST(SelfPlay, Same_Seed_Same_Match)
{
    auto play = [](std::uint64_t const seed)
    {
        debug::RecordingActuator* robot{};
        SessionController session = make_session(RuleVariant::BuzzerRace, seed, robot);
        RandomContestant a(PlayerId::P1, seed + 1);
        RandomContestant b(PlayerId::P2, seed + 2);

        (void)session.StartLevel(2, At(0));
        for (long long t = 20; t < 600'000 && session.PhaseNow() != Phase::Finished; t += 20)
        {
            auto const snap = session.SnapshotFor(At(t));
            std::vector<PlayerAction> inputs;
            if (auto act = a.Play(*snap)) inputs.push_back(*act);
            if (auto act = b.Play(*snap)) inputs.push_back(*act);
            (void)session.Tick(At(t), inputs);
        }
        return robot->Calls();
    };

    EXPECT_EQ(play(777), play(777));
}
