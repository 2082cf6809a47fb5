//
// Created by Malik T on 06/10/2025.
//

#ifndef ROBOTRACE_TESTSUPPORT_HPP
#define ROBOTRACE_TESTSUPPORT_HPP

#include <chrono>
#include <format>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/QuestionBank.hpp"

namespace robotrace::test
{
    using namespace robotrace::core;

    // Fixed origin so every test reads in plain milliseconds
    inline TimePoint const T0 = TimePoint{} + std::chrono::hours(1);

    inline auto At(long long const ms) -> TimePoint
    {
        return T0 + Millis(ms);
    }

    // Short timings, deterministic seed
    inline auto FastConfig(RuleVariant const v) -> Config
    {
        return Config{
            .variant = v,
            .seed = 7,
            .reading_time = Millis(1000),
            .buzzer_window = Millis::zero(),
            .buzzer_pause = Millis(500),
            .answer_time = Millis(2000),
            .countdown_step = Millis(1000),
            .question_time = Millis(5000),
            .result_pause = Millis(1000),
            .position_increment = 20
        };
    }

    inline auto LevelRecords(std::uint8_t const level, std::size_t const n) -> std::vector<QuestionRecord>
    {
        std::vector<QuestionRecord> out;
        for (std::size_t i = 0; i < n; ++i)
        {
            out.push_back(QuestionRecord{
                .level = std::format("{}", level),
                .prompt = std::format("L{} question {}", level, i),
                .correct = std::format("right {}", i),
                .distractor1 = std::format("wrong a {}", i),
                .distractor2 = std::format("wrong b {}", i)
            });
        }
        return out;
    }

    inline auto BankWith(std::vector<QuestionRecord> const& records, std::uint64_t const seed = 7) -> QuestionBank
    {
        QuestionBank bank(seed);
        (void)bank.Load(records);
        return bank;
    }

    // "A" is correct and sits in slot 1
    inline auto SampleQuestion() -> Question
    {
        return Question{.level = 1, .prompt = "Pick A", .correct = "A", .distractors = {"B", "C"}};
    }

    inline auto SampleOptions() -> OptionSet
    {
        return OptionSet{.options = {"B", "A", "C"}, .correct_index = 1};
    }

    inline constexpr std::size_t SampleCorrect = 1;
    inline constexpr std::size_t SampleWrong = 0;
}

#endif //ROBOTRACE_TESTSUPPORT_HPP
