//
// Created by Malik T on 02/10/2025.
//

#include "QuestionBank.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <format>
#include <numeric>
#include <print>
#include <ranges>

#include "Exception.hpp"
#include "Util.hpp"

namespace robotrace::core
{
    QuestionBank::QuestionBank(std::uint64_t const seed) :
        rng_{seed}
    {
    }

    auto QuestionBank::Validate(QuestionRecord const& record) -> std::expected<Question, std::string>
    {
        std::optional<std::uint8_t> const level = util::ParseLevel(record.level);
        if (!level)
            return std::unexpected(std::format("level '{}' is not 1, 2 or 3", record.level));

        Question q{
            .level = *level,
            .prompt = util::Trim(record.prompt),
            .correct = util::Trim(record.correct),
            .distractors = {util::Trim(record.distractor1), util::Trim(record.distractor2)}
        };

        if (q.prompt.empty()) return std::unexpected(std::string{"empty prompt"});
        if (q.correct.empty()) return std::unexpected(std::string{"empty correct answer"});
        if (q.distractors[0].empty() || q.distractors[1].empty())
            return std::unexpected(std::string{"empty distractor"});

        // exactly one option may match the correct answer
        if (q.distractors[0] == q.correct || q.distractors[1] == q.correct)
            return std::unexpected(std::string{"distractor repeats the correct answer"});

        return q;
    }

    auto QuestionBank::Load(std::span<QuestionRecord const> records) -> std::expected<std::size_t, CatalogProblem>
    {
        std::vector<Question> accepted;
        accepted.reserve(records.size());
        std::size_t rejected = 0;

        for (std::size_t i{}; i < records.size(); ++i)
        {
            auto q = Validate(records[i]);
            if (!q.has_value())
            {
                std::print(stderr, "[catalog] dropping record {}: {}\n", i + 1, q.error());
                ++rejected;
                continue;
            }
            accepted.push_back(std::move(*q));
        }

        if (accepted.empty())
        {
            return std::unexpected(CatalogProblem{
                .message = std::format("no usable questions among {} record(s)", records.size()),
                .rejected = rejected});
        }

        catalog_ = std::move(accepted);
        queue_.clear();
        return catalog_.size();
    }

    auto QuestionBank::LoadOrDefault(std::span<QuestionRecord const> records) -> std::size_t
    {
        if (auto const loaded = Load(records); loaded.has_value())
        {
            std::print("[catalog] loaded {} question(s)\n", *loaded);
            for (std::uint8_t lvl = constants::MinLevel; lvl <= constants::MaxLevel; ++lvl)
            {
                std::print("[catalog]   level {}: {}\n", lvl, CountForLevel(lvl));
            }
            return *loaded;
        }
        else
        {
            std::print(stderr, "[catalog] {}; using built-in questions\n", loaded.error().message);
        }

        std::vector<QuestionRecord> const defaults = DefaultCatalog();
        auto const fallback = Load(defaults);
        if (!fallback.has_value())
            RR_THROW(error::Code::Catalog, "Built-in catalog failed validation");
        std::print("[catalog] loaded {} built-in question(s)\n", *fallback);
        return *fallback;
    }

    auto QuestionBank::StartSession(std::uint8_t const level) -> std::size_t
    {
        std::vector<std::size_t> order;
        for (std::size_t i{}; i < catalog_.size(); ++i)
        {
            if (catalog_[i].level == level) order.push_back(i);
        }
        std::ranges::shuffle(order, rng_);

        queue_.assign(order.begin(), order.end());
        return queue_.size();
    }

    auto QuestionBank::DrawNext() -> std::optional<Question>
    {
        if (queue_.empty()) return std::nullopt;

        std::size_t const idx = queue_.front();
        queue_.pop_front();
        return catalog_[idx];
    }

    auto QuestionBank::ShuffleOptions(Question const& question) -> OptionSet
    {
        // slot 0 is the correct answer before shuffling
        std::array<std::size_t, constants::OptionCount> slots{};
        std::iota(slots.begin(), slots.end(), std::size_t{0});
        std::ranges::shuffle(slots, rng_);

        OptionSet out{};
        for (std::size_t pos{}; pos < slots.size(); ++pos)
        {
            std::size_t const src = slots[pos];
            out.options[pos] = (src == 0) ? question.correct : question.distractors[src - 1];
            if (src == 0) out.correct_index = pos;
        }
        return out;
    }

    auto QuestionBank::Reseed(std::uint64_t const seed) -> void
    {
        rng_.seed(seed);
    }

    auto QuestionBank::CountForLevel(std::uint8_t const level) const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(catalog_,
            [level](Question const& q) { return q.level == level; }));
    }
}
