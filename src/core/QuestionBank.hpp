//
// Created by Malik T on 02/10/2025.
//

#ifndef ROBOTRACE_QUESTIONBANK_HPP
#define ROBOTRACE_QUESTIONBANK_HPP

#include <deque>
#include <expected>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "Types.hpp"

namespace robotrace::core
{
    struct CatalogProblem
    {
        std::string message;
        std::size_t rejected{};
    };

    // Built-in questions used when no usable source is available
    auto DefaultCatalog() -> std::vector<QuestionRecord>;

    class QuestionBank
    {
    public:
        explicit QuestionBank(std::uint64_t seed);

        // Replaces the catalog. Bad records are dropped with a warning; an
        // error is returned only when nothing usable remains.
        auto Load(std::span<QuestionRecord const> records) -> std::expected<std::size_t, CatalogProblem>;
        auto LoadOrDefault(std::span<QuestionRecord const> records) -> std::size_t;

        static auto Validate(QuestionRecord const& record) -> std::expected<Question, std::string>;

        // Fresh random draw order over every question of `level`
        auto StartSession(std::uint8_t level) -> std::size_t;
        auto DrawNext() -> std::optional<Question>;
        auto EndSession() noexcept -> void { queue_.clear(); }
        auto ShuffleOptions(Question const& question) -> OptionSet;

        auto Reseed(std::uint64_t seed) -> void;

        auto Remaining() const noexcept -> std::size_t { return queue_.size(); }
        auto CatalogSize() const noexcept -> std::size_t { return catalog_.size(); }
        auto CountForLevel(std::uint8_t level) const -> std::size_t;
        auto Catalog() const noexcept -> std::span<Question const> { return catalog_; }

    private:
        std::vector<Question> catalog_;
        std::deque<std::size_t> queue_; // indices into catalog_
        std::mt19937_64 rng_;
    };
}

#endif //ROBOTRACE_QUESTIONBANK_HPP
