//
// Created by Malik T on 05/10/2025.
//

#ifndef ROBOTRACE_CATALOGREADER_HPP
#define ROBOTRACE_CATALOGREADER_HPP

#include <expected>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "../core/Types.hpp"

namespace robotrace::io
{
    struct CatalogReadError
    {
        std::string message;
        std::size_t line{}; // 0 when not tied to a line
    };

    // RFC 4180 style: commas, double-quoted fields, "" inside quotes. A quote
    // inside an unquoted field is kept as text. Fails on an unterminated quote.
    auto SplitCsvRecord(std::string_view line) -> std::expected<std::vector<std::string>, std::string>;

    // Header row required. Columns are matched by name in any order:
    // Level,Prompt,Correct,Distractor1,Distractor2 (the Nivel,Pregunta,
    // Respuesta Correcta,R1,R2 spreadsheet headers are accepted too).
    // Rows are returned unvalidated; the question bank decides what is usable.
    auto ParseCatalog(std::istream& in) -> std::expected<std::vector<core::QuestionRecord>, CatalogReadError>;

    auto ReadCatalog(std::filesystem::path const& path)
        -> std::expected<std::vector<core::QuestionRecord>, CatalogReadError>;
}

#endif //ROBOTRACE_CATALOGREADER_HPP
