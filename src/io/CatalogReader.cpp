//
// Created by Malik T on 05/10/2025.
//

#include "CatalogReader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <optional>
#include <ranges>

#include "../core/Util.hpp"

namespace
{
    enum Column : std::size_t { Level = 0, Prompt, Correct, Distractor1, Distractor2, ColumnCount };

    struct ColumnNames
    {
        std::string_view english;
        std::string_view spanish;
    };

    constexpr std::array<ColumnNames, ColumnCount> kColumns{{
        {"level", "nivel"},
        {"prompt", "pregunta"},
        {"correct", "respuesta correcta"},
        {"distractor1", "r1"},
        {"distractor2", "r2"},
    }};

    auto Lower(std::string_view s) -> std::string
    {
        std::string out = robotrace::core::util::Trim(s);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    auto StripBom(std::string& s) -> void
    {
        if (s.starts_with("\xEF\xBB\xBF")) s.erase(0, 3);
    }

    // Walks one record, collecting fields when asked. Only a quote that starts a
    // field opens a quoted field; anywhere else it is a literal character.
    // Returns false while a quoted field is still open.
    auto Scan(std::string_view const line, std::vector<std::string>* fields) -> bool
    {
        std::string cur;
        bool quoted = false;
        bool at_start = true;

        for (std::size_t i = 0; i < line.size(); ++i)
        {
            char const c = line[i];
            if (quoted)
            {
                if (c != '"')
                {
                    cur += c;
                }
                else if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    cur += '"';
                    ++i;
                }
                else
                {
                    quoted = false;
                }
            }
            else if (c == '"' && at_start)
            {
                quoted = true;
                at_start = false;
            }
            else if (c == ',')
            {
                if (fields) fields->push_back(std::move(cur));
                cur.clear();
                at_start = true;
            }
            else
            {
                cur += c;
                at_start = false;
            }
        }

        if (quoted) return false;
        if (fields) fields->push_back(std::move(cur));
        return true;
    }

    auto ReadRecord(std::istream& in, std::string& record, std::size_t& line_no) -> bool
    {
        std::string line;
        if (!std::getline(in, line)) return false;
        ++line_no;
        record = std::move(line);

        // embedded newlines keep a quoted field open
        while (!Scan(record, nullptr))
        {
            if (!std::getline(in, line)) break;
            ++line_no;
            record += '\n';
            record += line;
        }
        if (!record.empty() && record.back() == '\r') record.pop_back();
        return true;
    }
}

namespace robotrace::io
{
    auto SplitCsvRecord(std::string_view const line) -> std::expected<std::vector<std::string>, std::string>
    {
        std::vector<std::string> fields;
        if (!Scan(line, &fields)) return std::unexpected(std::string{"unterminated quoted field"});
        return fields;
    }

    auto ParseCatalog(std::istream& in) -> std::expected<std::vector<core::QuestionRecord>, CatalogReadError>
    {
        std::size_t line_no = 0;
        std::string record;

        if (!ReadRecord(in, record, line_no))
            return std::unexpected(CatalogReadError{.message = "catalog is empty"});

        StripBom(record);
        auto header = SplitCsvRecord(record);
        if (!header)
            return std::unexpected(CatalogReadError{.message = header.error(), .line = line_no});

        // column index for each required field
        std::array<std::optional<std::size_t>, ColumnCount> index{};
        for (std::size_t i = 0; i < header->size(); ++i)
        {
            std::string const name = Lower((*header)[i]);
            for (std::size_t c = 0; c < ColumnCount; ++c)
            {
                if (name == kColumns[c].english || name == kColumns[c].spanish) index[c] = i;
            }
        }

        std::string missing;
        for (std::size_t c = 0; c < ColumnCount; ++c)
        {
            if (!index[c]) missing += std::format("{}{}", missing.empty() ? "" : ", ", kColumns[c].english);
        }
        if (!missing.empty())
            return std::unexpected(CatalogReadError{.message = std::format("missing columns: {}", missing), .line = 1});

        std::size_t needed = 0;
        for (auto const& i : index) needed = std::max(needed, *i + 1);

        std::vector<core::QuestionRecord> rows;
        while (ReadRecord(in, record, line_no))
        {
            if (core::util::Trim(record).empty()) continue;

            auto fields = SplitCsvRecord(record);
            if (!fields)
                return std::unexpected(CatalogReadError{.message = fields.error(), .line = line_no});

            // short rows keep their blanks; the bank rejects them with a reason
            fields->resize(std::max(fields->size(), needed));

            rows.push_back(core::QuestionRecord{
                .level = (*fields)[*index[Level]],
                .prompt = (*fields)[*index[Prompt]],
                .correct = (*fields)[*index[Correct]],
                .distractor1 = (*fields)[*index[Distractor1]],
                .distractor2 = (*fields)[*index[Distractor2]],
            });
        }
        return rows;
    }

    auto ReadCatalog(std::filesystem::path const& path)
        -> std::expected<std::vector<core::QuestionRecord>, CatalogReadError>
    {
        std::ifstream in(path);
        if (!in.is_open())
            return std::unexpected(CatalogReadError{.message = std::format("cannot open {}", path.string())});
        return ParseCatalog(in);
    }
}
