#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dict_types.h"

struct SearchIndexRow {
    std::string word;
    std::string language;       // "chinese" | "japanese"
    std::string definition;
    std::string pronunciation;
    bool is_common = false;

    bool operator==(const SearchIndexRow&) const = default;
};

enum class IndexFormat {
    Csv,
    Sql,
};

const char* index_format_name(IndexFormat f);
std::optional<IndexFormat> index_format_from_name(std::string_view s);
const char* index_file_name(IndexFormat f);   // search_index.csv / .sql

constexpr const char* SEARCH_TABLE = "dictionary_search";
constexpr std::size_t DEFAULT_SQL_BATCH_ROWS = 500;

// Chinese: one row per (item, definition); Japanese: one row per (sense, gloss).
std::vector<SearchIndexRow> flatten_entry(const UnifiedEntry& e);

// Quoted only when the field holds ',', '"', CR or LF; quotes doubled.
std::string escape_csv_field(std::string_view field);

// Single-quoted SQL literal, quotes doubled, NUL bytes dropped.
std::string escape_sql_literal(std::string_view s);

std::string format_csv_row(const SearchIndexRow& r);
std::string format_sql_values(const SearchIndexRow& r);

struct SearchIndexReport {
    std::uint64_t rows          = 0;
    std::uint64_t chinese_rows  = 0;
    std::uint64_t japanese_rows = 0;
    std::uint64_t statements    = 0;   // sql only
    std::uint64_t bytes         = 0;
};

// Writes the whole index to "<path>.tmp" and renames it over `path`.
SearchIndexReport write_search_index(
    const std::vector<UnifiedEntry>& entries,
    const std::string& path,
    IndexFormat format,
    std::size_t sql_batch_rows = DEFAULT_SQL_BATCH_ROWS
);
