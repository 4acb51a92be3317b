// cpp/dict/search_index.cpp
#include "search_index.h"

#include <fstream>
#include <iostream>

#include "fs_util.h"
#include "pipeline_error.h"

namespace {

constexpr std::uint64_t PROGRESS_EVERY = 100000;

const char* const CSV_HEADER = "word,language,definition,pronunciation,is_common";

std::string sql_insert_prefix() {
    return std::string("INSERT INTO ") + SEARCH_TABLE +
           " (word, language, definition, pronunciation, is_common) VALUES\n";
}

void flatten_chinese(const std::string& word, const ChineseEntry& e, std::vector<SearchIndexRow>& out) {
    // is_common is a JMdict notion; Chinese rows never carry it
    for (const auto& item : e.items) {
        for (const auto& def : item.definitions) {
            out.push_back({word, "chinese", def, item.pinyin, false});
        }
    }
}

void flatten_japanese(const std::string& word, const JapaneseEntry& e, std::vector<SearchIndexRow>& out) {
    const std::string pron = e.kana.empty() ? std::string() : e.kana.front().text;
    const bool common = e.has_common_spelling();
    for (const auto& sense : e.sense) {
        for (const auto& g : sense.gloss) {
            out.push_back({word, "japanese", g.text, pron, common});
        }
    }
}

} // namespace

// ==================== names ====================

const char* index_format_name(IndexFormat f) {
    return f == IndexFormat::Sql ? "sql" : "csv";
}

std::optional<IndexFormat> index_format_from_name(std::string_view s) {
    if (s == "csv") return IndexFormat::Csv;
    if (s == "sql") return IndexFormat::Sql;
    return std::nullopt;
}

const char* index_file_name(IndexFormat f) {
    return f == IndexFormat::Sql ? "search_index.sql" : "search_index.csv";
}

// ==================== rows ====================

std::vector<SearchIndexRow> flatten_entry(const UnifiedEntry& e) {
    std::vector<SearchIndexRow> rows;
    if (e.chinese_entry) flatten_chinese(e.word, *e.chinese_entry, rows);
    if (e.japanese_entry) flatten_japanese(e.word, *e.japanese_entry, rows);
    return rows;
}

std::string escape_csv_field(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 8);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string escape_sql_literal(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\0') continue;
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string format_csv_row(const SearchIndexRow& r) {
    std::string line;
    line += escape_csv_field(r.word);
    line += ',';
    line += escape_csv_field(r.language);
    line += ',';
    line += escape_csv_field(r.definition);
    line += ',';
    line += escape_csv_field(r.pronunciation);
    line += ',';
    line += r.is_common ? '1' : '0';
    return line;
}

std::string format_sql_values(const SearchIndexRow& r) {
    std::string v;
    v += '(';
    v += escape_sql_literal(r.word);
    v += ", ";
    v += escape_sql_literal(r.language);
    v += ", ";
    v += escape_sql_literal(r.definition);
    v += ", ";
    v += escape_sql_literal(r.pronunciation);
    v += ", ";
    v += r.is_common ? '1' : '0';
    v += ')';
    return v;
}

// ==================== writer ====================

SearchIndexReport write_search_index(
    const std::vector<UnifiedEntry>& entries,
    const std::string& path,
    IndexFormat format,
    std::size_t sql_batch_rows
) {
    if (sql_batch_rows == 0) sql_batch_rows = DEFAULT_SQL_BATCH_ROWS;

    const fs::path dst(path);
    const fs::path tmp = fs::path(path + ".tmp");

    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw IoFailure("cannot open for write", tmp.string());

    SearchIndexReport rep;
    std::size_t in_batch = 0;

    if (format == IndexFormat::Csv) {
        out << CSV_HEADER << '\n';
    }

    for (const auto& e : entries) {
        for (const auto& r : flatten_entry(e)) {
            if (format == IndexFormat::Csv) {
                out << format_csv_row(r) << '\n';
            } else {
                if (in_batch == 0) {
                    out << sql_insert_prefix();
                } else {
                    out << ",\n";
                }
                out << format_sql_values(r);
                if (++in_batch == sql_batch_rows) {
                    out << ";\n";
                    ++rep.statements;
                    in_batch = 0;
                }
            }

            ++rep.rows;
            if (r.language == "chinese") ++rep.chinese_rows;
            else ++rep.japanese_rows;

            if (rep.rows % PROGRESS_EVERY == 0) {
                std::cout << "[search_index] rows=" << rep.rows << "\n";
            }
        }
    }
    if (in_batch > 0) {
        out << ";\n";
        ++rep.statements;
    }

    out.flush();
    if (!out) throw IoFailure("write failed", tmp.string());
    rep.bytes = static_cast<std::uint64_t>(out.tellp());
    out.close();

    atomic_replace_file(tmp, dst);

    std::cout << "[search_index] " << index_format_name(format) << ": rows=" << rep.rows
              << " (chinese=" << rep.chinese_rows << ", japanese=" << rep.japanese_rows << ")"
              << " bytes=" << rep.bytes << " -> " << dst.string() << "\n";
    return rep;
}
