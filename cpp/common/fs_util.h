#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Durability: fsync file + parent dir around rename (Linux only).
void atomic_replace_file(const fs::path& tmp, const fs::path& dst, bool durable = true);

// Writes to "<dst>.tmp" then renames over dst. Throws IoFailure.
void write_file_atomic(const fs::path& dst, std::string_view bytes, bool durable = true);

// Plain write (truncate). Throws IoFailure.
void write_file_bytes(const fs::path& path, std::string_view bytes);

// Whole file into memory. Throws IoFailure.
std::string read_file_bytes(const fs::path& path);

// Every line, blank ones included, so lines[i] is file line i + 1.
// '\r' stripped. Throws IoFailure.
std::vector<std::string> read_lines(const fs::path& path);

// Completion marker of an output directory.
constexpr const char* COMPLETE_MARKER = "_COMPLETE";

void clear_complete_marker(const fs::path& out_dir);
void write_complete_marker(const fs::path& out_dir, std::string_view body);
bool has_complete_marker(const fs::path& out_dir);
