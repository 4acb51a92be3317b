// cpp/dict/sharder.cpp
#include "sharder.h"

#include <algorithm>
#include <iostream>
#include <system_error>

#include "fs_util.h"
#include "pipeline_error.h"
#include "text_common.h"
#include "worker_pool.h"

namespace {

struct SourceFile {
    fs::path path;
    Shard shard;
};

struct CopyTally {
    std::array<std::uint64_t, SHARD_COUNT> files{};
    std::array<std::uint64_t, SHARD_COUNT> bytes{};
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::uint64_t count_regular_files(const fs::path& dir) {
    std::uint64_t n = 0;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) ++n;
    }
    if (ec) throw IoFailure("cannot list directory", dir.string());
    return n;
}

} // namespace

// ==================== classification ====================

Shard shard_for_word(std::string_view word) {
    const std::size_t han = count_han_cps(word);
    if (han == 0) return Shard::NonHan;
    if (han == 1) return Shard::Han1Char;
    if (han == 2) return Shard::Han2Char;
    return Shard::Han3Plus;
}

const char* shard_name(Shard s) {
    switch (s) {
        case Shard::NonHan:   return "non-han";
        case Shard::Han1Char: return "han-1char";
        case Shard::Han2Char: return "han-2char";
        case Shard::Han3Plus: return "han-3plus";
    }
    return "non-han";
}

std::optional<Shard> shard_from_name(std::string_view name) {
    for (Shard s : ALL_SHARDS) {
        if (name == shard_name(s)) return s;
    }
    return std::nullopt;
}

std::uint64_t ShardCounts::total() const {
    std::uint64_t t = 0;
    for (std::uint64_t x : n) t += x;
    return t;
}

ShardCounts count_shards(const std::vector<UnifiedEntry>& entries) {
    ShardCounts c;
    for (const auto& e : entries) {
        ++c[shard_for_word(e.word)];
    }
    return c;
}

void verify_shard_counts(const ShardCounts& counts, std::uint64_t total) {
    if (counts.total() != total) {
        throw InvariantViolation("shard counts sum to " + std::to_string(counts.total()) +
                                 ", expected " + std::to_string(total));
    }
}

// ==================== physical separation ====================

ShardSeparationReport separate_shards(
    const std::string& artifact_dir,
    const std::string& out_root,
    const std::string& artifact_suffix,
    unsigned threads
) {
    const fs::path src_dir(artifact_dir);
    const fs::path dst_root(out_root);

    std::error_code ec;
    if (!fs::is_directory(src_dir, ec)) {
        throw IoFailure("artifact directory not found", src_dir.string());
    }

    // 1) classify sources (sorted for stable logs)
    std::vector<SourceFile> sources;
    std::uint64_t foreign = 0;
    for (fs::directory_iterator it(src_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string name = it->path().filename().string();
        if (!ends_with(name, artifact_suffix)) {
            ++foreign;
            continue;
        }
        const std::string word = name.substr(0, name.size() - artifact_suffix.size());
        sources.push_back({it->path(), shard_for_word(word)});
    }
    if (ec) throw IoFailure("cannot list directory", src_dir.string());
    std::sort(sources.begin(), sources.end(),
              [](const SourceFile& a, const SourceFile& b) { return a.path < b.path; });

    if (foreign > 0) {
        std::cerr << "[sharder] ignoring " << foreign << " files without suffix '"
                  << artifact_suffix << "' in " << src_dir.string() << "\n";
    }

    ShardSeparationReport report;
    report.source_files = sources.size();

    ShardCounts expected;
    for (const auto& s : sources) ++expected[s.shard];
    verify_shard_counts(expected, report.source_files);

    // 2) fresh shard dirs
    for (Shard s : ALL_SHARDS) {
        const fs::path d = dst_root / shard_name(s);
        fs::remove_all(d, ec);
        if (ec) throw IoFailure("cannot clear shard directory", d.string());
        fs::create_directories(d, ec);
        if (ec) throw IoFailure("cannot create shard directory", d.string());
    }

    // 3) copy in parallel
    const unsigned n_workers = choose_worker_count(threads, sources.size());
    std::vector<CopyTally> tallies(n_workers);

    run_chunked(sources.size(), n_workers, [&](unsigned t, std::size_t start, std::size_t end) {
        CopyTally& tally = tallies[t];
        for (std::size_t i = start; i < end; ++i) {
            const SourceFile& src = sources[i];
            const fs::path dst = dst_root / shard_name(src.shard) / src.path.filename();

            std::error_code cec;
            fs::copy_file(src.path, dst, fs::copy_options::overwrite_existing, cec);
            if (cec) throw IoFailure("cannot copy artifact (" + cec.message() + ")", dst.string());

            const std::uintmax_t sz = fs::file_size(dst, cec);
            if (cec) throw IoFailure("cannot stat copied artifact", dst.string());

            const std::size_t k = static_cast<std::size_t>(src.shard);
            ++tally.files[k];
            tally.bytes[k] += sz;
        }
    });

    for (const auto& t : tallies) {
        for (std::size_t k = 0; k < SHARD_COUNT; ++k) {
            report.files.n[k] += t.files[k];
            report.bytes[k] += t.bytes[k];
        }
    }

    // 4) verify on disk
    for (Shard s : ALL_SHARDS) {
        const fs::path d = dst_root / shard_name(s);
        const std::uint64_t on_disk = count_regular_files(d);
        if (on_disk != expected[s]) {
            throw InvariantViolation(std::string("shard ") + shard_name(s) + " has " +
                                     std::to_string(on_disk) + " files, expected " +
                                     std::to_string(expected[s]));
        }
    }
    const std::uint64_t left = count_regular_files(src_dir) - foreign;
    if (left != report.source_files) {
        throw InvariantViolation("source directory changed during separation: " +
                                 std::to_string(left) + " != " + std::to_string(report.source_files));
    }
    verify_shard_counts(report.files, report.source_files);

    return report;
}

void log_shard_report(const ShardSeparationReport& r) {
    std::cout << "[sharder] source files=" << r.source_files << "\n";
    for (Shard s : ALL_SHARDS) {
        const std::size_t k = static_cast<std::size_t>(s);
        std::cout << "[sharder]   " << shard_name(s) << ": files=" << r.files.n[k]
                  << " bytes=" << r.bytes[k] << "\n";
    }
}
