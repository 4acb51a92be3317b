// cpp/dict/artifact_store.cpp
#include "artifact_store.h"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <zlib.h>

#include "fs_util.h"
#include "pipeline_error.h"
#include "worker_pool.h"

using json = nlohmann::json;

namespace {

constexpr std::size_t NAME_MAX_BYTES = 255;
constexpr std::size_t INFLATE_CHUNK  = 1 << 16;
constexpr std::uint64_t SKIP_LOG_LIMIT = 20;

struct WorkerTally {
    ArtifactReport report;
    std::vector<std::string> skipped_words;
};

const std::string& record_key(const UnifiedEntry& e) { return e.word; }
const std::string& record_key(const UnifiedCharacter& c) { return c.character; }

} // namespace

// ==================== canonical JSON ====================

std::string serialize_entry(const UnifiedEntry& e) {
    // nlohmann objects are std::map backed: sorted keys, stable bytes
    json j = e;
    return j.dump();
}

UnifiedEntry parse_artifact(std::string_view json_text) {
    json j = json::parse(json_text.begin(), json_text.end());
    return j.get<UnifiedEntry>();
}

std::string serialize_character(const UnifiedCharacter& c) {
    json j = c;
    return j.dump();
}

UnifiedCharacter parse_character_artifact(std::string_view json_text) {
    json j = json::parse(json_text.begin(), json_text.end());
    return j.get<UnifiedCharacter>();
}

namespace {

std::string serialize_record(const UnifiedEntry& e) { return serialize_entry(e); }
std::string serialize_record(const UnifiedCharacter& c) { return serialize_character(c); }

void parse_record(std::string_view text, UnifiedEntry& out) { out = parse_artifact(text); }
void parse_record(std::string_view text, UnifiedCharacter& out) { out = parse_character_artifact(text); }

} // namespace

// ==================== raw deflate ====================

std::string deflate_raw(std::string_view in, int level) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    int ret = deflateInit2(&zs, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw std::runtime_error("deflateInit2 failed: " + std::to_string(ret));
    }

    std::string out;
    out.resize(deflateBound(&zs, static_cast<uLong>(in.size())));

    zs.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in  = static_cast<uInt>(in.size());
    zs.next_out  = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    ret = deflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed: " + std::to_string(ret));
    }
    out.resize(produced);
    return out;
}

std::string inflate_raw(std::string_view in) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    int ret = inflateInit2(&zs, -MAX_WBITS);
    if (ret != Z_OK) {
        throw std::runtime_error("inflateInit2 failed: " + std::to_string(ret));
    }

    zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    std::string out;
    unsigned char buf[INFLATE_CHUNK];
    do {
        zs.next_out  = buf;
        zs.avail_out = INFLATE_CHUNK;

        ret = inflate(&zs, Z_NO_FLUSH);
        switch (ret) {
            case Z_NEED_DICT:
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
            case Z_STREAM_ERROR:
                inflateEnd(&zs);
                throw std::runtime_error("inflate failed: " + std::to_string(ret));
        }
        const std::size_t have = INFLATE_CHUNK - zs.avail_out;
        out.append(reinterpret_cast<const char*>(buf), have);

        // input exhausted without stream end: truncated data
        if (ret == Z_BUF_ERROR || (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0)) {
            inflateEnd(&zs);
            throw std::runtime_error("inflate: truncated stream");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return out;
}

// ==================== file naming ====================

std::optional<std::string> artifact_filename(std::string_view word) {
    if (word.empty() || word == "." || word == "..") return std::nullopt;
    if (word.find('/') != std::string_view::npos) return std::nullopt;
    if (word.find('\0') != std::string_view::npos) return std::nullopt;

    std::string name(word);
    name += ARTIFACT_SUFFIX;
    if (name.size() > NAME_MAX_BYTES) return std::nullopt;
    return name;
}

// ==================== bulk write ====================

namespace {

template <class Record>
ArtifactReport write_records(
    const std::vector<Record>& entries,
    const std::string& dir,
    unsigned threads,
    int level
) {
    const fs::path out_dir(dir);
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) throw IoFailure("cannot create artifact directory", out_dir.string());

    const unsigned n_workers = choose_worker_count(threads, entries.size());
    std::vector<WorkerTally> tallies(n_workers);

    run_chunked(entries.size(), n_workers, [&](unsigned t, std::size_t start, std::size_t end) {
        WorkerTally& tally = tallies[t];
        for (std::size_t i = start; i < end; ++i) {
            const Record& e = entries[i];
            const std::optional<std::string> name = artifact_filename(record_key(e));
            if (!name) {
                ++tally.report.skipped;
                tally.skipped_words.push_back(record_key(e));
                continue;
            }

            const std::string text = serialize_record(e);
            const std::string packed = deflate_raw(text, level);
            write_file_bytes(out_dir / *name, packed);

            ++tally.report.written;
            tally.report.bytes_raw += text.size();
            tally.report.bytes_compressed += packed.size();
        }
    });

    ArtifactReport total;
    std::uint64_t logged = 0;
    for (const auto& t : tallies) {
        total.written          += t.report.written;
        total.skipped          += t.report.skipped;
        total.bytes_raw        += t.report.bytes_raw;
        total.bytes_compressed += t.report.bytes_compressed;

        for (const auto& w : t.skipped_words) {
            if (logged < SKIP_LOG_LIMIT) {
                std::cerr << "[artifact_store] skip unaddressable key '" << w << "'\n";
            }
            ++logged;
        }
    }
    if (logged > SKIP_LOG_LIMIT) {
        std::cerr << "[artifact_store] ... " << (logged - SKIP_LOG_LIMIT) << " more skipped\n";
    }
    return total;
}

} // namespace

ArtifactReport write_artifacts(
    const std::vector<UnifiedEntry>& entries,
    const std::string& dir,
    unsigned threads,
    int level
) {
    return write_records(entries, dir, threads, level);
}

ArtifactReport write_character_artifacts(
    const std::vector<UnifiedCharacter>& chars,
    const std::string& dir,
    unsigned threads,
    int level
) {
    return write_records(chars, dir, threads, level);
}

std::string read_artifact_json(const std::string& dir, std::string_view word) {
    const std::optional<std::string> name = artifact_filename(word);
    if (!name) {
        throw IoFailure("word cannot name an artifact", std::string(word));
    }
    const fs::path p = fs::path(dir) / *name;
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        throw IoFailure("artifact not found", p.string());
    }
    return inflate_raw(read_file_bytes(p));
}

// ==================== verification ====================

namespace {

template <class Record>
std::size_t verify_records(
    const std::string& dir,
    const std::vector<Record>& entries,
    std::size_t samples
) {
    if (entries.empty() || samples == 0) return 0;
    if (samples > entries.size()) samples = entries.size();

    std::size_t checked = 0;
    std::size_t last = entries.size();   // no index yet
    for (std::size_t k = 0; k < samples; ++k) {
        const std::size_t idx = (k * entries.size()) / samples;
        if (idx == last) continue;
        last = idx;

        const Record& want = entries[idx];
        const std::string& key = record_key(want);
        if (!artifact_filename(key)) continue;

        Record got;
        try {
            parse_record(read_artifact_json(dir, key), got);
        } catch (const json::exception& e) {
            throw InvariantViolation("artifact for '" + key + "' does not parse: " + e.what());
        } catch (const IoFailure&) {
            throw;
        } catch (const std::runtime_error& e) {
            throw InvariantViolation("artifact for '" + key + "' does not inflate: " + e.what());
        }

        if (!(got == want)) {
            throw InvariantViolation("artifact for '" + key + "' differs from its entry");
        }
        ++checked;
    }
    return checked;
}

} // namespace

std::size_t verify_roundtrip_sample(
    const std::string& dir,
    const std::vector<UnifiedEntry>& entries,
    std::size_t samples
) {
    return verify_records(dir, entries, samples);
}

std::size_t verify_character_sample(
    const std::string& dir,
    const std::vector<UnifiedCharacter>& chars,
    std::size_t samples
) {
    return verify_records(dir, chars, samples);
}
