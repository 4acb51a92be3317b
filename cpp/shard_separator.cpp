// cpp/shard_separator.cpp
// Copies an artifact directory into per-shard directories and verifies the
// copies. Sources are never moved or deleted.
//
// Usage:
//   shard_separator <artifact_dir> <out_root>
//
// Output:
//   <out_root>/{non-han,han-1char,han-2char,han-3plus}/<word>.json
//
// Env knobs:
//   KIOKUN_THREADS  (int)  copy workers

#include <iostream>
#include <string>

#include "artifact_store.h"
#include "env_util.h"
#include "pipeline_error.h"
#include "sharder.h"

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: shard_separator <artifact_dir> <out_root>\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);

    const std::string artifact_dir = argv[1];
    const std::string out_root     = argv[2];

    int threads_env = env_int("KIOKUN_THREADS", 0);
    const unsigned threads = threads_env > 0 ? static_cast<unsigned>(threads_env) : 0u;

    try {
        const ShardSeparationReport rep = separate_shards(artifact_dir, out_root, ARTIFACT_SUFFIX, threads);
        log_shard_report(rep);
        std::cout << "[shard_separator] verified " << rep.files.total() << " copies, sources intact\n";
    } catch (const InvariantViolation& e) {
        std::cerr << "[shard_separator] ERROR: " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[shard_separator] ERROR: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
