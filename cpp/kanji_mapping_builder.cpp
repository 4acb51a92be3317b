// cpp/kanji_mapping_builder.cpp
// Builds (or extends) the Japanese kanji -> Traditional Chinese mapping used
// as the cross-script match key.
//
// Usage:
//   kanji_mapping_builder words <jmdict.json|.jsonl> <mapping.json>
//   kanji_mapping_builder chars <kanjidic2.json>     <mapping.json>
//
// words: every kanji spelling of the JMdict words
// chars: every character literal of a KANJIDIC2-style {"characters":[...]}
//
// All inputs go to the converter in one batch. Results are merged into the
// existing mapping file (existing keys keep their value) and written with an
// atomic replace. On any error the mapping file is left untouched.
//
// Env knobs:
//   KIOKUN_THREADS        (int)  parse workers
//   KIOKUN_OPENCC_BIN     (str)  converter binary (default "opencc")
//   KIOKUN_OPENCC_CONFIG  (str)  converter config (default "jp2t")
//
// Exit codes: 0 ok, 1 usage, 2 I/O or other runtime error,
//             3 converter contract violation, 4 invariant violation.

#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "corpus_loader.h"
#include "fs_util.h"
#include "opencc_oracle.h"
#include "pipeline_config.h"
#include "pipeline_error.h"
#include "script_mapper.h"

namespace {

void usage() {
    std::cerr << "Usage: kanji_mapping_builder words <jmdict.json> <mapping.json>\n"
              << "       kanji_mapping_builder chars <kanjidic2.json> <mapping.json>\n";
}

int run(const std::string& mode, const std::string& source, const std::string& mapping_path) {
    PipelineConfig cfg;
    apply_env_overrides(cfg);
    clamp_config(cfg);

    // 1) inputs
    std::vector<std::string> inputs;
    if (mode == "words") {
        const JapaneseCorpus ja = load_japanese_corpus(source, cfg.threads);
        inputs = collect_kanji_spellings(ja);
    } else {
        inputs = load_kanjidic_literals(source);
    }
    std::cout << "[kanji_mapping_builder] " << mode << ": inputs=" << inputs.size() << "\n";

    // 2) existing mapping (optional)
    CharacterMapping existing;
    std::error_code ec;
    if (fs::exists(mapping_path, ec)) {
        existing = CharacterMapping::load_json(mapping_path);
        std::cout << "[kanji_mapping_builder] existing mapping entries=" << existing.size() << "\n";
    }

    // 3) one converter batch
    OpenccProcessOracle oracle(cfg.opencc_bin, cfg.opencc_config);
    MappingBuildStats st;
    const CharacterMapping built = build_mapping(inputs, oracle, &st);
    std::cout << "[kanji_mapping_builder] unique=" << st.inputs_unique
              << " conversions=" << st.conversions
              << " rejected=" << st.inputs_rejected << "\n";

    // 4) additive merge + atomic save
    std::size_t added = 0;
    const CharacterMapping merged = existing.merged_with(built, &added);
    merged.save_json(mapping_path);

    std::cout << "[kanji_mapping_builder] added=" << added
              << " kept=" << (built.size() - added)
              << " total=" << merged.size()
              << " -> " << mapping_path << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        usage();
        return 1;
    }

    const std::string mode = argv[1];
    if (mode != "words" && mode != "chars") {
        usage();
        return 1;
    }

    std::ios::sync_with_stdio(false);

    try {
        return run(mode, argv[2], argv[3]);
    } catch (const OracleContractError& e) {
        std::cerr << "[kanji_mapping_builder] ERROR: " << e.what() << " (mapping unchanged)\n";
        return 3;
    } catch (const InvariantViolation& e) {
        std::cerr << "[kanji_mapping_builder] ERROR: " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[kanji_mapping_builder] ERROR: " << e.what() << "\n";
        return 2;
    }
}
