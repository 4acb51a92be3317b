// cpp/artifact_inspect.cpp
// Prints one artifact (word or merged character) as indented JSON.
//
// Usage:
//   artifact_inspect <artifact_dir> <word>
//   artifact_inspect --file <path/to/word.json>

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "artifact_store.h"
#include "fs_util.h"

using json = nlohmann::json;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: artifact_inspect <artifact_dir> <word>\n"
                  << "       artifact_inspect --file <artifact>\n";
        return 1;
    }

    const std::string a1 = argv[1];
    const std::string a2 = argv[2];

    try {
        std::string text;
        if (a1 == "--file") {
            text = inflate_raw(read_file_bytes(a2));
        } else {
            text = read_artifact_json(a1, a2);
        }

        const json j = json::parse(text);
        std::cout << j.dump(2) << "\n";

        // merged characters carry "character", words carry "word"
        if (j.contains("character")) {
            const UnifiedCharacter c = j.get<UnifiedCharacter>();
            std::cerr << "[artifact_inspect] character=" << c.character
                      << " codepoint=" << c.codepoint
                      << " match=" << character_match_name(c.match)
                      << " inflated_bytes=" << text.size() << "\n";
        } else {
            const UnifiedEntry e = j.get<UnifiedEntry>();
            std::cerr << "[artifact_inspect] word=" << e.word
                      << " chinese=" << (e.chinese_entry ? 1 : 0)
                      << " japanese=" << (e.japanese_entry ? 1 : 0)
                      << " unified=" << (e.metadata.is_unified ? 1 : 0)
                      << " inflated_bytes=" << text.size() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[artifact_inspect] ERROR: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
