// cpp/dict/script_mapper.cpp
#include "script_mapper.h"

#include <algorithm>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "fs_util.h"
#include "pipeline_error.h"
#include "text_common.h"

using json = nlohmann::json;

// ==================== CharacterMapping ====================

CharacterMapping::CharacterMapping()
    : map_(std::make_shared<const Map>()) {}

CharacterMapping::CharacterMapping(Map entries)
    : map_(std::make_shared<const Map>(std::move(entries))) {}

CharacterMapping CharacterMapping::load_json(const std::string& path) {
    const std::string text = read_file_bytes(path);

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw IoFailure(std::string("cannot parse mapping JSON (") + e.what() + ")", path);
    }
    if (!j.is_object()) {
        throw IoFailure("mapping JSON is not an object", path);
    }

    Map m;
    std::size_t ignored = 0;
    std::size_t blank = 0;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            ++ignored;
            continue;
        }
        std::string value = it.value().get<std::string>();
        if (normalize_match_key(it.key()).empty() || normalize_match_key(value).empty()) {
            ++blank;
            continue;
        }
        m.emplace(it.key(), std::move(value));
    }
    if (ignored > 0) {
        std::cerr << "[script_mapper] " << path << ": ignored " << ignored << " non-string values\n";
    }
    if (blank > 0) {
        std::cerr << "[script_mapper] " << path << ": ignored " << blank << " blank keys or values\n";
    }
    return CharacterMapping(std::move(m));
}

void CharacterMapping::save_json(const std::string& path) const {
    // nlohmann::json objects are std::map backed: keys come out sorted
    json j = json::object();
    for (const auto& [k, v] : *map_) {
        j[k] = v;
    }
    write_file_atomic(path, j.dump(2) + "\n");
}

const std::string* CharacterMapping::find(std::string_view kanji) const {
    auto it = map_->find(kanji);
    if (it == map_->end()) return nullptr;
    return &it->second;
}

std::string CharacterMapping::render(std::string_view kanji) const {
    const std::string* t = find(kanji);
    if (t && !normalize_match_key(*t).empty()) return *t;
    return std::string(kanji);
}

CharacterMapping CharacterMapping::merged_with(const CharacterMapping& additions, std::size_t* added) const {
    Map merged = *map_;
    std::size_t n_added = 0;
    for (const auto& [k, v] : *additions.map_) {
        if (merged.emplace(k, v).second) ++n_added;
    }
    if (added) *added = n_added;
    return CharacterMapping(std::move(merged));
}

// ==================== batch build ====================

CharacterMapping build_mapping(
    const std::vector<std::string>& inputs,
    ConversionOracle& oracle,
    MappingBuildStats* stats
) {
    MappingBuildStats st;

    std::vector<std::string> batch;
    batch.reserve(inputs.size());
    for (const auto& s : inputs) {
        if (normalize_match_key(s).empty()) continue;
        if (s.find('\n') != std::string::npos || s.find('\r') != std::string::npos) {
            ++st.inputs_rejected;
            continue;
        }
        batch.push_back(s);
    }
    std::sort(batch.begin(), batch.end());
    batch.erase(std::unique(batch.begin(), batch.end()), batch.end());
    st.inputs_unique = batch.size();

    if (st.inputs_rejected > 0) {
        std::cerr << "[script_mapper] skipped " << st.inputs_rejected
                  << " inputs containing line breaks\n";
    }

    CharacterMapping::Map m;
    if (!batch.empty()) {
        std::vector<std::string> converted = oracle.convert_batch(batch);
        if (converted.size() != batch.size()) {
            throw OracleContractError("expected " + std::to_string(batch.size()) +
                                      " lines, got " + std::to_string(converted.size()));
        }

        for (std::size_t i = 0; i < batch.size(); ++i) {
            if (normalize_match_key(converted[i]).empty()) {
                throw OracleContractError("blank output line " + std::to_string(i + 1) +
                                          " for input '" + batch[i] + "'");
            }
            if (converted[i] != batch[i]) {
                m.emplace(batch[i], std::move(converted[i]));
            }
        }
    }
    st.conversions = m.size();

    if (stats) *stats = st;
    return CharacterMapping(std::move(m));
}
