#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Japanese kanji spelling (word or single character) -> Traditional Chinese.
// Immutable value type: copies share one read-only map; merging builds a new
// mapping and never changes a value that is already present.
class CharacterMapping {
public:
    using Map = std::map<std::string, std::string, std::less<>>;

    CharacterMapping();
    explicit CharacterMapping(Map entries);

    // JSON object {"kanji": "traditional", ...}. Missing file -> IoFailure.
    // Non-string values and blank keys or values are logged and dropped.
    static CharacterMapping load_json(const std::string& path);

    // Sorted keys, atomic replace.
    void save_json(const std::string& path) const;

    const std::string* find(std::string_view kanji) const;

    // Mapped rendering, or the input itself when unmapped or mapped to a
    // blank string.
    std::string render(std::string_view kanji) const;

    // Additive merge: keys of *this keep their values, only absent keys of
    // `additions` are taken. `added` receives the number of new keys.
    CharacterMapping merged_with(const CharacterMapping& additions, std::size_t* added = nullptr) const;

    std::size_t size() const { return map_->size(); }
    bool empty() const { return map_->empty(); }
    const Map& entries() const { return *map_; }

    bool operator==(const CharacterMapping& other) const { return *map_ == *other.map_; }

private:
    std::shared_ptr<const Map> map_;
};

// Black-box script converter (OpenCC jp2t in production).
// Must return exactly one output line per input line, same order.
class ConversionOracle {
public:
    virtual ~ConversionOracle() = default;
    virtual std::vector<std::string> convert_batch(const std::vector<std::string>& inputs) = 0;
};

struct MappingBuildStats {
    std::size_t inputs_unique   = 0;
    std::size_t inputs_rejected = 0;   // contained a line break
    std::size_t conversions     = 0;   // entries that actually changed
};

// One oracle call for the whole de-duplicated, sorted input set; blank inputs
// are not sent and identity conversions are dropped. A line-count mismatch or
// a blank output line -> OracleContractError and no mapping is produced.
CharacterMapping build_mapping(
    const std::vector<std::string>& inputs,
    ConversionOracle& oracle,
    MappingBuildStats* stats = nullptr
);
