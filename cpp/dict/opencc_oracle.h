#pragma once

#include <string>
#include <vector>

#include "script_mapper.h"

// Runs `<binary> -c <config>` once per batch: newline-joined inputs on stdin,
// one converted line per input on stdout. Spawn failure, non-zero exit or
// death by signal -> OracleContractError. Line counting is left to
// build_mapping().
class OpenccProcessOracle : public ConversionOracle {
public:
    explicit OpenccProcessOracle(std::string binary = "opencc", std::string config = "jp2t");

    std::vector<std::string> convert_batch(const std::vector<std::string>& inputs) override;

    const std::string& binary() const { return binary_; }
    const std::string& config() const { return config_; }

private:
    std::string binary_;
    std::string config_;
};

// Splits child output into lines: one trailing terminator dropped, '\r' stripped.
std::vector<std::string> split_output_lines(const std::string& out);
