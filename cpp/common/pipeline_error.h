#pragma once

#include <stdexcept>
#include <string>

// Fatal error classes of the build pipeline. Malformed corpus records are
// not errors: loaders log and skip them.

// Conversion oracle broke its one-line-per-input contract (or failed to run).
class OracleContractError : public std::runtime_error {
public:
    explicit OracleContractError(const std::string& msg)
        : std::runtime_error("oracle contract violation: " + msg) {}
};

// Unifier/sharder produced something inconsistent. Always a bug.
class InvariantViolation : public std::runtime_error {
public:
    explicit InvariantViolation(const std::string& msg)
        : std::runtime_error("invariant violation: " + msg) {}
};

// Missing input, unwritable output, short read/write.
class IoFailure : public std::runtime_error {
public:
    IoFailure(const std::string& what, const std::string& path)
        : std::runtime_error(what + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
