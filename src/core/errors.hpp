// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace simgroup {

/// Two features that must share a shape (vector dimension, color count) do not
class DimensionMismatchError : public std::invalid_argument {
public:
    DimensionMismatchError(size_t expected, size_t actual)
        : std::invalid_argument("Dimension mismatch: expected " + std::to_string(expected) +
                                ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    size_t Expected() const { return expected_; }
    size_t Actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

/// A file produced a feature that disagrees with the store's invariant shape
class FeatureShapeError : public std::invalid_argument {
public:
    explicit FeatureShapeError(const std::string& what) : std::invalid_argument(what) {}
};

/// A checkpoint belongs to a different corpus snapshot
class CheckpointMismatchError : public std::runtime_error {
public:
    CheckpointMismatchError(uint64_t stored_hash, uint64_t current_hash)
        : std::runtime_error("Checkpoint file list hash " + std::to_string(stored_hash) +
                             " does not match current file list hash " +
                             std::to_string(current_hash)),
          stored_hash_(stored_hash), current_hash_(current_hash) {}

    uint64_t StoredHash() const { return stored_hash_; }
    uint64_t CurrentHash() const { return current_hash_; }

private:
    uint64_t stored_hash_;
    uint64_t current_hash_;
};

/// A persisted checkpoint blob could not be decoded
class CheckpointFormatError : public std::runtime_error {
public:
    explicit CheckpointFormatError(const std::string& what) : std::runtime_error(what) {}
};

/// Nothing to rank or group
class NoResultsError : public std::runtime_error {
public:
    explicit NoResultsError(const std::string& what) : std::runtime_error(what) {}
};

/// Malformed query (no terms, unresolvable term)
class QueryError : public std::invalid_argument {
public:
    explicit QueryError(const std::string& what) : std::invalid_argument(what) {}
};

/// Cooperative cancellation signal raised at scan boundaries.
/// Not a std::runtime_error: callers catch it separately and keep the
/// partial checkpoint.
class RunCancelled : public std::exception {
public:
    explicit RunCancelled(size_t position) : position_(position) {
        message_ = "Run cancelled at scan position " + std::to_string(position_);
    }

    const char* what() const noexcept override { return message_.c_str(); }

    /// First scan position that was not processed
    size_t Position() const { return position_; }

private:
    size_t position_;
    std::string message_;
};

} // namespace simgroup
