// File: src/storage/feature_store.hpp
#pragma once

#include "core/feature_value.hpp"
#include "storage/blob_store.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace simgroup {

/// Feature extraction callable supplied by the caller.
/// May throw or return std::nullopt for files it cannot handle.
using FeatureExtractor = std::function<std::optional<FeatureValue>(const std::string&)>;

/// FeatureStore: persisted mapping from file path to its extracted feature
///
/// The map is loaded from a BlobStore at run start and written back at run
/// end only when something changed (or an overwrite was requested). A file's
/// feature is extracted at most once unless invalidated.
///
/// All stored features share one kind and, for dense vectors and color
/// arrays, one dimension. A value that disagrees is a data-integrity problem
/// and raises FeatureShapeError; a file that fails extraction is only skipped.
class FeatureStore {
public:
    struct Config {
        /// Blob key under which the map persists (see MakeCacheKey)
        std::string cache_key;

        /// Required feature kind; unset means the first stored value decides
        std::optional<FeatureKind> expected_kind;

        /// Required dimension; 0 means the first stored value decides
        size_t expected_dimension{0};

        /// Ignore any persisted map and rewrite it on Save
        bool overwrite{false};

        bool verbose{false};
    };

    FeatureStore(std::shared_ptr<BlobStore> blob_store, const Config& config);

    FeatureStore(const FeatureStore&) = delete;
    FeatureStore& operator=(const FeatureStore&) = delete;

    /// Load the persisted map. Starts empty on overwrite, absence or a
    /// blob that cannot be decoded.
    /// @return true if entries were loaded
    bool Load();

    /// Return the cached feature or extract, validate and cache it
    /// @return std::nullopt if extraction failed (file is skipped)
    /// @throws FeatureShapeError if the extracted value has the wrong shape
    std::optional<FeatureValue> GetOrCompute(const std::string& path,
                                             const FeatureExtractor& extractor);

    /// Cached feature without extraction
    std::optional<FeatureValue> Get(const std::string& path) const;

    /// Insert or replace a feature
    /// @throws FeatureShapeError if the value has the wrong shape
    void Put(const std::string& path, const FeatureValue& value);

    bool Contains(const std::string& path) const;

    /// Drop one cached feature so the next GetOrCompute re-extracts it
    /// @return true if the path was cached
    bool Invalidate(const std::string& path);

    /// Drop every cached feature
    void Clear();

    /// Persist the map if dirty or an overwrite was requested
    /// @return true if a blob was written
    bool Save();

    size_t Size() const { return features_.size(); }
    bool IsDirty() const { return dirty_; }

    /// Established shape, 0 until the first dense/color value is stored
    size_t Dimension() const { return dimension_; }

    /// Cached paths, sorted
    std::vector<std::string> Paths() const;

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<BlobStore> blob_store_;
    Config config_;

    std::unordered_map<std::string, FeatureValue> features_;
    std::optional<FeatureKind> kind_;
    size_t dimension_{0};
    bool dirty_{false};
    bool overwrite_pending_{false};

    void ValidateShape(const std::string& path, const FeatureValue& value);
    void ResetShape();

    Blob Encode() const;
    void Decode(const Blob& blob);

    void LogDebug(const std::string& message) const;
};

} // namespace simgroup
