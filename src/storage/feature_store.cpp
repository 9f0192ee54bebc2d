// File: src/storage/feature_store.cpp
#include "storage/feature_store.hpp"
#include "core/binary_io.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>

namespace simgroup {

namespace {

constexpr char kMagic[4] = {'S', 'G', 'F', 'S'};
constexpr uint32_t kVersion = 1;

bool HasDimension(FeatureKind kind) {
    return kind == FeatureKind::DENSE || kind == FeatureKind::COLORS;
}

} // namespace

FeatureStore::FeatureStore(std::shared_ptr<BlobStore> blob_store, const Config& config)
    : blob_store_(std::move(blob_store)), config_(config) {
    if (!blob_store_) {
        throw std::invalid_argument("FeatureStore requires a BlobStore");
    }
    ResetShape();
    overwrite_pending_ = config_.overwrite;
}

// ============================================================================
// Persistence
// ============================================================================

bool FeatureStore::Load() {
    features_.clear();
    ResetShape();
    dirty_ = false;

    if (config_.overwrite) {
        LogDebug("Overwrite requested, starting with an empty feature map");
        return false;
    }

    auto blob = blob_store_->Load(config_.cache_key);
    if (!blob) {
        LogDebug("No stored features under '" + config_.cache_key + "'");
        return false;
    }

    try {
        Decode(*blob);
    } catch (const std::exception& e) {
        std::cerr << "[FeatureStore] Discarding unreadable feature map '" << config_.cache_key
                  << "': " << e.what() << std::endl;
        features_.clear();
        ResetShape();
        return false;
    }

    LogDebug("Loaded " + std::to_string(features_.size()) + " features");
    return !features_.empty();
}

bool FeatureStore::Save() {
    if (!dirty_ && !overwrite_pending_) {
        return false;
    }

    if (!blob_store_->Save(config_.cache_key, Encode())) {
        throw std::runtime_error("Failed to persist feature map '" + config_.cache_key + "'");
    }

    LogDebug("Saved " + std::to_string(features_.size()) + " features");
    dirty_ = false;
    overwrite_pending_ = false;
    return true;
}

Blob FeatureStore::Encode() const {
    std::ostringstream out(std::ios::binary);

    out.write(kMagic, sizeof(kMagic));
    binary_io::WritePod(out, kVersion);

    // Sorted for a reproducible blob
    std::vector<std::string> paths = Paths();
    binary_io::WritePod<uint64_t>(out, paths.size());
    for (const auto& path : paths) {
        binary_io::WriteString(out, path);
        features_.at(path).Serialize(out);
    }

    std::string bytes = out.str();
    return Blob(bytes.begin(), bytes.end());
}

void FeatureStore::Decode(const Blob& blob) {
    std::istringstream in(std::string(blob.begin(), blob.end()), std::ios::binary);

    char magic[4];
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        throw std::runtime_error("Bad feature map magic");
    }

    uint32_t version = binary_io::ReadPod<uint32_t>(in);
    if (version != kVersion) {
        throw std::runtime_error("Unsupported feature map version " + std::to_string(version));
    }

    uint64_t count = binary_io::ReadLength(in);
    for (uint64_t i = 0; i < count; ++i) {
        std::string path = binary_io::ReadString(in);
        FeatureValue value = FeatureValue::Deserialize(in);
        ValidateShape(path, value);
        features_.insert_or_assign(std::move(path), std::move(value));
    }
}

// ============================================================================
// Access
// ============================================================================

std::optional<FeatureValue> FeatureStore::GetOrCompute(const std::string& path,
                                                       const FeatureExtractor& extractor) {
    auto it = features_.find(path);
    if (it != features_.end()) {
        return it->second;
    }

    std::optional<FeatureValue> value;
    try {
        value = extractor(path);
    } catch (const std::exception& e) {
        std::cerr << "[FeatureStore] Skipping " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!value) {
        std::cerr << "[FeatureStore] Skipping " << path << ": no feature extracted" << std::endl;
        return std::nullopt;
    }

    Put(path, *value);
    return value;
}

std::optional<FeatureValue> FeatureStore::Get(const std::string& path) const {
    auto it = features_.find(path);
    if (it == features_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FeatureStore::Put(const std::string& path, const FeatureValue& value) {
    ValidateShape(path, value);
    features_.insert_or_assign(path, value);
    dirty_ = true;
}

bool FeatureStore::Contains(const std::string& path) const {
    return features_.find(path) != features_.end();
}

bool FeatureStore::Invalidate(const std::string& path) {
    if (features_.erase(path) == 0) {
        return false;
    }
    dirty_ = true;
    return true;
}

void FeatureStore::Clear() {
    if (!features_.empty()) {
        dirty_ = true;
    }
    features_.clear();
    ResetShape();
}

std::vector<std::string> FeatureStore::Paths() const {
    std::vector<std::string> paths;
    paths.reserve(features_.size());
    for (const auto& [path, value] : features_) {
        paths.push_back(path);
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

// ============================================================================
// Shape invariants
// ============================================================================

void FeatureStore::ValidateShape(const std::string& path, const FeatureValue& value) {
    FeatureKind kind = value.Kind();

    if (kind_ && *kind_ != kind) {
        throw FeatureShapeError(path + ": expected " + ToString(*kind_) +
                                " feature, extractor produced " + ToString(kind));
    }

    if (HasDimension(kind)) {
        if (dimension_ != 0 && value.Dimension() != dimension_) {
            throw FeatureShapeError(path + ": expected dimension " + std::to_string(dimension_) +
                                    ", extractor produced " + std::to_string(value.Dimension()));
        }
        dimension_ = value.Dimension();
    }

    kind_ = kind;
}

void FeatureStore::ResetShape() {
    kind_ = config_.expected_kind;
    dimension_ = config_.expected_dimension;
}

void FeatureStore::LogDebug(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[FeatureStore] " << message << std::endl;
    }
}

} // namespace simgroup
