// File: src/core/feature_value.hpp
#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <variant>
#include <iosfwd>

namespace simgroup {

// FeatureKind: which fingerprint variant a FeatureValue holds
enum class FeatureKind : uint8_t {
    DENSE = 0,     // L2-normalized float vector
    COLORS = 1,    // Ordered LAB color triples
    PROMPTS = 2,   // Positive/negative prompt text
    MODELS = 3,    // Model and lora identifier sets
    SIZE = 4,      // Pixel width/height
};

const char* ToString(FeatureKind kind);

// FeatureVector: dense numerical representation (embeddings)
class FeatureVector {
public:
    using ValueType = float;
    using StorageType = std::vector<ValueType>;

    // Constructors
    FeatureVector() = default;
    explicit FeatureVector(size_t dimension);
    explicit FeatureVector(const StorageType& data);
    explicit FeatureVector(StorageType&& data);

    // Get dimension
    size_t Dimension() const { return data_.size(); }

    // Element access
    ValueType operator[](size_t index) const { return data_[index]; }
    ValueType& operator[](size_t index) { return data_[index]; }

    // Get raw data
    const StorageType& Data() const { return data_; }

    // Compute L2 norm
    float Norm() const;

    // Normalize to unit length (zero vector stays zero)
    FeatureVector Normalized() const;

    // Dot product, throws DimensionMismatchError on differing dimensions
    float DotProduct(const FeatureVector& other) const;

    // Equality comparison
    bool operator==(const FeatureVector& other) const;
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }

    // Serialization
    void Serialize(std::ostream& out) const;
    static FeatureVector Deserialize(std::istream& in);

    // String representation
    std::string ToString(size_t max_elements = 10) const;

private:
    StorageType data_;
};

// LabColor: one CIELAB color sample
struct LabColor {
    float l{0.0f};
    float a{0.0f};
    float b{0.0f};

    bool operator==(const LabColor& other) const {
        return l == other.l && a == other.a && b == other.b;
    }
};

using ColorArray = std::vector<LabColor>;

// PromptPair: generation prompts extracted from image metadata
struct PromptPair {
    std::string positive;
    std::string negative;

    bool operator==(const PromptPair& other) const {
        return positive == other.positive && negative == other.negative;
    }
};

// ModelSets: checkpoint model names and auxiliary (lora) model names
struct ModelSets {
    std::vector<std::string> models;
    std::vector<std::string> loras;

    bool operator==(const ModelSets& other) const {
        return models == other.models && loras == other.loras;
    }
};

// PixelSize: image dimensions in pixels
struct PixelSize {
    int32_t width{0};
    int32_t height{0};

    bool operator==(const PixelSize& other) const {
        return width == other.width && height == other.height;
    }
};

// FeatureValue: the extracted fingerprint of one file under one compare mode
class FeatureValue {
public:
    using Storage = std::variant<FeatureVector, ColorArray, PromptPair, ModelSets, PixelSize>;

    FeatureValue() = default;

    // Factories. Dense() normalizes the vector to unit length.
    static FeatureValue Dense(const std::vector<float>& values);
    static FeatureValue Colors(ColorArray colors);
    static FeatureValue Prompts(std::string positive, std::string negative);
    static FeatureValue Models(std::vector<std::string> models, std::vector<std::string> loras);
    static FeatureValue Size(int32_t width, int32_t height);

    FeatureKind Kind() const { return static_cast<FeatureKind>(value_.index()); }

    // Typed access, throws FeatureShapeError on kind mismatch
    const FeatureVector& AsDense() const;
    const ColorArray& AsColors() const;
    const PromptPair& AsPrompts() const;
    const ModelSets& AsModels() const;
    const PixelSize& AsSize() const;

    /// Shape of the value: vector dimension or color count, 0 otherwise
    size_t Dimension() const;

    /// Approximate heap + inline footprint in bytes
    size_t EstimateByteSize() const;

    bool operator==(const FeatureValue& other) const { return value_ == other.value_; }
    bool operator!=(const FeatureValue& other) const { return !(*this == other); }

    // Serialization
    void Serialize(std::ostream& out) const;
    static FeatureValue Deserialize(std::istream& in);

    std::string ToString() const;

private:
    explicit FeatureValue(Storage value) : value_(std::move(value)) {}

    Storage value_;
};

} // namespace simgroup
