// File: src/core/feature_value.cpp
#include "core/feature_value.hpp"
#include "core/binary_io.hpp"
#include "core/errors.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace simgroup {

const char* ToString(FeatureKind kind) {
    switch (kind) {
        case FeatureKind::DENSE: return "DENSE";
        case FeatureKind::COLORS: return "COLORS";
        case FeatureKind::PROMPTS: return "PROMPTS";
        case FeatureKind::MODELS: return "MODELS";
        case FeatureKind::SIZE: return "SIZE";
        default: return "INVALID";
    }
}

// ============================================================================
// FeatureVector Implementation
// ============================================================================

FeatureVector::FeatureVector(size_t dimension) : data_(dimension, 0.0f) {}

FeatureVector::FeatureVector(const StorageType& data) : data_(data) {}

FeatureVector::FeatureVector(StorageType&& data) : data_(std::move(data)) {}

float FeatureVector::Norm() const {
    float sum_sq = 0.0f;
    for (float val : data_) {
        sum_sq += val * val;
    }
    return std::sqrt(sum_sq);
}

FeatureVector FeatureVector::Normalized() const {
    float norm = Norm();
    if (norm == 0.0f) {
        return FeatureVector(data_.size());
    }

    FeatureVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] / norm;
    }
    return result;
}

float FeatureVector::DotProduct(const FeatureVector& other) const {
    if (Dimension() != other.Dimension()) {
        throw DimensionMismatchError(Dimension(), other.Dimension());
    }

    float dot = 0.0f;
    for (size_t i = 0; i < data_.size(); ++i) {
        dot += data_[i] * other.data_[i];
    }
    return dot;
}

bool FeatureVector::operator==(const FeatureVector& other) const {
    return data_ == other.data_;
}

void FeatureVector::Serialize(std::ostream& out) const {
    binary_io::WritePod<uint64_t>(out, data_.size());
    if (!data_.empty()) {
        out.write(reinterpret_cast<const char*>(data_.data()),
                  static_cast<std::streamsize>(data_.size() * sizeof(ValueType)));
    }
}

FeatureVector FeatureVector::Deserialize(std::istream& in) {
    uint64_t dimension = binary_io::ReadLength(in);

    FeatureVector fv(static_cast<size_t>(dimension));
    if (dimension > 0) {
        in.read(reinterpret_cast<char*>(fv.data_.data()),
                static_cast<std::streamsize>(dimension * sizeof(ValueType)));
        if (!in) {
            throw std::runtime_error("Unexpected end of stream reading FeatureVector");
        }
    }

    return fv;
}

std::string FeatureVector::ToString(size_t max_elements) const {
    std::ostringstream oss;
    oss << "FeatureVector[" << data_.size() << "]{";

    size_t n = std::min(max_elements, data_.size());
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) oss << ", ";
        oss << std::fixed << std::setprecision(3) << data_[i];
    }
    if (data_.size() > max_elements) {
        oss << ", ...";
    }
    oss << "}";
    return oss.str();
}

// ============================================================================
// FeatureValue Implementation
// ============================================================================

FeatureValue FeatureValue::Dense(const std::vector<float>& values) {
    return FeatureValue(Storage(FeatureVector(values).Normalized()));
}

FeatureValue FeatureValue::Colors(ColorArray colors) {
    return FeatureValue(Storage(std::move(colors)));
}

FeatureValue FeatureValue::Prompts(std::string positive, std::string negative) {
    return FeatureValue(Storage(PromptPair{std::move(positive), std::move(negative)}));
}

FeatureValue FeatureValue::Models(std::vector<std::string> models, std::vector<std::string> loras) {
    return FeatureValue(Storage(ModelSets{std::move(models), std::move(loras)}));
}

FeatureValue FeatureValue::Size(int32_t width, int32_t height) {
    return FeatureValue(Storage(PixelSize{width, height}));
}

namespace {

template<typename T>
const T& GetAs(const FeatureValue::Storage& value, FeatureKind expected, FeatureKind actual) {
    const T* ptr = std::get_if<T>(&value);
    if (!ptr) {
        throw FeatureShapeError(std::string("Expected ") + ToString(expected) +
                                " feature, found " + ToString(actual));
    }
    return *ptr;
}

void WriteStrings(std::ostream& out, const std::vector<std::string>& strings) {
    binary_io::WritePod<uint64_t>(out, strings.size());
    for (const auto& str : strings) {
        binary_io::WriteString(out, str);
    }
}

std::vector<std::string> ReadStrings(std::istream& in) {
    uint64_t count = binary_io::ReadLength(in);
    std::vector<std::string> strings;
    strings.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        strings.push_back(binary_io::ReadString(in));
    }
    return strings;
}

size_t StringsByteSize(const std::vector<std::string>& strings) {
    size_t total = strings.capacity() * sizeof(std::string);
    for (const auto& str : strings) {
        total += str.capacity();
    }
    return total;
}

} // namespace

const FeatureVector& FeatureValue::AsDense() const {
    return GetAs<FeatureVector>(value_, FeatureKind::DENSE, Kind());
}

const ColorArray& FeatureValue::AsColors() const {
    return GetAs<ColorArray>(value_, FeatureKind::COLORS, Kind());
}

const PromptPair& FeatureValue::AsPrompts() const {
    return GetAs<PromptPair>(value_, FeatureKind::PROMPTS, Kind());
}

const ModelSets& FeatureValue::AsModels() const {
    return GetAs<ModelSets>(value_, FeatureKind::MODELS, Kind());
}

const PixelSize& FeatureValue::AsSize() const {
    return GetAs<PixelSize>(value_, FeatureKind::SIZE, Kind());
}

size_t FeatureValue::Dimension() const {
    switch (Kind()) {
        case FeatureKind::DENSE: return AsDense().Dimension();
        case FeatureKind::COLORS: return AsColors().size();
        default: return 0;
    }
}

size_t FeatureValue::EstimateByteSize() const {
    size_t total = sizeof(FeatureValue);

    switch (Kind()) {
        case FeatureKind::DENSE:
            total += AsDense().Dimension() * sizeof(float);
            break;
        case FeatureKind::COLORS:
            total += AsColors().size() * sizeof(LabColor);
            break;
        case FeatureKind::PROMPTS: {
            const auto& prompts = AsPrompts();
            total += prompts.positive.capacity() + prompts.negative.capacity();
            break;
        }
        case FeatureKind::MODELS: {
            const auto& sets = AsModels();
            total += StringsByteSize(sets.models) + StringsByteSize(sets.loras);
            break;
        }
        case FeatureKind::SIZE:
            break;
    }

    return total;
}

void FeatureValue::Serialize(std::ostream& out) const {
    binary_io::WritePod<uint8_t>(out, static_cast<uint8_t>(Kind()));

    switch (Kind()) {
        case FeatureKind::DENSE:
            AsDense().Serialize(out);
            break;
        case FeatureKind::COLORS: {
            const auto& colors = AsColors();
            binary_io::WritePod<uint64_t>(out, colors.size());
            for (const auto& color : colors) {
                binary_io::WritePod(out, color.l);
                binary_io::WritePod(out, color.a);
                binary_io::WritePod(out, color.b);
            }
            break;
        }
        case FeatureKind::PROMPTS:
            binary_io::WriteString(out, AsPrompts().positive);
            binary_io::WriteString(out, AsPrompts().negative);
            break;
        case FeatureKind::MODELS:
            WriteStrings(out, AsModels().models);
            WriteStrings(out, AsModels().loras);
            break;
        case FeatureKind::SIZE:
            binary_io::WritePod(out, AsSize().width);
            binary_io::WritePod(out, AsSize().height);
            break;
    }
}

FeatureValue FeatureValue::Deserialize(std::istream& in) {
    uint8_t kind_byte = binary_io::ReadPod<uint8_t>(in);

    switch (static_cast<FeatureKind>(kind_byte)) {
        case FeatureKind::DENSE:
            // Stored vectors are already unit length
            return FeatureValue(Storage(FeatureVector::Deserialize(in)));
        case FeatureKind::COLORS: {
            uint64_t count = binary_io::ReadLength(in);
            ColorArray colors;
            colors.reserve(static_cast<size_t>(count));
            for (uint64_t i = 0; i < count; ++i) {
                LabColor color;
                color.l = binary_io::ReadPod<float>(in);
                color.a = binary_io::ReadPod<float>(in);
                color.b = binary_io::ReadPod<float>(in);
                colors.push_back(color);
            }
            return Colors(std::move(colors));
        }
        case FeatureKind::PROMPTS: {
            std::string positive = binary_io::ReadString(in);
            std::string negative = binary_io::ReadString(in);
            return Prompts(std::move(positive), std::move(negative));
        }
        case FeatureKind::MODELS: {
            auto models = ReadStrings(in);
            auto loras = ReadStrings(in);
            return Models(std::move(models), std::move(loras));
        }
        case FeatureKind::SIZE: {
            int32_t width = binary_io::ReadPod<int32_t>(in);
            int32_t height = binary_io::ReadPod<int32_t>(in);
            return Size(width, height);
        }
        default:
            throw std::runtime_error("Unknown FeatureKind byte: " + std::to_string(kind_byte));
    }
}

std::string FeatureValue::ToString() const {
    std::ostringstream oss;
    oss << "FeatureValue{" << simgroup::ToString(Kind()) << ", ";

    switch (Kind()) {
        case FeatureKind::DENSE:
            oss << AsDense().ToString(4);
            break;
        case FeatureKind::COLORS:
            oss << AsColors().size() << " colors";
            break;
        case FeatureKind::PROMPTS:
            oss << "\"" << AsPrompts().positive << "\" / \"" << AsPrompts().negative << "\"";
            break;
        case FeatureKind::MODELS:
            oss << AsModels().models.size() << " models, " << AsModels().loras.size() << " loras";
            break;
        case FeatureKind::SIZE:
            oss << AsSize().width << "x" << AsSize().height;
            break;
    }

    oss << "}";
    return oss.str();
}

} // namespace simgroup
