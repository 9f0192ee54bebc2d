// File: src/core/binary_io.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace simgroup {
namespace binary_io {

// Upper bound on any length prefix read back from disk (guards corrupt blobs)
constexpr uint64_t kMaxLength = 1ULL << 32;

template<typename T>
void WritePod(std::ostream& out, const T& value) {
    static_assert(std::is_trivially_copyable<T>::value, "POD required");
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template<typename T>
T ReadPod(std::istream& in) {
    static_assert(std::is_trivially_copyable<T>::value, "POD required");
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw std::runtime_error("Unexpected end of stream");
    }
    return value;
}

inline uint64_t ReadLength(std::istream& in) {
    uint64_t length = ReadPod<uint64_t>(in);
    if (length > kMaxLength) {
        throw std::runtime_error("Length prefix out of range: " + std::to_string(length));
    }
    return length;
}

inline void WriteString(std::ostream& out, const std::string& str) {
    WritePod<uint64_t>(out, str.size());
    out.write(str.data(), static_cast<std::streamsize>(str.size()));
}

inline std::string ReadString(std::istream& in) {
    uint64_t length = ReadLength(in);
    std::string str(length, '\0');
    if (length > 0) {
        in.read(&str[0], static_cast<std::streamsize>(length));
        if (!in) {
            throw std::runtime_error("Unexpected end of stream");
        }
    }
    return str;
}

} // namespace binary_io
} // namespace simgroup
