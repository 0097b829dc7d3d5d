// Sample Decoding
// Decoders turn a sample file into a float tensor. The native format is a
// small binary tensor file (.sqt):
//
//   magic "SQNT" | u32 version | u8 dtype | u32 ndim | u64 dims[ndim] | data
//
// dtype 0 = float32, 1 = uint8. All integers little-endian (host order).

#pragma once

#include <seqnet/tensor.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace seqnet {
namespace data {

namespace fs = std::filesystem;

// Decode error (unreadable file, bad header, truncated data)
struct DecodeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

using Decoder = std::function<Tensor<float>(const fs::path&)>;

constexpr char SQT_MAGIC[4] = {'S', 'Q', 'N', 'T'};
constexpr uint32_t SQT_VERSION = 1;
constexpr uint32_t SQT_MAX_DIMS = 8;

enum class SampleType : uint8_t {
    FLOAT32 = 0,
    UINT8 = 1
};

namespace io {

template<typename T>
void write_pod(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template<typename T>
T read_pod(std::ifstream& in, const fs::path& path) {
    T value;
    if (!in.read(reinterpret_cast<char*>(&value), sizeof(value))) {
        throw DecodeError("Truncated tensor file: " + path.string());
    }
    return value;
}

}  // namespace io

// Write a tensor file; values are narrowed to uint8 when dtype is UINT8
inline void write_tensor_file(const fs::path& path, const Tensor<float>& tensor,
                              SampleType dtype = SampleType::FLOAT32) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw DecodeError("Cannot open tensor file for writing: " + path.string());
    }

    out.write(SQT_MAGIC, 4);
    io::write_pod(out, SQT_VERSION);
    io::write_pod(out, static_cast<uint8_t>(dtype));
    io::write_pod(out, static_cast<uint32_t>(tensor.ndim()));
    for (size_t dim : tensor.shape()) {
        io::write_pod(out, static_cast<uint64_t>(dim));
    }

    if (dtype == SampleType::UINT8) {
        std::vector<uint8_t> bytes(tensor.numel());
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(tensor[i]);
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    } else {
        out.write(reinterpret_cast<const char*>(tensor.data()),
                  static_cast<std::streamsize>(tensor.numel() * sizeof(float)));
    }

    if (!out.good()) {
        throw DecodeError("Error writing tensor file: " + path.string());
    }
}

// Read a tensor file. The stream is closed on every exit path.
inline Tensor<float> decode_tensor_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw DecodeError("Cannot open tensor file: " + path.string());
    }

    char magic[4];
    if (!in.read(magic, 4) || std::memcmp(magic, SQT_MAGIC, 4) != 0) {
        throw DecodeError("Invalid tensor file (bad magic number): " + path.string());
    }

    auto version = io::read_pod<uint32_t>(in, path);
    if (version != SQT_VERSION) {
        throw DecodeError("Unsupported tensor file version " + std::to_string(version) +
                          ": " + path.string());
    }

    auto dtype = io::read_pod<uint8_t>(in, path);
    size_t element_size;
    if (dtype == static_cast<uint8_t>(SampleType::UINT8)) {
        element_size = sizeof(uint8_t);
    } else if (dtype == static_cast<uint8_t>(SampleType::FLOAT32)) {
        element_size = sizeof(float);
    } else {
        throw DecodeError("Unsupported dtype " + std::to_string(dtype) + ": " + path.string());
    }

    auto ndim = io::read_pod<uint32_t>(in, path);
    if (ndim > SQT_MAX_DIMS) {
        throw DecodeError("Invalid tensor file (" + std::to_string(ndim) + " dimensions): " +
                          path.string());
    }

    // Header values are checked against the bytes actually present before
    // anything is allocated
    Shape shape(ndim);
    uint64_t n = ndim == 0 ? 0 : 1;
    for (uint32_t d = 0; d < ndim; ++d) {
        uint64_t dim = io::read_pod<uint64_t>(in, path);
        if (dim != 0 && n > std::numeric_limits<uint64_t>::max() / element_size / dim) {
            throw DecodeError("Invalid tensor file (shape too large): " + path.string());
        }
        shape[d] = static_cast<size_t>(dim);
        n *= dim;
    }

    std::streampos data_start = in.tellg();
    in.seekg(0, std::ios::end);
    std::streamoff remaining = in.tellg() - data_start;
    in.seekg(data_start);
    if (!in || remaining < 0 || static_cast<uint64_t>(remaining) < n * element_size) {
        throw DecodeError("Truncated tensor file: " + path.string());
    }

    Tensor<float> tensor(shape);
    size_t count = tensor.numel();

    if (element_size == sizeof(uint8_t)) {
        std::vector<uint8_t> bytes(count);
        if (!in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(count))) {
            throw DecodeError("Truncated tensor file: " + path.string());
        }
        for (size_t i = 0; i < count; ++i) {
            tensor[i] = static_cast<float>(bytes[i]);
        }
    } else {
        if (!in.read(reinterpret_cast<char*>(tensor.data()),
                     static_cast<std::streamsize>(count * sizeof(float)))) {
            throw DecodeError("Truncated tensor file: " + path.string());
        }
    }

    return tensor;
}

}  // namespace data
}  // namespace seqnet
