// JSON field access
// Typed, validated reads from nlohmann::json objects used by every from_json

#pragma once

#include <seqnet/tensor.hpp>
#include <seqnet/error.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace seqnet {
namespace detail {

using nlohmann::json;

// Missing key is a ValueError, non-object is a TypeError
inline const json& json_field(const json& j, const std::string& key) {
    if (!j.is_object()) {
        throw TypeError("expected a JSON object while reading '" + key + "'");
    }
    auto it = j.find(key);
    if (it == j.end()) {
        throw ValueError("missing field '" + key + "'");
    }
    return *it;
}

inline size_t json_size(const json& j, const std::string& key) {
    const json& v = json_field(j, key);
    if (!v.is_number_integer()) {
        throw TypeError("field '" + key + "' must be an integer");
    }
    if (v.get<long long>() < 0) {
        throw ValueError("field '" + key + "' must be non-negative");
    }
    return v.get<size_t>();
}

inline uint32_t json_uint32(const json& j, const std::string& key) {
    size_t v = json_size(j, key);
    if (v > std::numeric_limits<uint32_t>::max()) {
        throw ValueError("field '" + key + "' must fit in 32 bits, got " + std::to_string(v));
    }
    return static_cast<uint32_t>(v);
}

inline long long json_int(const json& j, const std::string& key) {
    const json& v = json_field(j, key);
    if (!v.is_number_integer()) {
        throw TypeError("field '" + key + "' must be an integer");
    }
    return v.get<long long>();
}

inline double json_number(const json& j, const std::string& key) {
    const json& v = json_field(j, key);
    if (!v.is_number()) {
        throw TypeError("field '" + key + "' must be a number");
    }
    return v.get<double>();
}

inline bool json_bool(const json& j, const std::string& key) {
    const json& v = json_field(j, key);
    if (!v.is_boolean()) {
        throw TypeError("field '" + key + "' must be a boolean");
    }
    return v.get<bool>();
}

inline std::string json_string(const json& j, const std::string& key) {
    const json& v = json_field(j, key);
    if (!v.is_string()) {
        throw TypeError("field '" + key + "' must be a string");
    }
    return v.get<std::string>();
}

// The "class" discriminator must name the type being reconstructed
inline void check_class(const json& j, const std::string& expected) {
    std::string actual = json_string(j, "class");
    if (actual != expected) {
        throw ValueError("Invalid class value. Expected " + expected + ", got " + actual + ".");
    }
}

inline json vector_to_json(const Tensor<float>& t) {
    return json(t.values());
}

inline json matrix_to_json(const Tensor<float>& t) {
    json rows = json::array();
    size_t cols = t.shape().back();
    for (size_t r = 0; r < t.numel() / cols; ++r) {
        json row = json::array();
        for (size_t c = 0; c < cols; ++c) {
            row.push_back(t[r * cols + c]);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

inline Tensor<float> vector_from_json(const json& j, const std::string& key, size_t size) {
    const json& v = json_field(j, key);
    if (!v.is_array()) {
        throw TypeError("field '" + key + "' must be an array");
    }
    if (v.size() != size) {
        throw ValueError("field '" + key + "' has " + std::to_string(v.size()) +
                         " values, expected " + std::to_string(size));
    }
    std::vector<float> values;
    values.reserve(size);
    for (const auto& x : v) {
        if (!x.is_number()) {
            throw TypeError("field '" + key + "' must contain only numbers");
        }
        values.push_back(x.get<float>());
    }
    return Tensor<float>({size}, std::move(values));
}

inline Tensor<float> matrix_from_json(const json& j, const std::string& key,
                                      size_t rows, size_t cols) {
    const json& v = json_field(j, key);
    if (!v.is_array()) {
        throw TypeError("field '" + key + "' must be an array of rows");
    }
    if (v.size() != rows) {
        throw ValueError("field '" + key + "' has " + std::to_string(v.size()) +
                         " rows, expected " + std::to_string(rows));
    }
    std::vector<float> values;
    values.reserve(rows * cols);
    for (const auto& row : v) {
        if (!row.is_array()) {
            throw TypeError("field '" + key + "' must be an array of rows");
        }
        if (row.size() != cols) {
            throw ValueError("field '" + key + "' has a row of " + std::to_string(row.size()) +
                             " values, expected " + std::to_string(cols));
        }
        for (const auto& x : row) {
            if (!x.is_number()) {
                throw TypeError("field '" + key + "' must contain only numbers");
            }
            values.push_back(x.get<float>());
        }
    }
    return Tensor<float>({rows, cols}, std::move(values));
}

}  // namespace detail
}  // namespace seqnet
