// Serialization
// Whole-model persistence; the file extension picks the encoding:
//   .json     text JSON
//   .msgpack  MessagePack (binary) encoding of the same document

#pragma once

#include <seqnet/model.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace seqnet {

// Serialization error (unreadable/unwritable file, undecodable contents)
struct SerializeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class ModelFormat {
    JSON,
    MSGPACK
};

inline ModelFormat model_format(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    if (ext == ".json") return ModelFormat::JSON;
    if (ext == ".msgpack") return ModelFormat::MSGPACK;
    throw ValueError("File format '" + ext + "' not supported. Select from .json or .msgpack.");
}

inline void save_model(const std::filesystem::path& path, const Model& model) {
    ModelFormat format = model_format(path);
    nlohmann::json doc = model.to_json();

    std::ofstream file(path, format == ModelFormat::MSGPACK ? std::ios::binary : std::ios::out);
    if (!file.is_open()) {
        throw SerializeError("Cannot open file for writing: " + path.string());
    }

    if (format == ModelFormat::MSGPACK) {
        std::vector<std::uint8_t> bytes = nlohmann::json::to_msgpack(doc);
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
    } else {
        file << doc.dump(2) << '\n';
    }

    if (!file.good()) {
        throw SerializeError("Error writing to file: " + path.string());
    }
}

inline Model load_model(const std::filesystem::path& path) {
    ModelFormat format = model_format(path);

    std::ifstream file(path, format == ModelFormat::MSGPACK ? std::ios::binary : std::ios::in);
    if (!file.is_open()) {
        throw SerializeError("Cannot open file for reading: " + path.string());
    }

    nlohmann::json doc;
    try {
        if (format == ModelFormat::MSGPACK) {
            std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                            std::istreambuf_iterator<char>());
            doc = nlohmann::json::from_msgpack(bytes);
        } else {
            doc = nlohmann::json::parse(file);
        }
    } catch (const nlohmann::json::parse_error& e) {
        throw SerializeError("Invalid model file " + path.string() + ": " + e.what());
    }

    return Model::from_json(doc);
}

}  // namespace seqnet
