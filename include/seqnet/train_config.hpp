// Training Config
// JSON description of a dataset, a model and a training run
//
// {
//   "data":     {"root": "digits/", "extensions": [".sqt"], "train_fraction": 0.8,
//                "shuffle": true, "scale": 0.00392, "flatten": true},
//   "model":    {"layers": [{"type": "Linear", "in_channels": 64, "out_channels": 10}],
//                "reduction": "mean",
//                "train_metrics": ["loss", "accuracy"],
//                "validation_metrics": ["loss", "accuracy", "f1_score"]},
//   "training": {"learning_rate": 0.1, "batch_size": 32, "epochs": 10,
//                "seed": 42, "verbose": true}
// }

#pragma once

#include <seqnet/model.hpp>
#include <seqnet/nn/layers.hpp>
#include <seqnet/data/dataset_source.hpp>
#include <seqnet/json_fields.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace seqnet {

// Config file could not be read or parsed
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct LayerConfig {
    std::string type;           // "Linear", "ReLU" or "Dropout"
    size_t in_channels = 0;     // Linear
    size_t out_channels = 0;    // Linear
    size_t channels = 0;        // ReLU, Dropout
    float p = 0.5f;             // Dropout

    size_t input_size() const { return type == "Linear" ? in_channels : channels; }
    size_t output_size() const { return type == "Linear" ? out_channels : channels; }
};

struct TrainConfig {
    // Data
    std::string data_root;
    std::vector<std::string> extensions = {".sqt"};
    double train_fraction = 0.7;
    bool shuffle = true;
    float scale = 1.0f;
    bool flatten = true;

    // Model
    std::vector<LayerConfig> layers;
    std::string reduction = "mean";
    std::vector<std::string> train_metrics = {"loss", "accuracy"};
    std::vector<std::string> validation_metrics = {"loss", "accuracy"};

    // Training
    float learning_rate = 0.01f;
    long long batch_size = 32;
    int epochs = 10;
    uint32_t seed = SEQNET_DEFAULT_SEED;
    bool verbose = true;

    // Missing sections and fields keep their defaults; a present field of the
    // wrong type is a TypeError.
    static TrainConfig from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw TypeError("Training config must be a JSON object");
        }

        TrainConfig config;

        if (j.contains("data")) {
            const auto& d = section(j, "data");
            config.data_root = detail::json_string(d, "root");
            if (d.contains("extensions")) config.extensions = string_list(d, "extensions");
            if (d.contains("train_fraction")) config.train_fraction = detail::json_number(d, "train_fraction");
            if (d.contains("shuffle")) config.shuffle = detail::json_bool(d, "shuffle");
            if (d.contains("scale")) config.scale = static_cast<float>(detail::json_number(d, "scale"));
            if (d.contains("flatten")) config.flatten = detail::json_bool(d, "flatten");
        }

        if (j.contains("model")) {
            const auto& m = section(j, "model");
            const auto& layers = detail::json_field(m, "layers");
            if (!layers.is_array()) {
                throw TypeError("Field 'layers' must be an array");
            }
            for (const auto& l : layers) {
                config.layers.push_back(layer_config(l));
            }
            if (m.contains("reduction")) config.reduction = detail::json_string(m, "reduction");
            if (m.contains("train_metrics")) config.train_metrics = string_list(m, "train_metrics");
            if (m.contains("validation_metrics")) {
                config.validation_metrics = string_list(m, "validation_metrics");
            }
        }

        if (j.contains("training")) {
            const auto& t = section(j, "training");
            if (t.contains("learning_rate")) {
                config.learning_rate = static_cast<float>(detail::json_number(t, "learning_rate"));
            }
            if (t.contains("batch_size")) config.batch_size = detail::json_int(t, "batch_size");
            if (t.contains("epochs")) {
                long long epochs = detail::json_int(t, "epochs");
                if (epochs < std::numeric_limits<int>::min() || epochs > std::numeric_limits<int>::max()) {
                    throw ValueError("training.epochs out of range: " + std::to_string(epochs));
                }
                config.epochs = static_cast<int>(epochs);
            }
            if (t.contains("seed")) config.seed = detail::json_uint32(t, "seed");
            if (t.contains("verbose")) config.verbose = detail::json_bool(t, "verbose");
        }

        return config;
    }

    // Parse from JSON text
    static TrainConfig parse(const std::string& text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(std::string("JSON parse error: ") + e.what());
        }
        return from_json(j);
    }

    static TrainConfig load(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigError("Cannot open config file: " + path.string());
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
        return parse(content);
    }

    nlohmann::json to_json() const {
        nlohmann::json j;

        j["data"]["root"] = data_root;
        j["data"]["extensions"] = extensions;
        j["data"]["train_fraction"] = train_fraction;
        j["data"]["shuffle"] = shuffle;
        j["data"]["scale"] = scale;
        j["data"]["flatten"] = flatten;

        nlohmann::json layer_list = nlohmann::json::array();
        for (const auto& l : layers) {
            nlohmann::json lj = {{"type", l.type}};
            if (l.type == "Linear") {
                lj["in_channels"] = l.in_channels;
                lj["out_channels"] = l.out_channels;
            } else {
                lj["channels"] = l.channels;
            }
            if (l.type == "Dropout") lj["p"] = l.p;
            layer_list.push_back(lj);
        }
        j["model"]["layers"] = layer_list;
        j["model"]["reduction"] = reduction;
        j["model"]["train_metrics"] = train_metrics;
        j["model"]["validation_metrics"] = validation_metrics;

        j["training"]["learning_rate"] = learning_rate;
        j["training"]["batch_size"] = batch_size;
        j["training"]["epochs"] = epochs;
        j["training"]["seed"] = seed;
        j["training"]["verbose"] = verbose;

        return j;
    }

    void save(const std::filesystem::path& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw ConfigError("Cannot write config file: " + path.string());
        }
        file << to_json().dump(2);
    }

    // Check value constraints; throws ValueError (ShapeError for a broken
    // layer chain)
    void validate() const {
        if (data_root.empty()) {
            throw ValueError("data.root must be set");
        }
        if (extensions.empty()) {
            throw ValueError("data.extensions must not be empty");
        }
        if (std::isnan(train_fraction) || train_fraction < 0.0 || train_fraction > 1.0) {
            throw ValueError("data.train_fraction must be in [0, 1]");
        }
        if (!std::isfinite(scale)) {
            throw ValueError("data.scale must be finite");
        }

        if (layers.empty()) {
            throw ValueError("model.layers must not be empty");
        }
        for (size_t i = 0; i < layers.size(); ++i) {
            const auto& l = layers[i];
            nn::parse_layer_kind(l.type);
            if (l.input_size() == 0 || l.output_size() == 0) {
                throw ValueError("model.layers[" + std::to_string(i) + "]: channels must be positive");
            }
            if (l.type == "Dropout" && !(l.p >= 0.0f && l.p < 1.0f)) {
                throw ValueError("model.layers[" + std::to_string(i) + "]: p must be in [0, 1)");
            }
            if (i > 0 && layers[i - 1].output_size() != l.input_size()) {
                throw ShapeError("model.layers[" + std::to_string(i) + "] expects " +
                                 std::to_string(l.input_size()) + " channels, previous layer outputs " +
                                 std::to_string(layers[i - 1].output_size()));
            }
        }
        nn::parse_reduction(reduction);
        check_metrics(train_metrics, "model.train_metrics");
        check_metrics(validation_metrics, "model.validation_metrics");

        if (!(learning_rate > 0.0f) || !std::isfinite(learning_rate)) {
            throw ValueError("training.learning_rate must be positive");
        }
        if (batch_size <= 0) {
            throw ValueError("training.batch_size must be positive");
        }
        if (epochs < 0) {
            throw ValueError("training.epochs must be >= 0");
        }
    }

    std::vector<data::Transform> preprocessing() const {
        std::vector<data::Transform> pipeline;
        if (scale != 1.0f) pipeline.push_back(data::scale(scale));
        if (flatten) pipeline.push_back(data::flatten());
        return pipeline;
    }

    data::DatasetSource build_source(data::Decoder decoder = data::decode_tensor_file) const {
        data::SourceOptions options;
        options.extensions = extensions;
        options.train_fraction = train_fraction;
        options.shuffle = shuffle;
        options.seed = seed;
        return data::DatasetSource(data_root, preprocessing(), options, std::move(decoder));
    }

    // Freshly initialized model; Linear weights are drawn from one Generator
    // seeded with `seed`
    Model build_model() const {
        Generator gen(seed);
        std::vector<std::unique_ptr<nn::Layer>> built;
        for (const auto& l : layers) {
            switch (nn::parse_layer_kind(l.type)) {
                case nn::LayerKind::Linear:
                    built.push_back(std::make_unique<nn::Linear>(l.in_channels, l.out_channels, gen));
                    break;
                case nn::LayerKind::ReLU:
                    built.push_back(std::make_unique<nn::ReLU>(l.channels));
                    break;
                case nn::LayerKind::Dropout:
                    built.push_back(std::make_unique<nn::Dropout>(l.channels, l.p, gen.fork()));
                    break;
            }
        }

        ModelOptions options;
        options.train_metrics = track(train_metrics);
        options.validation_metrics = track(validation_metrics);

        Model model(std::move(built), nn::CrossEntropyLoss(reduction), std::move(options));
        model.verbose = verbose;
        return model;
    }

private:
    static const nlohmann::json& section(const nlohmann::json& j, const std::string& key) {
        const auto& s = detail::json_field(j, key);
        if (!s.is_object()) {
            throw TypeError("Config section '" + key + "' must be an object");
        }
        return s;
    }

    static std::vector<std::string> string_list(const nlohmann::json& j, const std::string& key) {
        const auto& v = detail::json_field(j, key);
        if (!v.is_array()) {
            throw TypeError("Field '" + key + "' must be an array of strings");
        }
        std::vector<std::string> result;
        for (const auto& s : v) {
            if (!s.is_string()) {
                throw TypeError("Field '" + key + "' must be an array of strings");
            }
            result.push_back(s.get<std::string>());
        }
        return result;
    }

    static LayerConfig layer_config(const nlohmann::json& j) {
        LayerConfig l;
        l.type = detail::json_string(j, "type");
        if (l.type == "Linear") {
            l.in_channels = detail::json_size(j, "in_channels");
            l.out_channels = detail::json_size(j, "out_channels");
        } else {
            l.channels = detail::json_size(j, "channels");
        }
        if (l.type == "Dropout" && j.contains("p")) {
            l.p = static_cast<float>(detail::json_number(j, "p"));
        }
        return l;
    }

    static void check_metrics(const std::vector<std::string>& names, const std::string& field) {
        for (const auto& name : names) {
            if (!metrics::is_known_metric(name)) {
                throw ValueError(field + ": unknown metric '" + name + "'");
            }
        }
    }
};

}  // namespace seqnet
