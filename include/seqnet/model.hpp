// Model
// Sequential chain of layers trained with a cross-entropy loss

#pragma once

#include <seqnet/nn/layers.hpp>
#include <seqnet/nn/loss.hpp>
#include <seqnet/nn/functional.hpp>
#include <seqnet/data/dataset_source.hpp>
#include <seqnet/metrics.hpp>
#include <seqnet/json_fields.hpp>
#include <seqnet/error.hpp>

#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace seqnet {

// Metric name -> one value per recorded epoch
using MetricHistory = std::map<std::string, std::vector<double>>;

// Metric name -> one per-class vector per recorded epoch (precision, recall,
// f1_score)
using ClassMetricHistory = std::map<std::string, std::vector<std::vector<double>>>;

// Start an empty history for each named metric
inline MetricHistory track(const std::vector<std::string>& names) {
    MetricHistory history;
    for (const auto& name : names) {
        history[name];
    }
    return history;
}

struct ModelOptions {
    long long total_epochs = 0;
    MetricHistory train_metrics;
    MetricHistory validation_metrics;
    ClassMetricHistory train_class_metrics;
    ClassMetricHistory validation_class_metrics;
};

// Passed to Model::on_epoch_end once per phase of every epoch
struct EpochReport {
    long long epoch = 0;           // 1-based, counted over the model's lifetime
    std::string phase;             // "train" or "validation"
    double loss = 0.0;             // mean batch loss
    metrics::ConfusionMatrix confusion;
};

class Model {
public:
    Model(std::vector<std::unique_ptr<nn::Layer>> layers,
          nn::CrossEntropyLoss loss = nn::CrossEntropyLoss(),
          ModelOptions options = {})
        : layers_(std::move(layers))
        , loss_(loss)
        , total_epochs_(options.total_epochs)
        , train_metrics_(std::move(options.train_metrics))
        , validation_metrics_(std::move(options.validation_metrics))
        , train_class_metrics_(std::move(options.train_class_metrics))
        , validation_class_metrics_(std::move(options.validation_class_metrics)) {
        validate_layers();

        if (total_epochs_ < 0) {
            throw ValueError("total_epochs must be >= 0, got " + std::to_string(total_epochs_));
        }
        validate_metrics(train_metrics_, "train_metrics");
        validate_metrics(validation_metrics_, "validation_metrics");
        validate_class_metrics(train_class_metrics_, train_metrics_, "train_class_metrics");
        validate_class_metrics(validation_class_metrics_, validation_metrics_, "validation_class_metrics");
    }

    Model(Model&&) = default;
    Model& operator=(Model&&) = default;

    Tensor<float> forward(const Tensor<float>& input) {
        Tensor<float> out = input;
        for (auto& layer : layers_) {
            out = layer->forward(out);
        }
        return out;
    }

    Tensor<float> operator()(const Tensor<float>& input) {
        return forward(input);
    }

    void set_eval(bool eval) {
        if (eval_ == eval) return;
        for (auto& layer : layers_) {
            layer->set_eval(eval);
        }
        eval_ = eval;
    }

    bool is_eval() const { return eval_; }

    // Eval mode for the guard's lifetime; the previous mode is restored on
    // every exit path
    class EvalModeGuard {
    public:
        explicit EvalModeGuard(Model& model) : model_(model), previous_(model.is_eval()) {
            model_.set_eval(true);
        }
        ~EvalModeGuard() { model_.set_eval(previous_); }
        EvalModeGuard(const EvalModeGuard&) = delete;
        EvalModeGuard& operator=(const EvalModeGuard&) = delete;

    private:
        Model& model_;
        bool previous_;
    };

    // Forward pass, record predictions (rows) against labels (columns) and
    // return the loss. Parameters are not touched.
    float evaluate_batch(const Tensor<float>& data,
                         const std::vector<int>& labels,
                         metrics::ConfusionMatrix& confusion) {
        Tensor<float> logits = forward(data);
        metrics::add_to_confusion_matrix(confusion, nn::functional::argmax(logits), labels);
        return loss_.forward(logits, labels);
    }

    // evaluate_batch followed by backpropagation through every layer
    float train_step(const Tensor<float>& data,
                     const std::vector<int>& labels,
                     float learning_rate,
                     metrics::ConfusionMatrix& confusion) {
        float loss = evaluate_batch(data, labels, confusion);

        Tensor<float> grad = loss_.backward();
        for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
            grad = (*it)->update(grad, learning_rate);
        }
        return loss;
    }

    void train(data::DatasetSource& source, float learning_rate, long long batch_size, int epochs) {
        if (epochs < 0) {
            throw ValueError("epochs must be >= 0, got " + std::to_string(epochs));
        }
        if (!(learning_rate > 0.0f) || !std::isfinite(learning_rate)) {
            throw ValueError("learning_rate must be a positive finite number");
        }

        size_t classes = num_classes();
        for (int epoch = 1; epoch <= epochs; ++epoch) {
            long long epoch_number = total_epochs_ + epoch;
            if (verbose) {
                std::cout << "Epoch " << epoch_number << ":" << std::endl;
            }

            // Training
            data::DatasetIterator training_data = source("train", batch_size);
            if (training_data.size() == 0) {
                throw ValueError("Training set yields no batches (" +
                                 std::to_string(training_data.num_samples()) +
                                 " samples, batch_size " + std::to_string(batch_size) + ")");
            }

            auto confusion = metrics::new_confusion_matrix(classes);
            double total_loss = 0.0;
            for (const auto& batch : training_data) {
                total_loss += train_step(batch.data, batch.labels, learning_rate, confusion);
            }
            finish_phase(epoch_number, "train", total_loss / static_cast<double>(training_data.size()),
                         confusion, source.classes());

            // Validation
            data::DatasetIterator validation_data = source("test", batch_size);
            if (validation_data.size() == 0) {
                continue;
            }

            confusion = metrics::new_confusion_matrix(classes);
            total_loss = 0.0;
            {
                EvalModeGuard eval_mode(*this);
                for (const auto& batch : validation_data) {
                    total_loss += evaluate_batch(batch.data, batch.labels, confusion);
                }
            }
            finish_phase(epoch_number, "validation",
                         total_loss / static_cast<double>(validation_data.size()),
                         confusion, source.classes());
        }
        total_epochs_ += epochs;
    }

    // Accessors
    size_t num_layers() const { return layers_.size(); }
    nn::Layer& layer(size_t i) { return *layers_.at(i); }
    const nn::Layer& layer(size_t i) const { return *layers_.at(i); }
    const std::vector<std::unique_ptr<nn::Layer>>& layers() const { return layers_; }

    nn::CrossEntropyLoss& loss() { return loss_; }
    const nn::CrossEntropyLoss& loss() const { return loss_; }

    size_t in_channels() const { return layers_.front()->in_channels(); }
    size_t num_classes() const { return layers_.back()->out_channels(); }

    size_t num_parameters() const {
        size_t total = 0;
        for (const auto& layer : layers_) total += layer->num_parameters();
        return total;
    }

    long long total_epochs() const { return total_epochs_; }
    const MetricHistory& train_metrics() const { return train_metrics_; }
    const MetricHistory& validation_metrics() const { return validation_metrics_; }

    const ClassMetricHistory& train_class_metrics() const { return train_class_metrics_; }
    const ClassMetricHistory& validation_class_metrics() const { return validation_class_metrics_; }

    // Per-class values of precision, recall or f1_score, one vector per epoch
    const std::vector<std::vector<double>>& class_history(const std::string& phase,
                                                          const std::string& metric) const {
        const ClassMetricHistory& histories = phase_class_metrics(phase);
        auto it = histories.find(metric);
        if (it == histories.end()) {
            throw ValueError("Per-class metric '" + metric + "' is not tracked for " + phase);
        }
        return it->second;
    }

    // History of one metric for "train" or "validation"
    const std::vector<double>& history(const std::string& phase, const std::string& metric) const {
        const MetricHistory& histories = phase_metrics(phase);
        auto it = histories.find(metric);
        if (it == histories.end()) {
            throw ValueError("Metric '" + metric + "' is not tracked for " + phase);
        }
        return it->second;
    }

    nlohmann::json to_json() const {
        nlohmann::json layers = nlohmann::json::array();
        for (const auto& layer : layers_) {
            layers.push_back(layer->to_json());
        }

        return {
            {"class", "Model"},
            {"layers", layers},
            {"loss", loss_.to_json()},
            {"epochs", total_epochs_},
            {"train_metrics", train_metrics_},
            {"validation_metrics", validation_metrics_},
            {"train_class_metrics", train_class_metrics_},
            {"validation_class_metrics", validation_class_metrics_}
        };
    }

    static Model from_json(const nlohmann::json& j) {
        detail::check_class(j, "Model");

        const auto& layers_json = detail::json_field(j, "layers");
        if (!layers_json.is_array()) {
            throw TypeError("Field 'layers' must be an array");
        }
        std::vector<std::unique_ptr<nn::Layer>> layers;
        for (const auto& layer_json : layers_json) {
            layers.push_back(nn::layer_from_json(layer_json));
        }

        ModelOptions options;
        options.total_epochs = detail::json_int(j, "epochs");
        options.train_metrics = history_from_json(j, "train_metrics");
        options.validation_metrics = history_from_json(j, "validation_metrics");
        if (j.contains("train_class_metrics")) {
            options.train_class_metrics = class_history_from_json(j, "train_class_metrics");
        }
        if (j.contains("validation_class_metrics")) {
            options.validation_class_metrics = class_history_from_json(j, "validation_class_metrics");
        }

        return Model(std::move(layers),
                     nn::CrossEntropyLoss::from_json(detail::json_field(j, "loss")),
                     std::move(options));
    }

    // Same layers (in order) and same loss
    bool operator==(const Model& other) const {
        if (layers_.size() != other.layers_.size() || loss_ != other.loss_) {
            return false;
        }
        for (size_t i = 0; i < layers_.size(); ++i) {
            if (*layers_[i] != *other.layers_[i]) return false;
        }
        return true;
    }

    bool operator!=(const Model& other) const {
        return !(*this == other);
    }

    // Print one summary line per phase (and a per-class table when
    // per-class metrics are tracked)
    bool verbose = false;

    std::function<void(const EpochReport&)> on_epoch_end;

private:
    std::vector<std::unique_ptr<nn::Layer>> layers_;
    nn::CrossEntropyLoss loss_;
    long long total_epochs_;
    MetricHistory train_metrics_;
    MetricHistory validation_metrics_;
    ClassMetricHistory train_class_metrics_;
    ClassMetricHistory validation_class_metrics_;
    bool eval_ = false;

    void validate_layers() const {
        if (layers_.empty()) {
            throw ValueError("layers cannot be empty");
        }
        for (size_t i = 0; i < layers_.size(); ++i) {
            if (!layers_[i]) {
                throw TypeError("layer " + std::to_string(i) + " is null");
            }
        }
        for (size_t i = 1; i < layers_.size(); ++i) {
            if (layers_[i - 1]->out_channels() != layers_[i]->in_channels()) {
                throw ShapeError("layer " + std::to_string(i - 1) + " (" +
                                 layers_[i - 1]->class_name() + ") outputs " +
                                 std::to_string(layers_[i - 1]->out_channels()) +
                                 " channels but layer " + std::to_string(i) + " (" +
                                 layers_[i]->class_name() + ") expects " +
                                 std::to_string(layers_[i]->in_channels()));
            }
        }
    }

    static void validate_metrics(const MetricHistory& histories, const std::string& field) {
        for (const auto& entry : histories) {
            if (!metrics::is_known_metric(entry.first)) {
                throw ValueError("An invalid metric '" + entry.first + "' was provided to " + field);
            }
        }
    }

    // Per-class histories exist only for tracked per-class metrics, with no
    // more epochs than the scalar history
    static void validate_class_metrics(ClassMetricHistory& class_histories,
                                       const MetricHistory& histories,
                                       const std::string& field) {
        for (const auto& entry : class_histories) {
            auto tracked = histories.find(entry.first);
            if (!metrics::is_per_class_metric(entry.first) || tracked == histories.end()) {
                throw ValueError("'" + entry.first + "' in " + field +
                                 " is not a tracked per-class metric");
            }
            if (entry.second.size() > tracked->second.size()) {
                throw ValueError(field + ": '" + entry.first + "' has more epochs than its history");
            }
        }
        for (const auto& entry : histories) {
            if (metrics::is_per_class_metric(entry.first)) {
                class_histories[entry.first];
            }
        }
    }

    static ClassMetricHistory class_history_from_json(const nlohmann::json& j, const std::string& key) {
        const auto& field = detail::json_field(j, key);
        if (!field.is_object()) {
            throw TypeError("Field '" + key + "' must be an object of metric histories");
        }

        ClassMetricHistory history;
        for (auto it = field.begin(); it != field.end(); ++it) {
            if (!it->is_array()) {
                throw TypeError("History of '" + it.key() + "' in '" + key + "' must be an array");
            }
            auto& epochs = history[it.key()];
            for (const auto& row : *it) {
                if (!row.is_array()) {
                    throw TypeError("History of '" + it.key() + "' in '" + key +
                                    "' must contain one array per epoch");
                }
                std::vector<double> values;
                for (const auto& v : row) {
                    if (!v.is_number()) {
                        throw TypeError("History of '" + it.key() + "' in '" + key +
                                        "' must contain numbers");
                    }
                    values.push_back(v.get<double>());
                }
                epochs.push_back(std::move(values));
            }
        }
        return history;
    }

    static MetricHistory history_from_json(const nlohmann::json& j, const std::string& key) {
        const auto& field = detail::json_field(j, key);
        if (!field.is_object()) {
            throw TypeError("Field '" + key + "' must be an object of metric histories");
        }

        MetricHistory history;
        for (auto it = field.begin(); it != field.end(); ++it) {
            if (!it->is_array()) {
                throw TypeError("History of '" + it.key() + "' in '" + key + "' must be an array");
            }
            std::vector<double>& values = history[it.key()];
            for (const auto& v : *it) {
                if (!v.is_number()) {
                    throw TypeError("History of '" + it.key() + "' in '" + key +
                                    "' must contain numbers");
                }
                values.push_back(v.get<double>());
            }
        }
        return history;
    }

    MetricHistory& phase_metrics(const std::string& phase) {
        if (phase == "train") return train_metrics_;
        if (phase == "validation") return validation_metrics_;
        throw ValueError("Unknown phase '" + phase + "'");
    }

    ClassMetricHistory& phase_class_metrics(const std::string& phase) {
        if (phase == "train") return train_class_metrics_;
        if (phase == "validation") return validation_class_metrics_;
        throw ValueError("Unknown phase '" + phase + "'");
    }

    const ClassMetricHistory& phase_class_metrics(const std::string& phase) const {
        if (phase == "train") return train_class_metrics_;
        if (phase == "validation") return validation_class_metrics_;
        throw ValueError("Unknown phase '" + phase + "'");
    }

    const MetricHistory& phase_metrics(const std::string& phase) const {
        if (phase == "train") return train_metrics_;
        if (phase == "validation") return validation_metrics_;
        throw ValueError("Unknown phase '" + phase + "'");
    }

    void finish_phase(long long epoch, const std::string& phase, double loss,
                      const metrics::ConfusionMatrix& confusion,
                      const std::vector<std::string>& class_names) {
        MetricHistory& histories = phase_metrics(phase);
        for (auto& entry : histories) {
            entry.second.push_back(metrics::metric_value(entry.first, confusion, loss));
        }
        for (auto& entry : phase_class_metrics(phase)) {
            entry.second.push_back(metrics::per_class_value(entry.first, confusion));
        }

        if (verbose) {
            log_phase(phase, loss, confusion, class_names);
        }

        if (on_epoch_end) {
            on_epoch_end(EpochReport{epoch, phase, loss, confusion});
        }
    }

    void log_phase(const std::string& phase, double loss,
                   const metrics::ConfusionMatrix& confusion,
                   const std::vector<std::string>& class_names) const {
        const MetricHistory& histories = phase_metrics(phase);

        std::cout << std::fixed << std::setprecision(4)
                  << "  " << phase
                  << " | Loss: " << loss
                  << " | Accuracy: " << metrics::accuracy(confusion);
        for (const auto& entry : histories) {
            if (entry.first == "loss" || entry.first == "accuracy") continue;
            std::cout << " | " << entry.first << ": " << entry.second.back();
        }
        std::cout << std::endl;

        bool per_class = histories.count("precision") || histories.count("recall") ||
                         histories.count("f1_score");
        if (!per_class) return;

        auto precision = metrics::precision(confusion);
        auto recall = metrics::recall(confusion);
        auto f1 = metrics::f1_score(confusion);

        std::cout << "    " << std::left << std::setw(16) << "Class"
                  << std::right << std::setw(10) << "Precision"
                  << std::setw(10) << "Recall"
                  << std::setw(10) << "F1" << std::endl;
        for (size_t c = 0; c < precision.size(); ++c) {
            std::string name = c < class_names.size() ? class_names[c] : std::to_string(c);
            std::cout << "    " << std::left << std::setw(16) << name
                      << std::right << std::setw(10) << precision[c]
                      << std::setw(10) << recall[c]
                      << std::setw(10) << f1[c] << std::endl;
        }
        std::cout << std::defaultfloat;
    }
};

}  // namespace seqnet
