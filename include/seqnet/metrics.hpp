// Classification Metrics
// Confusion matrix (rows = predicted class, columns = actual class) and
// the metrics derived from it.

#pragma once

#include <seqnet/tensor.hpp>
#include <seqnet/error.hpp>
#include <string>
#include <vector>

namespace seqnet {
namespace metrics {

using ConfusionMatrix = Tensor<int64_t>;

inline ConfusionMatrix new_confusion_matrix(size_t num_classes) {
    if (num_classes == 0) {
        throw ValueError("confusion matrix needs at least one class");
    }
    return ConfusionMatrix::zeros({num_classes, num_classes});
}

inline void add_to_confusion_matrix(ConfusionMatrix& matrix,
                                    const std::vector<int>& predicted,
                                    const std::vector<int>& actual) {
    if (predicted.size() != actual.size()) {
        throw ValueError("confusion matrix: " + std::to_string(predicted.size()) +
                         " predictions for " + std::to_string(actual.size()) + " labels");
    }

    size_t n = matrix.size(0);
    for (size_t i = 0; i < predicted.size(); ++i) {
        if (predicted[i] < 0 || static_cast<size_t>(predicted[i]) >= n ||
            actual[i] < 0 || static_cast<size_t>(actual[i]) >= n) {
            throw ValueError("confusion matrix: class index out of range");
        }
        ++matrix(static_cast<size_t>(predicted[i]), static_cast<size_t>(actual[i]));
    }
}

// Fraction of correct predictions; 0 for an empty matrix
inline double accuracy(const ConfusionMatrix& matrix) {
    int64_t total = matrix.total();
    if (total == 0) return 0.0;

    int64_t correct = 0;
    for (size_t i = 0; i < matrix.size(0); ++i) {
        correct += matrix(i, i);
    }
    return static_cast<double>(correct) / static_cast<double>(total);
}

// Per class: true positives / everything predicted as that class
inline std::vector<double> precision(const ConfusionMatrix& matrix) {
    size_t n = matrix.size(0);
    std::vector<double> result(n, 0.0);
    for (size_t c = 0; c < n; ++c) {
        int64_t predicted = 0;
        for (size_t a = 0; a < n; ++a) predicted += matrix(c, a);
        if (predicted > 0) {
            result[c] = static_cast<double>(matrix(c, c)) / static_cast<double>(predicted);
        }
    }
    return result;
}

// Per class: true positives / everything that actually is that class
inline std::vector<double> recall(const ConfusionMatrix& matrix) {
    size_t n = matrix.size(0);
    std::vector<double> result(n, 0.0);
    for (size_t c = 0; c < n; ++c) {
        int64_t actual = 0;
        for (size_t p = 0; p < n; ++p) actual += matrix(p, c);
        if (actual > 0) {
            result[c] = static_cast<double>(matrix(c, c)) / static_cast<double>(actual);
        }
    }
    return result;
}

inline std::vector<double> f1_score(const ConfusionMatrix& matrix) {
    auto p = precision(matrix);
    auto r = recall(matrix);
    std::vector<double> result(p.size(), 0.0);
    for (size_t c = 0; c < p.size(); ++c) {
        if (p[c] + r[c] > 0.0) {
            result[c] = 2.0 * p[c] * r[c] / (p[c] + r[c]);
        }
    }
    return result;
}

inline double macro_average(const std::vector<double>& per_class) {
    if (per_class.empty()) return 0.0;
    double total = 0.0;
    for (double v : per_class) total += v;
    return total / static_cast<double>(per_class.size());
}

// Names a Model may track in its metric histories
inline bool is_known_metric(const std::string& name) {
    return name == "loss" || name == "accuracy" || name == "precision" ||
           name == "recall" || name == "f1_score";
}

// Metrics with one value per class
inline bool is_per_class_metric(const std::string& name) {
    return name == "precision" || name == "recall" || name == "f1_score";
}

inline std::vector<double> per_class_value(const std::string& name, const ConfusionMatrix& matrix) {
    if (name == "precision") return precision(matrix);
    if (name == "recall") return recall(matrix);
    if (name == "f1_score") return f1_score(matrix);
    throw ValueError("Metric '" + name + "' has no per-class values");
}

// Scalar value of a tracked metric for one epoch; per-class metrics are
// macro-averaged
inline double metric_value(const std::string& name, const ConfusionMatrix& matrix, double loss) {
    if (name == "loss") return loss;
    if (name == "accuracy") return accuracy(matrix);
    if (is_per_class_metric(name)) return macro_average(per_class_value(name, matrix));
    throw ValueError("Unknown metric '" + name + "'");
}

}  // namespace metrics
}  // namespace seqnet
