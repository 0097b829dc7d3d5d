// Loss Functions
// Cross entropy over raw logits with an explicit forward-then-backward contract

#pragma once

#include <seqnet/nn/functional.hpp>
#include <seqnet/json_fields.hpp>
#include <seqnet/tensor.hpp>
#include <seqnet/error.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace seqnet {
namespace nn {

// How per-sample losses collapse into one scalar
enum class Reduction {
    Mean,
    Sum
};

inline float reduce_mean(const std::vector<float>& losses) {
    float total = 0.0f;
    for (float l : losses) total += l;
    return total / static_cast<float>(losses.size());
}

inline float reduce_sum(const std::vector<float>& losses) {
    float total = 0.0f;
    for (float l : losses) total += l;
    return total;
}

inline float reduce_losses(Reduction reduction, const std::vector<float>& losses) {
    switch (reduction) {
        case Reduction::Mean: return reduce_mean(losses);
        case Reduction::Sum: return reduce_sum(losses);
    }
    throw ValueError("Unknown reduction");
}

inline Reduction parse_reduction(const std::string& name) {
    if (name == "mean") return Reduction::Mean;
    if (name == "sum") return Reduction::Sum;
    throw ValueError("Unknown reduction '" + name + "'; expected mean or sum");
}

inline std::string to_string(Reduction reduction) {
    return reduction == Reduction::Mean ? "mean" : "sum";
}

// Cross Entropy Loss
// Combines a numerically stable log_softmax with the negative log likelihood.
// forward() caches probabilities and targets; backward() reads them and may be
// called any number of times until the next forward().
class CrossEntropyLoss {
public:
    explicit CrossEntropyLoss(Reduction reduction = Reduction::Mean)
        : reduction_(reduction) {}

    explicit CrossEntropyLoss(const std::string& reduction)
        : reduction_(parse_reduction(reduction)) {}

    // logits: {*, classes}, targets: one-hot, same number of elements
    float forward(const Tensor<float>& logits, const Tensor<float>& targets) {
        if (logits.empty()) {
            throw ValueError("CrossEntropyLoss: logits must not be empty");
        }
        if (targets.empty()) {
            throw ValueError("CrossEntropyLoss: targets must not be empty");
        }

        size_t classes = logits.shape().back();
        if (targets.numel() % classes != 0 ||
            targets.numel() != logits.numel()) {
            throw ValueError("CrossEntropyLoss: targets " + detail::shape_str(targets.shape()) +
                             " do not match logits " + detail::shape_str(logits.shape()));
        }

        Tensor<float> rows = logits.as_rows(classes);
        Tensor<float> target_rows = targets.as_rows(classes);
        Tensor<float> log_probs = functional::log_softmax(rows);

        std::vector<float> per_sample(rows.size(0));
        for (size_t r = 0; r < per_sample.size(); ++r) {
            float loss = 0.0f;
            for (size_t c = 0; c < classes; ++c) {
                loss -= target_rows(r, c) * log_probs(r, c);
            }
            per_sample[r] = loss;
        }

        cache_ = Cache{functional::softmax(logits),
                       target_rows.reshape(logits.shape()),
                       logits.ndim() > 1};
        return reduce_losses(reduction_, per_sample);
    }

    // labels: one class index per row of logits
    float forward(const Tensor<float>& logits, const std::vector<int>& labels) {
        if (logits.empty()) {
            throw ValueError("CrossEntropyLoss: logits must not be empty");
        }
        if (labels.empty()) {
            throw ValueError("CrossEntropyLoss: targets must not be empty");
        }
        return forward(logits, functional::one_hot(labels, logits.shape().back()));
    }

    template<typename Targets>
    float operator()(const Tensor<float>& logits, const Targets& targets) {
        return forward(logits, targets);
    }

    // dLoss/dLogits = probabilities - targets, divided by the batch size
    // for a batched input under mean reduction.
    Tensor<float> backward() const {
        if (!cache_) {
            throw StateError("CrossEntropyLoss: forward must be called before backward");
        }

        Tensor<float> grad = cache_->probabilities - cache_->targets;
        if (reduction_ == Reduction::Sum || !cache_->batched) {
            return grad;
        }
        return grad / static_cast<float>(cache_->probabilities.size(0));
    }

    Reduction reduction() const { return reduction_; }

    // Probabilities cached by the last forward()
    const Tensor<float>& probabilities() const {
        if (!cache_) {
            throw StateError("CrossEntropyLoss: no forward pass yet");
        }
        return cache_->probabilities;
    }

    nlohmann::json to_json() const {
        return {{"class", "CrossEntropyLoss"}, {"reduction", to_string(reduction_)}};
    }

    static CrossEntropyLoss from_json(const nlohmann::json& j) {
        detail::check_class(j, "CrossEntropyLoss");
        return CrossEntropyLoss(parse_reduction(detail::json_string(j, "reduction")));
    }

    bool operator==(const CrossEntropyLoss& other) const {
        return reduction_ == other.reduction_;
    }

    bool operator!=(const CrossEntropyLoss& other) const {
        return !(*this == other);
    }

private:
    struct Cache {
        Tensor<float> probabilities;  // same shape as the logits
        Tensor<float> targets;        // expanded to the logits' shape
        bool batched;
    };

    Reduction reduction_;
    std::optional<Cache> cache_;
};

}  // namespace nn
}  // namespace seqnet
