// Layer Base Class
// Every element of a Model's sequential chain derives from Layer.

#pragma once

#include <seqnet/tensor.hpp>
#include <seqnet/error.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <string>

namespace seqnet::nn {

class Layer {
public:
    virtual ~Layer() = default;

    // Transform a batch; caches whatever update() needs (one slot, overwritten
    // by every call).
    virtual Tensor<float> forward(const Tensor<float>& input) = 0;

    // Consume dLoss/dOutput of the last forward(), apply the parameter step
    // in place and return dLoss/dInput. Throws StateError before any forward().
    virtual Tensor<float> update(const Tensor<float>& output_gradient, float learning_rate) = 0;

    virtual size_t in_channels() const = 0;
    virtual size_t out_channels() const = 0;

    // Variant name, also the "class" discriminator of the JSON form
    virtual std::string class_name() const = 0;

    virtual nlohmann::json to_json() const = 0;

    // Same variant, same configuration, same parameters
    virtual bool equals(const Layer& other) const = 0;

    virtual size_t num_parameters() const { return 0; }

    // Evaluation mode; setting the current value again is a no-op
    void set_eval(bool eval) {
        if (eval_ == eval) return;
        eval_ = eval;
    }

    bool is_eval() const { return eval_; }

protected:
    static void check_learning_rate(float learning_rate, const std::string& who) {
        if (!(learning_rate > 0.0f) || !std::isfinite(learning_rate)) {
            throw ValueError(who + ": learning_rate must be a positive finite number");
        }
    }

    static void check_trailing_dim(const Tensor<float>& input, size_t expected,
                                   const std::string& who) {
        if (input.empty() || input.shape().back() != expected) {
            throw ShapeError(who + ": input " + detail::shape_str(input.shape()) +
                             " must have trailing dimension " + std::to_string(expected));
        }
    }

private:
    bool eval_ = false;
};

inline bool operator==(const Layer& a, const Layer& b) {
    return a.equals(b);
}

inline bool operator!=(const Layer& a, const Layer& b) {
    return !a.equals(b);
}

}  // namespace seqnet::nn
