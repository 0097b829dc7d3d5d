// Dense (Linear) Layer
// Fully connected layer: y = xW + b, W of shape {in_channels, out_channels}

#pragma once

#include <seqnet/nn/layer.hpp>
#include <seqnet/json_fields.hpp>
#include <seqnet/random.hpp>
#include <cmath>
#include <optional>

namespace seqnet::nn {

class Linear : public Layer {
public:
    Linear(size_t in_channels, size_t out_channels, Generator& gen)
        : in_channels_(check_channels(in_channels, "in_channels"))
        , out_channels_(check_channels(out_channels, "out_channels"))
        , weights_(init_weights(in_channels, out_channels, gen))
        , bias_(Tensor<float>::zeros({out_channels})) {}

    Linear(size_t in_channels, size_t out_channels, Generator&& gen)
        : Linear(in_channels, out_channels, gen) {}

    Linear(size_t in_channels, size_t out_channels, uint32_t seed = SEQNET_DEFAULT_SEED)
        : Linear(in_channels, out_channels, Generator(seed)) {}

    // Construct from existing parameters
    Linear(Tensor<float> weights, Tensor<float> bias)
        : in_channels_(weights.ndim() == 2 ? weights.size(0) : 0)
        , out_channels_(weights.ndim() == 2 ? weights.size(1) : 0)
        , weights_(std::move(weights))
        , bias_(std::move(bias)) {
        if (weights_.ndim() != 2 || in_channels_ == 0 || out_channels_ == 0) {
            throw ValueError("Linear: weights must be a non-empty {in, out} matrix, got " +
                             detail::shape_str(weights_.shape()));
        }
        if (bias_.shape() != Shape{out_channels_}) {
            throw ValueError("Linear: bias " + detail::shape_str(bias_.shape()) +
                             " does not match out_channels " + std::to_string(out_channels_));
        }
    }

    // input: {*, in_channels}
    // output: {*, out_channels}
    Tensor<float> forward(const Tensor<float>& input) override {
        check_trailing_dim(input, in_channels_, "Linear");

        Tensor<float> rows = input.as_rows(in_channels_);
        Tensor<float> out = matmul(rows, weights_);

        size_t batch = out.size(0);
        for (size_t b = 0; b < batch; ++b) {
            for (size_t f = 0; f < out_channels_; ++f) {
                out(b, f) += bias_[f];
            }
        }

        Shape out_shape = input.shape();
        out_shape.back() = out_channels_;

        cache_ = Cache{std::move(rows), input.shape(), out_shape};
        return out.reshape(out_shape);
    }

    Tensor<float> update(const Tensor<float>& output_gradient, float learning_rate) override {
        if (!cache_) {
            throw StateError("Linear: update called before forward");
        }
        check_learning_rate(learning_rate, "Linear");
        if (output_gradient.shape() != cache_->output_shape) {
            throw ShapeError("Linear: gradient " + detail::shape_str(output_gradient.shape()) +
                             " does not match last output " +
                             detail::shape_str(cache_->output_shape));
        }

        Tensor<float> grad = output_gradient.as_rows(out_channels_);

        // The incoming gradient is already batch-normalized by the loss,
        // so the parameter gradients are plain sums over the batch.
        weight_grad_ = matmul(cache_->input.transpose(), grad);
        bias_grad_ = grad.sum(0);
        Tensor<float> input_grad = matmul(grad, weights_.transpose());

        weights_.sub_scaled_(*weight_grad_, learning_rate);
        bias_.sub_scaled_(*bias_grad_, learning_rate);

        return input_grad.reshape(cache_->input_shape);
    }

    size_t in_channels() const override { return in_channels_; }
    size_t out_channels() const override { return out_channels_; }
    std::string class_name() const override { return "Linear"; }

    size_t num_parameters() const override {
        return weights_.numel() + bias_.numel();
    }

    Tensor<float>& weights() { return weights_; }
    const Tensor<float>& weights() const { return weights_; }
    Tensor<float>& bias() { return bias_; }
    const Tensor<float>& bias() const { return bias_; }

    // Gradients computed by the most recent update()
    const Tensor<float>& weight_grad() const {
        if (!weight_grad_) throw StateError("Linear: no gradient computed yet");
        return *weight_grad_;
    }

    const Tensor<float>& bias_grad() const {
        if (!bias_grad_) throw StateError("Linear: no gradient computed yet");
        return *bias_grad_;
    }

    nlohmann::json to_json() const override {
        return {
            {"class", class_name()},
            {"in_channels", in_channels_},
            {"out_channels", out_channels_},
            {"weights", detail::matrix_to_json(weights_)},
            {"bias", detail::vector_to_json(bias_)}
        };
    }

    static Linear from_json(const nlohmann::json& j) {
        detail::check_class(j, "Linear");
        size_t in = detail::json_size(j, "in_channels");
        size_t out = detail::json_size(j, "out_channels");
        check_channels(in, "in_channels");
        check_channels(out, "out_channels");
        return Linear(detail::matrix_from_json(j, "weights", in, out),
                      detail::vector_from_json(j, "bias", out));
    }

    bool equals(const Layer& other) const override {
        const auto* o = dynamic_cast<const Linear*>(&other);
        return o != nullptr && weights_ == o->weights_ && bias_ == o->bias_;
    }

private:
    struct Cache {
        Tensor<float> input;   // {batch, in_channels}
        Shape input_shape;
        Shape output_shape;
    };

    size_t in_channels_;
    size_t out_channels_;
    Tensor<float> weights_;
    Tensor<float> bias_;
    std::optional<Cache> cache_;
    std::optional<Tensor<float>> weight_grad_;
    std::optional<Tensor<float>> bias_grad_;

    static size_t check_channels(size_t channels, const char* name) {
        if (channels == 0) {
            throw ValueError(std::string("Linear: ") + name + " must be a positive integer");
        }
        return channels;
    }

    // N(0, 1) / sqrt(in_channels) keeps pre-activations near unit variance
    static Tensor<float> init_weights(size_t in_channels, size_t out_channels, Generator& gen) {
        Tensor<float> w({in_channels, out_channels});
        gen.fill_normal(w.data(), w.numel(), 0.0f,
                        1.0f / std::sqrt(static_cast<float>(in_channels)));
        return w;
    }
};

}  // namespace seqnet::nn
