// Activation Layers
// Parameter-free element-wise layers

#pragma once

#include <seqnet/nn/layer.hpp>
#include <seqnet/json_fields.hpp>
#include <optional>

namespace seqnet::nn {

// ReLU: max(0, x)
class ReLU : public Layer {
public:
    explicit ReLU(size_t channels) : channels_(channels) {
        if (channels_ == 0) {
            throw ValueError("ReLU: channels must be a positive integer");
        }
    }

    Tensor<float> forward(const Tensor<float>& input) override {
        check_trailing_dim(input, channels_, "ReLU");
        mask_ = input.map([](float x) { return x > 0.0f ? 1.0f : 0.0f; });
        return input * *mask_;
    }

    // Gradient passes only where the input was positive
    Tensor<float> update(const Tensor<float>& output_gradient, float learning_rate) override {
        (void)learning_rate;
        if (!mask_) {
            throw StateError("ReLU: update called before forward");
        }
        if (output_gradient.shape() != mask_->shape()) {
            throw ShapeError("ReLU: gradient " + detail::shape_str(output_gradient.shape()) +
                             " does not match last output " + detail::shape_str(mask_->shape()));
        }
        return output_gradient * *mask_;
    }

    size_t in_channels() const override { return channels_; }
    size_t out_channels() const override { return channels_; }
    std::string class_name() const override { return "ReLU"; }

    nlohmann::json to_json() const override {
        return {{"class", class_name()}, {"channels", channels_}};
    }

    static ReLU from_json(const nlohmann::json& j) {
        detail::check_class(j, "ReLU");
        return ReLU(detail::json_size(j, "channels"));
    }

    bool equals(const Layer& other) const override {
        const auto* o = dynamic_cast<const ReLU*>(&other);
        return o != nullptr && channels_ == o->channels_;
    }

private:
    size_t channels_;
    std::optional<Tensor<float>> mask_;
};

}  // namespace seqnet::nn
