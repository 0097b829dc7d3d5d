// Dropout Layer
// Randomly zero elements with probability p while training.
// Uses inverted dropout: survivors are scaled by 1/(1-p), so eval mode is the identity.

#pragma once

#include <seqnet/nn/layer.hpp>
#include <seqnet/json_fields.hpp>
#include <seqnet/random.hpp>
#include <optional>

namespace seqnet::nn {

class Dropout : public Layer {
public:
    Dropout(size_t channels, float p, Generator gen)
        : channels_(channels), p_(p), gen_(gen) {
        if (channels_ == 0) {
            throw ValueError("Dropout: channels must be a positive integer");
        }
        if (!(p_ >= 0.0f && p_ < 1.0f)) {
            throw ValueError("Dropout: p must be in [0, 1), got " + std::to_string(p_));
        }
    }

    Tensor<float> forward(const Tensor<float>& input) override {
        check_trailing_dim(input, channels_, "Dropout");

        Tensor<float> mask = Tensor<float>::full(input.shape(), 1.0f);
        if (!is_eval() && p_ > 0.0f) {
            float scale = 1.0f / (1.0f - p_);
            for (size_t i = 0; i < mask.numel(); ++i) {
                mask[i] = gen_.uniform() >= p_ ? scale : 0.0f;
            }
        }

        mask_ = std::move(mask);
        return input * *mask_;
    }

    Tensor<float> update(const Tensor<float>& output_gradient, float learning_rate) override {
        (void)learning_rate;
        if (!mask_) {
            throw StateError("Dropout: update called before forward");
        }
        if (output_gradient.shape() != mask_->shape()) {
            throw ShapeError("Dropout: gradient " + detail::shape_str(output_gradient.shape()) +
                             " does not match last output " + detail::shape_str(mask_->shape()));
        }
        return output_gradient * *mask_;
    }

    size_t in_channels() const override { return channels_; }
    size_t out_channels() const override { return channels_; }
    std::string class_name() const override { return "Dropout"; }

    float p() const { return p_; }

    nlohmann::json to_json() const override {
        return {{"class", class_name()}, {"channels", channels_}, {"p", p_}, {"seed", gen_.seed()}};
    }

    static Dropout from_json(const nlohmann::json& j) {
        detail::check_class(j, "Dropout");
        return Dropout(detail::json_size(j, "channels"),
                       static_cast<float>(detail::json_number(j, "p")),
                       Generator(detail::json_uint32(j, "seed")));
    }

    bool equals(const Layer& other) const override {
        const auto* o = dynamic_cast<const Dropout*>(&other);
        return o != nullptr && channels_ == o->channels_ && p_ == o->p_;
    }

private:
    size_t channels_;
    float p_;
    Generator gen_;
    std::optional<Tensor<float>> mask_;
};

}  // namespace seqnet::nn
