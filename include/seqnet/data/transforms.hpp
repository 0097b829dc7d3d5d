// Preprocessing Transforms
// A preprocessing pipeline is an ordered list of unary tensor functions.

#pragma once

#include <seqnet/tensor.hpp>
#include <functional>
#include <vector>

namespace seqnet {
namespace data {

using Transform = std::function<Tensor<float>(const Tensor<float>&)>;

// Collapse a sample into a 1-D feature vector
inline Transform flatten() {
    return [](const Tensor<float>& x) {
        return x.reshape({x.numel()});
    };
}

// Multiply every value, e.g. scale(1.0f / 255.0f) for 8-bit images
inline Transform scale(float factor) {
    return [factor](const Tensor<float>& x) {
        return x * factor;
    };
}

inline Tensor<float> apply_transforms(const std::vector<Transform>& pipeline, Tensor<float> sample) {
    for (const auto& transform : pipeline) {
        sample = transform(sample);
    }
    return sample;
}

}  // namespace data
}  // namespace seqnet
