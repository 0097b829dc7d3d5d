// Functional helpers
// Row-wise softmax / log-softmax, one-hot encoding and argmax over the last dimension

#pragma once

#include <seqnet/tensor.hpp>
#include <seqnet/error.hpp>
#include <cmath>
#include <vector>

namespace seqnet::nn::functional {

// Softmax: exp(x - max) / sum(exp(x - max)), row-wise over the last dimension
inline Tensor<float> softmax(const Tensor<float>& x) {
    if (x.empty()) {
        throw ValueError("softmax: empty input");
    }

    size_t classes = x.shape().back();
    size_t rows = x.numel() / classes;

    Tensor<float> out(x.shape());
    const float* in = x.data();
    float* o = out.data();

    for (size_t r = 0; r < rows; ++r) {
        size_t offset = r * classes;

        float max_val = in[offset];
        for (size_t c = 1; c < classes; ++c) {
            max_val = std::max(max_val, in[offset + c]);
        }

        float sum_exp = 0.0f;
        for (size_t c = 0; c < classes; ++c) {
            o[offset + c] = std::exp(in[offset + c] - max_val);
            sum_exp += o[offset + c];
        }

        for (size_t c = 0; c < classes; ++c) {
            o[offset + c] /= sum_exp;
        }
    }

    return out;
}

// log_softmax(x) = (x - max) - log(sum(exp(x - max)))
// Never computed as log(softmax(x)): a probability that underflows to 0
// would otherwise turn into -inf.
inline Tensor<float> log_softmax(const Tensor<float>& x) {
    if (x.empty()) {
        throw ValueError("log_softmax: empty input");
    }

    size_t classes = x.shape().back();
    size_t rows = x.numel() / classes;

    Tensor<float> out(x.shape());
    const float* in = x.data();
    float* o = out.data();

    for (size_t r = 0; r < rows; ++r) {
        size_t offset = r * classes;

        float max_val = in[offset];
        for (size_t c = 1; c < classes; ++c) {
            max_val = std::max(max_val, in[offset + c]);
        }

        float sum_exp = 0.0f;
        for (size_t c = 0; c < classes; ++c) {
            sum_exp += std::exp(in[offset + c] - max_val);
        }
        float log_sum_exp = std::log(sum_exp);

        for (size_t c = 0; c < classes; ++c) {
            o[offset + c] = (in[offset + c] - max_val) - log_sum_exp;
        }
    }

    return out;
}

// One-hot encode class indices into {labels.size(), num_classes}
inline Tensor<float> one_hot(const std::vector<int>& labels, size_t num_classes) {
    if (labels.empty()) {
        throw ValueError("one_hot: empty label list");
    }
    if (num_classes == 0) {
        throw ValueError("one_hot: num_classes must be positive");
    }

    Tensor<float> out({labels.size(), num_classes});
    for (size_t i = 0; i < labels.size(); ++i) {
        int label = labels[i];
        if (label < 0 || static_cast<size_t>(label) >= num_classes) {
            throw ValueError("one_hot: label " + std::to_string(label) +
                             " outside [0, " + std::to_string(num_classes) + ")");
        }
        out(i, static_cast<size_t>(label)) = 1.0f;
    }
    return out;
}

// Index of the largest value in each row of the last dimension
inline std::vector<int> argmax(const Tensor<float>& x) {
    if (x.empty()) {
        throw ValueError("argmax: empty input");
    }

    size_t classes = x.shape().back();
    size_t rows = x.numel() / classes;

    std::vector<int> result(rows);
    const float* in = x.data();
    for (size_t r = 0; r < rows; ++r) {
        size_t best = 0;
        for (size_t c = 1; c < classes; ++c) {
            if (in[r * classes + c] > in[r * classes + best]) best = c;
        }
        result[r] = static_cast<int>(best);
    }
    return result;
}

}  // namespace seqnet::nn::functional
