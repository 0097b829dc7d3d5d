// Image Decoding
// Decoder for image files (PNG, JPEG, ...) backed by OpenCV imgcodecs.

#pragma once

#include <seqnet/data/decode.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace seqnet {
namespace data {

// Pixel values are kept in their stored range (0-255 for 8-bit images).
// Single-channel images decode to {H, W}, others to {H, W, C}.
inline Tensor<float> decode_image(const fs::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        throw DecodeError("Could not read image " + path.string());
    }

    cv::Mat float_img;
    img.convertTo(float_img, CV_MAKETYPE(CV_32F, img.channels()));
    if (!float_img.isContinuous()) {
        float_img = float_img.clone();
    }

    size_t rows = static_cast<size_t>(float_img.rows);
    size_t cols = static_cast<size_t>(float_img.cols);
    size_t channels = static_cast<size_t>(float_img.channels());

    Shape shape = channels == 1 ? Shape{rows, cols} : Shape{rows, cols, channels};
    const float* pixels = float_img.ptr<float>(0);
    return Tensor<float>(shape, std::vector<float>(pixels, pixels + rows * cols * channels));
}

}  // namespace data
}  // namespace seqnet
