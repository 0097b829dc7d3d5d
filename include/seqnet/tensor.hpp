#pragma once

#include <vector>
#include <initializer_list>
#include <cstddef>
#include <cmath>
#include <string>
#include <algorithm>
#include <numeric>
#include <functional>
#include <limits>

#include <seqnet/error.hpp>
#include <seqnet/random.hpp>

namespace seqnet {

using Shape = std::vector<size_t>;

namespace detail {

// Compute total number of elements
inline size_t compute_numel(const Shape& shape) {
    if (shape.empty()) return 0;
    return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<size_t>());
}

// Normalize negative dimension
inline size_t normalize_dim(int dim, size_t ndim) {
    int d = dim < 0 ? dim + static_cast<int>(ndim) : dim;
    if (d < 0 || d >= static_cast<int>(ndim)) {
        throw ValueError("Dimension " + std::to_string(dim) +
                         " out of range for " + std::to_string(ndim) + "-D tensor");
    }
    return static_cast<size_t>(d);
}

inline std::string shape_str(const Shape& shape) {
    std::string s = "{";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + "}";
}

}  // namespace detail

// Dense, contiguous, row-major tensor with value semantics.
// An empty shape means an empty tensor (no elements).
template<typename T>
class Tensor {
public:
    Tensor() = default;

    // Construct with shape (zero-filled)
    explicit Tensor(const Shape& shape)
        : shape_(shape), data_(detail::compute_numel(shape), T{0}) {}

    // Construct with shape and flat row-major data
    Tensor(const Shape& shape, std::vector<T> data)
        : shape_(shape), data_(std::move(data)) {
        if (data_.size() != detail::compute_numel(shape_)) {
            throw ShapeError("Tensor: " + std::to_string(data_.size()) +
                             " values do not fill shape " + detail::shape_str(shape_));
        }
    }

    Tensor(const Shape& shape, std::initializer_list<T> data)
        : Tensor(shape, std::vector<T>(data)) {}

    // Static factories
    static Tensor zeros(const Shape& shape) {
        return Tensor(shape);
    }

    static Tensor full(const Shape& shape, T value) {
        Tensor t(shape);
        t.fill_(value);
        return t;
    }

    static Tensor randn(const Shape& shape, Generator& gen) {
        Tensor t(shape);
        gen.fill_normal(t.data(), t.numel(), 0.0f, 1.0f);
        return t;
    }

    // Properties
    const Shape& shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    size_t numel() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    size_t size(int dim) const {
        return shape_[detail::normalize_dim(dim, ndim())];
    }

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }

    const std::vector<T>& values() const { return data_; }

    // Flat element access
    T& operator[](size_t i) { return data_[i]; }
    const T& operator[](size_t i) const { return data_[i]; }

    // 2-D element access without bounds checking
    T& operator()(size_t row, size_t col) { return data_[row * shape_[1] + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * shape_[1] + col]; }

    // Element access with bounds checking
    T& at(const std::vector<size_t>& indices) {
        return data_[offset_of(indices)];
    }

    const T& at(const std::vector<size_t>& indices) const {
        return data_[offset_of(indices)];
    }

    // Reshape (copies; numel must match)
    Tensor reshape(const Shape& new_shape) const {
        if (detail::compute_numel(new_shape) != numel()) {
            throw ShapeError("reshape: cannot view " + detail::shape_str(shape_) +
                             " as " + detail::shape_str(new_shape));
        }
        Tensor result;
        result.shape_ = new_shape;
        result.data_ = data_;
        return result;
    }

    // View as {numel / cols, cols}
    Tensor as_rows(size_t cols) const {
        if (cols == 0 || numel() % cols != 0) {
            throw ShapeError("as_rows: " + std::to_string(numel()) +
                             " elements do not split into rows of " + std::to_string(cols));
        }
        return reshape({numel() / cols, cols});
    }

    // 2-D transpose
    Tensor transpose() const {
        require_2d("transpose");
        size_t rows = shape_[0];
        size_t cols = shape_[1];
        Tensor result({cols, rows});
        for (size_t i = 0; i < rows; ++i) {
            for (size_t j = 0; j < cols; ++j) {
                result(j, i) = (*this)(i, j);
            }
        }
        return result;
    }

    // Reductions along one dimension (dimension removed)
    Tensor sum(int dim) const {
        return reduce_op(dim, [](T a, T b) { return a + b; }, T{0});
    }

    Tensor max(int dim) const {
        return reduce_op(dim, [](T a, T b) { return (a > b) ? a : b; },
                         std::numeric_limits<T>::lowest());
    }

    // Sum of every element
    T total() const {
        T acc = T{0};
        for (const T& v : data_) acc += v;
        return acc;
    }

    // Element-wise operations (shapes must match exactly)
    Tensor operator+(const Tensor& other) const {
        return binary_op(other, [](T a, T b) { return a + b; }, "add");
    }

    Tensor operator-(const Tensor& other) const {
        return binary_op(other, [](T a, T b) { return a - b; }, "sub");
    }

    Tensor operator*(const Tensor& other) const {
        return binary_op(other, [](T a, T b) { return a * b; }, "mul");
    }

    // Scalar operations
    Tensor operator+(T scalar) const {
        return unary_op([scalar](T a) { return a + scalar; });
    }

    Tensor operator-(T scalar) const {
        return unary_op([scalar](T a) { return a - scalar; });
    }

    Tensor operator*(T scalar) const {
        return unary_op([scalar](T a) { return a * scalar; });
    }

    Tensor operator/(T scalar) const {
        return unary_op([scalar](T a) { return a / scalar; });
    }

    template<typename F>
    Tensor map(F&& func) const {
        return unary_op(std::forward<F>(func));
    }

    // In-place operations
    Tensor& fill_(T value) {
        std::fill(data_.begin(), data_.end(), value);
        return *this;
    }

    // this -= alpha * other
    Tensor& sub_scaled_(const Tensor& other, T alpha) {
        check_same_shape(other, "sub_scaled_");
        for (size_t i = 0; i < data_.size(); ++i) data_[i] -= alpha * other.data_[i];
        return *this;
    }

    // Exact comparison of shape and values
    bool operator==(const Tensor& other) const {
        return shape_ == other.shape_ && data_ == other.data_;
    }

    bool operator!=(const Tensor& other) const {
        return !(*this == other);
    }

    bool allclose(const Tensor& other, T rtol = T(1e-5), T atol = T(1e-6)) const {
        if (shape_ != other.shape_) return false;
        for (size_t i = 0; i < data_.size(); ++i) {
            T diff = std::abs(data_[i] - other.data_[i]);
            if (diff > atol + rtol * std::abs(other.data_[i])) return false;
        }
        return true;
    }

private:
    Shape shape_;
    std::vector<T> data_;

    size_t offset_of(const std::vector<size_t>& indices) const {
        if (indices.size() != ndim()) {
            throw ValueError("at: expected " + std::to_string(ndim()) +
                             " indices, got " + std::to_string(indices.size()));
        }
        size_t offset = 0;
        for (size_t i = 0; i < indices.size(); ++i) {
            if (indices[i] >= shape_[i]) {
                throw ValueError("at: index " + std::to_string(indices[i]) +
                                 " out of bounds for dimension " + std::to_string(i));
            }
            offset = offset * shape_[i] + indices[i];
        }
        return offset;
    }

    void require_2d(const char* op) const {
        if (ndim() != 2) {
            throw ShapeError(std::string(op) + ": expected 2-D tensor, got " +
                             detail::shape_str(shape_));
        }
    }

    void check_same_shape(const Tensor& other, const char* op) const {
        if (shape_ != other.shape_) {
            throw ShapeError(std::string(op) + ": shape " + detail::shape_str(shape_) +
                             " does not match " + detail::shape_str(other.shape_));
        }
    }

    template<typename F>
    Tensor unary_op(F&& func) const {
        Tensor result;
        result.shape_ = shape_;
        result.data_.resize(data_.size());
        for (size_t i = 0; i < data_.size(); ++i) {
            result.data_[i] = func(data_[i]);
        }
        return result;
    }

    template<typename F>
    Tensor binary_op(const Tensor& other, F&& func, const char* op) const {
        check_same_shape(other, op);
        Tensor result;
        result.shape_ = shape_;
        result.data_.resize(data_.size());
        for (size_t i = 0; i < data_.size(); ++i) {
            result.data_[i] = func(data_[i], other.data_[i]);
        }
        return result;
    }

    // Reduce one dimension: view as {outer, len, inner}
    template<typename F>
    Tensor reduce_op(int dim, F&& func, T init) const {
        size_t d = detail::normalize_dim(dim, ndim());

        size_t outer = 1;
        for (size_t i = 0; i < d; ++i) outer *= shape_[i];
        size_t len = shape_[d];
        size_t inner = 1;
        for (size_t i = d + 1; i < ndim(); ++i) inner *= shape_[i];

        Shape result_shape;
        for (size_t i = 0; i < ndim(); ++i) {
            if (i != d) result_shape.push_back(shape_[i]);
        }
        if (result_shape.empty()) result_shape.push_back(1);

        Tensor result = Tensor::full(result_shape, init);
        for (size_t o = 0; o < outer; ++o) {
            for (size_t l = 0; l < len; ++l) {
                for (size_t in = 0; in < inner; ++in) {
                    T& acc = result.data_[o * inner + in];
                    acc = func(acc, data_[(o * len + l) * inner + in]);
                }
            }
        }
        return result;
    }

    template<typename U> friend class Tensor;
};

// Free functions

template<typename T>
Tensor<T> matmul(const Tensor<T>& a, const Tensor<T>& b) {
    if (a.ndim() != 2 || b.ndim() != 2) {
        throw ShapeError("matmul requires 2-D tensors, got " +
                         detail::shape_str(a.shape()) + " and " + detail::shape_str(b.shape()));
    }
    if (a.size(1) != b.size(0)) {
        throw ShapeError("matmul: inner dimensions must match, got " +
                         detail::shape_str(a.shape()) + " and " + detail::shape_str(b.shape()));
    }

    size_t M = a.size(0);
    size_t K = a.size(1);
    size_t N = b.size(1);

    Tensor<T> result = Tensor<T>::zeros({M, N});

    // i-k-j order keeps the inner loop contiguous in both b and result
    for (size_t i = 0; i < M; ++i) {
        for (size_t k = 0; k < K; ++k) {
            T aik = a(i, k);
            for (size_t j = 0; j < N; ++j) {
                result(i, j) += aik * b(k, j);
            }
        }
    }

    return result;
}

// Stack equally-shaped tensors along a new leading dimension
template<typename T>
Tensor<T> stack(const std::vector<Tensor<T>>& tensors) {
    if (tensors.empty()) {
        throw ValueError("stack: empty tensor list");
    }

    const Shape& item_shape = tensors.front().shape();
    Shape result_shape;
    result_shape.push_back(tensors.size());
    result_shape.insert(result_shape.end(), item_shape.begin(), item_shape.end());

    std::vector<T> values;
    values.reserve(detail::compute_numel(result_shape));
    for (const auto& t : tensors) {
        if (t.shape() != item_shape) {
            throw ShapeError("stack: shape " + detail::shape_str(t.shape()) +
                             " does not match " + detail::shape_str(item_shape));
        }
        values.insert(values.end(), t.values().begin(), t.values().end());
    }
    return Tensor<T>(result_shape, std::move(values));
}

template<typename T>
Tensor<T> operator*(T scalar, const Tensor<T>& t) {
    return t * scalar;
}

}  // namespace seqnet
