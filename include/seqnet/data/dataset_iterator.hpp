// Dataset Iterator
// Deterministic, restartable, lazy batch producer over a fixed list of sample files

#pragma once

#include <seqnet/data/decode.hpp>
#include <seqnet/data/transforms.hpp>
#include <seqnet/tensor.hpp>
#include <seqnet/random.hpp>
#include <seqnet/error.hpp>
#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace seqnet {
namespace data {

// Class name (category directory) -> class index
using ClassIndex = std::map<std::string, int>;

// One collated batch: samples stacked along a new leading dimension
struct Batch {
    Tensor<float> data;       // {batch, *sample_shape}
    std::vector<int> labels;  // {batch}
};

class DatasetIterator {
public:
    // samples are copied; with shuffle they are permuted here, and again at
    // the start of every later pass.
    DatasetIterator(fs::path root,
                    std::vector<fs::path> samples,
                    std::vector<Transform> preprocessing,
                    ClassIndex class_to_index,
                    long long batch_size,
                    bool drop_last = false,
                    bool shuffle = true,
                    Generator gen = Generator(),
                    Decoder decoder = decode_tensor_file)
        : root_(std::move(root))
        , samples_(std::move(samples))
        , preprocessing_(std::move(preprocessing))
        , class_to_index_(std::move(class_to_index))
        , batch_size_(check_batch_size(batch_size))
        , drop_last_(drop_last)
        , shuffle_(shuffle)
        , gen_(gen)
        , decoder_(std::move(decoder)) {
        if (!decoder_) {
            throw ValueError("DatasetIterator: decoder must be callable");
        }
        if (shuffle_) {
            gen_.shuffle(samples_.begin(), samples_.end());
        }
    }

    // Range-for support. begin() starts a new pass.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Batch;
        using difference_type = std::ptrdiff_t;
        using pointer = const Batch*;
        using reference = const Batch&;

        Iterator() = default;

        explicit Iterator(DatasetIterator* owner) : owner_(owner) {
            current_ = owner_->next();
        }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            current_ = owner_->next();
            return *this;
        }

        bool operator==(const Iterator& other) const {
            return !current_.has_value() && !other.current_.has_value();
        }

        bool operator!=(const Iterator& other) const {
            return !(*this == other);
        }

    private:
        DatasetIterator* owner_ = nullptr;
        std::optional<Batch> current_;
    };

    Iterator begin() {
        reset();
        return Iterator(this);
    }

    Iterator end() {
        return Iterator();
    }

    // Rewind to the first batch (reshuffling if this pass consumed anything)
    void reset() {
        if (consumed_ && shuffle_) {
            gen_.shuffle(samples_.begin(), samples_.end());
        }
        next_batch_ = 0;
        consumed_ = false;
    }

    // Next batch of the current pass, or nothing once the pass is complete
    std::optional<Batch> next() {
        if (next_batch_ >= size()) {
            return std::nullopt;
        }

        size_t start = next_batch_ * batch_size_;
        size_t stop = std::min(start + batch_size_, samples_.size());
        consumed_ = true;

        std::vector<Tensor<float>> items;
        std::vector<int> labels;
        items.reserve(stop - start);
        labels.reserve(stop - start);

        for (size_t i = start; i < stop; ++i) {
            const fs::path& path = samples_[i];
            Tensor<float> sample = apply_transforms(preprocessing_, decoder_(path));

            if (sample.empty()) {
                throw ValueError("Preprocessing produced an empty sample for " + path.string());
            }
            if (!items.empty() && sample.shape() != items.front().shape()) {
                throw ValueError("Preprocessing produced shape " +
                                 seqnet::detail::shape_str(sample.shape()) + " for " +
                                 path.string() + ", expected " +
                                 seqnet::detail::shape_str(items.front().shape()));
            }

            items.push_back(std::move(sample));
            labels.push_back(label_of(path));
        }

        ++next_batch_;
        return Batch{stack(items), std::move(labels)};
    }

    // Number of batches in one pass
    size_t size() const {
        size_t n = samples_.size();
        return drop_last_ ? n / batch_size_ : (n + batch_size_ - 1) / batch_size_;
    }

    size_t num_samples() const { return samples_.size(); }
    size_t batch_size() const { return batch_size_; }
    bool drop_last() const { return drop_last_; }
    bool shuffle() const { return shuffle_; }

    // Samples in the order the current pass consumes them
    const std::vector<fs::path>& samples() const { return samples_; }
    const ClassIndex& class_to_index() const { return class_to_index_; }
    const std::vector<Transform>& preprocessing() const { return preprocessing_; }
    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    std::vector<fs::path> samples_;
    std::vector<Transform> preprocessing_;
    ClassIndex class_to_index_;
    size_t batch_size_;
    bool drop_last_;
    bool shuffle_;
    Generator gen_;
    Decoder decoder_;
    size_t next_batch_ = 0;
    bool consumed_ = false;

    static size_t check_batch_size(long long batch_size) {
        if (batch_size <= 0) {
            throw ValueError("batch_size must be a positive integer, got " +
                             std::to_string(batch_size));
        }
        return static_cast<size_t>(batch_size);
    }

    // The class is the first path component below root
    int label_of(const fs::path& path) const {
        fs::path relative = path.lexically_relative(root_);
        if (relative.empty() || *relative.begin() == "..") {
            throw ValueError("Sample " + path.string() + " is not under " + root_.string());
        }

        std::string category = relative.begin()->string();
        auto it = class_to_index_.find(category);
        if (it == class_to_index_.end()) {
            throw ValueError("Sample " + path.string() + " belongs to unknown class '" +
                             category + "'");
        }
        return it->second;
    }
};

}  // namespace data
}  // namespace seqnet
