// Dataset Source
// Discovers labelled samples under a root directory and splits them into
// train and test subsets.
//
//   root/
//     <class_a>/...any depth.../sample.sqt
//     <class_b>/...
//
// Classes are the immediate subdirectories of root, sorted by name.

#pragma once

#include <seqnet/data/dataset_iterator.hpp>
#include <seqnet/data/decode.hpp>
#include <seqnet/data/transforms.hpp>
#include <seqnet/random.hpp>
#include <seqnet/error.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace seqnet {
namespace data {

struct SourceOptions {
    std::vector<std::string> extensions = {".sqt"};
    double train_fraction = 0.7;
    bool shuffle = true;
    uint32_t seed = SEQNET_DEFAULT_SEED;
};

class DatasetSource {
public:
    DatasetSource(fs::path root,
                  std::vector<Transform> preprocessing = {},
                  SourceOptions options = {},
                  Decoder decoder = decode_tensor_file)
        : root_(std::move(root))
        , preprocessing_(std::move(preprocessing))
        , extensions_(normalize_extensions(options.extensions))
        , train_fraction_(options.train_fraction)
        , gen_(options.seed)
        , decoder_(std::move(decoder)) {
        if (std::isnan(train_fraction_) || train_fraction_ < 0.0 || train_fraction_ > 1.0) {
            throw ValueError("train_fraction must be within [0, 1], got " +
                             std::to_string(train_fraction_));
        }
        if (!decoder_) {
            throw ValueError("DatasetSource: decoder must be callable");
        }

        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            throw ValueError("Dataset root is not a directory: " + root_.string());
        }

        discover_classes();
        std::vector<fs::path> files = discover_files();

        if (options.shuffle) {
            gen_.shuffle(files.begin(), files.end());
        }

        size_t split = split_index(train_fraction_, files.size());
        train_.assign(files.begin(), files.begin() + static_cast<std::ptrdiff_t>(split));
        test_.assign(files.begin() + static_cast<std::ptrdiff_t>(split), files.end());
    }

    // New iterator over the "train" or "test" subset
    DatasetIterator operator()(const std::string& name,
                               long long batch_size,
                               bool drop_last = false,
                               bool shuffle = true) {
        const std::vector<fs::path>* samples = nullptr;
        if (name == "train") {
            samples = &train_;
        } else if (name == "test") {
            samples = &test_;
        } else {
            throw ValueError("Invalid dataset name '" + name + "'. Expected 'train' or 'test'.");
        }

        return DatasetIterator(root_, *samples, preprocessing_, class_to_index_,
                               batch_size, drop_last, shuffle, gen_.fork(), decoder_);
    }

    const std::vector<std::string>& classes() const { return classes_; }
    const ClassIndex& class_to_index() const { return class_to_index_; }
    size_t num_classes() const { return classes_.size(); }

    const std::vector<fs::path>& train() const { return train_; }
    const std::vector<fs::path>& test() const { return test_; }

    const fs::path& root() const { return root_; }
    double train_fraction() const { return train_fraction_; }
    const std::vector<std::string>& extensions() const { return extensions_; }

    static size_t split_index(double train_fraction, size_t num_samples) {
        return static_cast<size_t>(std::floor(train_fraction * static_cast<double>(num_samples)));
    }

private:
    fs::path root_;
    std::vector<Transform> preprocessing_;
    std::vector<std::string> extensions_;
    double train_fraction_;
    Generator gen_;
    Decoder decoder_;

    std::vector<std::string> classes_;
    ClassIndex class_to_index_;
    std::vector<fs::path> train_;
    std::vector<fs::path> test_;

    // "png" and ".png" are both accepted
    static std::vector<std::string> normalize_extensions(const std::vector<std::string>& extensions) {
        std::vector<std::string> result;
        for (const auto& ext : extensions) {
            if (ext.empty()) {
                throw ValueError("File extensions must be non-empty");
            }
            result.push_back(ext[0] == '.' ? ext : "." + ext);
        }
        return result;
    }

    void discover_classes() {
        for (const auto& entry : fs::directory_iterator(root_)) {
            if (entry.is_directory()) {
                classes_.push_back(entry.path().filename().string());
            }
        }
        std::sort(classes_.begin(), classes_.end());

        for (size_t i = 0; i < classes_.size(); ++i) {
            class_to_index_[classes_[i]] = static_cast<int>(i);
        }
    }

    std::vector<fs::path> discover_files() const {
        std::vector<fs::path> files;
        for (const auto& entry : fs::recursive_directory_iterator(root_)) {
            if (!entry.is_regular_file()) continue;

            std::string ext = entry.path().extension().string();
            if (std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end()) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }
};

}  // namespace data
}  // namespace seqnet
