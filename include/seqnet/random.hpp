// Random Number Generation
// Explicit, seedable random source passed to everything that needs randomness

#pragma once

#include <seqnet/config.hpp>
#include <algorithm>
#include <cstdint>
#include <random>

namespace seqnet {

class Generator {
public:
    explicit Generator(uint32_t seed = SEQNET_DEFAULT_SEED)
        : seed_(seed), engine_(seed) {}

    // Normal distribution
    void fill_normal(float* data, size_t size, float mean, float std) {
        std::normal_distribution<float> dist(mean, std);
        for (size_t i = 0; i < size; ++i) {
            data[i] = dist(engine_);
        }
    }

    float uniform(float low = 0.0f, float high = 1.0f) {
        std::uniform_real_distribution<float> dist(low, high);
        return dist(engine_);
    }

    template<typename It>
    void shuffle(It first, It last) {
        std::shuffle(first, last, engine_);
    }

    // Child generator seeded from this one's stream
    Generator fork() {
        return Generator(static_cast<uint32_t>(engine_()));
    }

    uint32_t seed() const { return seed_; }

private:
    uint32_t seed_;
    std::mt19937 engine_;
};

}  // namespace seqnet
