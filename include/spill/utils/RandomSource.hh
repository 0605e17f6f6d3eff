#pragma once

#include <cstdint>
#include <random>

namespace spill {

// Seedable sampling helpers. A fixed seed makes a whole engine run reproducible.
class RandomSource {
  public:
    RandomSource() : gen_(std::random_device{}()) {}
    explicit RandomSource(uint32_t seed) : gen_(seed) {}

    void seed(uint32_t value) { gen_.seed(value); }

    // Uniform in [min, max]. Returns min when the range is empty.
    float uniform(float min, float max) {
        if (!(max > min)) {
            return min;
        }
        return std::uniform_real_distribution<float>(min, max)(gen_);
    }

    int uniformInt(int min, int max) {
        if (max <= min) {
            return min;
        }
        return std::uniform_int_distribution<int>(min, max)(gen_);
    }

    size_t index(size_t count) {
        if (count <= 1) {
            return 0;
        }
        return std::uniform_int_distribution<size_t>(0, count - 1)(gen_);
    }

    std::mt19937& engine() { return gen_; }

  private:
    std::mt19937 gen_;
};

} // namespace spill
