#pragma once

#include <cstddef>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace tablepod::core::util {

// Uniform random source for every seating decision. Each draw reads the
// operating system entropy source through std::random_device; no seeded
// engine sits in between, so sequences cannot be replayed.
class SecureRandom {
public:
    SecureRandom() = default;
    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;

    // Uniform integer in [0, upper_exclusive). Returns 0 when upper_exclusive <= 1.
    int UniformInt(int upper_exclusive);

    // Uniform real in [0, 1).
    double UniformUnit();

    bool CoinFlip() { return UniformInt(2) == 0; }

    std::string Token(std::size_t length, const std::string& alphabet);

    // Fisher-Yates.
    template <typename T>
    void Shuffle(std::vector<T>& values) {
        for (std::size_t i = values.size(); i > 1; --i) {
            const auto j = static_cast<std::size_t>(UniformInt(static_cast<int>(i)));
            std::swap(values[i - 1], values[j]);
        }
    }

private:
    std::mutex mutex_;
    std::random_device device_;
};

}  // namespace tablepod::core::util
