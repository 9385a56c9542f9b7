#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

namespace todod {
namespace store {

/**
 * @brief Generates record ids of the form "<epoch-ms>-<n>", n in [0, 10000)
 *
 * Unique enough at human creation rates. Two ids minted in the same
 * millisecond collide with probability 1/10000; nothing checks for that.
 *
 * Thread-safe.
 */
class IdGenerator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kRandomUpperBound = 10000;

    IdGenerator();

    // Fixed clock and seed, for deterministic ids in tests
    IdGenerator(Clock clock, uint32_t seed);

    IdGenerator(const IdGenerator &) = delete;
    IdGenerator &operator=(const IdGenerator &) = delete;

    std::string new_id();

private:
    Clock clock_;
    std::mutex mutex_;
    std::mt19937 rng_;
    std::uniform_int_distribution<int> distribution_{0, kRandomUpperBound - 1};
};

}  // namespace store
}  // namespace todod
