#include "id_generator.hpp"

#include <utility>

namespace todod {
namespace store {

IdGenerator::IdGenerator() : clock_([] { return std::chrono::system_clock::now(); }), rng_(std::random_device{}()) {}

IdGenerator::IdGenerator(Clock clock, uint32_t seed) : clock_(std::move(clock)), rng_(seed) {}

std::string IdGenerator::new_id() {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch()).count();

    int suffix = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        suffix = distribution_(rng_);
    }

    return std::to_string(now_ms) + "-" + std::to_string(suffix);
}

}  // namespace store
}  // namespace todod
