#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace microtrend {
namespace model {

class ISeedProvider {
public:
    virtual ~ISeedProvider() = default;

    virtual std::uint64_t nextSeed() = 0;
};

// Reproducible initialization for tests and replays
class FixedSeedProvider : public ISeedProvider {
public:
    explicit FixedSeedProvider(std::uint64_t seed) : seed_(seed) {}

    std::uint64_t nextSeed() override { return seed_; }

private:
    std::uint64_t seed_;
};

class ClockSeedProvider : public ISeedProvider {
public:
    std::uint64_t nextSeed() override {
        const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
        std::random_device rd;
        return static_cast<std::uint64_t>(ticks) ^ (static_cast<std::uint64_t>(rd()) << 32);
    }
};

} // namespace model
} // namespace microtrend
