#pragma once

#include <cstdint>
#include <random>

// Independent per-frame drop decision with a fixed percentage.
class LossSimulator {
public:
    LossSimulator(int percent, uint32_t seed);
    explicit LossSimulator(int percent);

    bool should_drop();
    bool operator()() { return should_drop(); }

    int percent() const { return pct; }

private:
    int pct;
    std::mt19937 rng;
    std::uniform_int_distribution<int> dist{1, 100};
};
