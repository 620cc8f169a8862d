#include "LossSimulator.h"

#include <algorithm>

LossSimulator::LossSimulator(int percent, uint32_t seed)
    : pct(std::clamp(percent, 0, 100)), rng(seed) {}

LossSimulator::LossSimulator(int percent)
    : LossSimulator(percent, std::random_device{}()) {}

bool LossSimulator::should_drop() {
    if (pct <= 0) return false;
    return dist(rng) <= pct;
}
