/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>

#include "dummyllm/config.hpp"
#include "dummyllm/draw.hpp"
#include "dummyllm/types.hpp"

namespace dummyllm {

// Turns the configured policy into a concrete per-job Mode.
//
// Draw accounting is exact: fixed policies and an all-zero weight table take
// no draw, flaky and random take exactly one. Job creation order therefore
// fully determines which draw each job sees.
class ModeResolver {
public:
    ModeResolver(Policy policy, WeightTable weights, FlakySplit split = {}) noexcept;

    [[nodiscard]] Mode resolve(DrawSource& draws) const noexcept;

    [[nodiscard]] std::uint64_t totalWeight() const noexcept { return totalWeight_; }

    // Bucket lookup for a draw already taken; exposed for tests.
    [[nodiscard]] Mode pickWeighted(std::uint64_t draw) const noexcept;
    [[nodiscard]] Mode pickFlaky(std::uint64_t draw) const noexcept;

private:
    Policy policy_;
    WeightTable weights_;
    FlakySplit split_;
    std::uint64_t totalWeight_ = 0;
};

}
