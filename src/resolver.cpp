/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/resolver.hpp"
#include "dummyllm/logger.hpp"
#include <utility>

namespace dummyllm {

ModeResolver::ModeResolver(Policy policy, WeightTable weights, FlakySplit split) noexcept
    : policy_(policy), weights_(std::move(weights)), split_(split) {
    for (const auto& [key, weight] : weights_) {
        if (key != Policy::Random) {
            totalWeight_ += weight;
        }
    }
    if (split_.total() == 0) {
        split_ = FlakySplit{};
    }
}

Mode ModeResolver::resolve(DrawSource& draws) const noexcept {
    if (auto mode = fixedMode(policy_)) {
        return *mode;
    }

    if (policy_ == Policy::Flaky) {
        return pickFlaky(draws.next());
    }

    // Random with nothing to choose from: no draw, keeps later jobs aligned
    if (totalWeight_ == 0) {
        return Mode::Ok;
    }
    return pickWeighted(draws.next());
}

Mode ModeResolver::pickWeighted(std::uint64_t draw) const noexcept {
    if (totalWeight_ == 0) {
        return Mode::Ok;
    }

    std::uint64_t point = draw % totalWeight_;
    std::uint64_t upper = 0;
    for (const auto& [key, weight] : weights_) {
        if (weight == 0 || key == Policy::Random) {
            continue;
        }
        upper += weight;
        if (point < upper) {
            if (key == Policy::Flaky) {
                // Sub-choice comes from the unused high part of the same draw
                return pickFlaky(draw / totalWeight_);
            }
            if (auto mode = fixedMode(key)) {
                return *mode;
            }
            break;
        }
    }

    LOG_ERROR("Weighted selection fell through for draw " + std::to_string(draw));
    return Mode::Ok;
}

Mode ModeResolver::pickFlaky(std::uint64_t draw) const noexcept {
    std::uint64_t point = draw % split_.total();
    if (point < split_.ok) {
        return Mode::Ok;
    }
    if (point < static_cast<std::uint64_t>(split_.ok) + split_.fail) {
        return Mode::Fail;
    }
    return Mode::Hang;
}

}
