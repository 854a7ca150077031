/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <random>

namespace dummyllm {

// Seeded pseudorandom sequence. The n-th value depends only on (seed, n):
// mt19937_64 output is fixed by the standard, so runs and processes agree.
// Not thread-safe; callers serialize draws.
class DrawSource {
public:
    explicit DrawSource(std::uint64_t seed) noexcept : engine_(seed) {}

    [[nodiscard]] std::uint64_t next() noexcept {
        ++count_;
        return engine_();
    }

    [[nodiscard]] std::uint64_t count() const noexcept { return count_; }

private:
    std::uint64_t count_ = 0;
    std::mt19937_64 engine_;
};

}
