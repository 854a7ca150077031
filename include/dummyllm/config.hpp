/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <map>
#include <string>

#include "dummyllm/types.hpp"

namespace dummyllm {

// Weight per weightable policy (every Policy except Random). Iteration
// follows enum order, which is the canonical bucket order for selection.
using WeightTable = std::map<Policy, std::uint32_t>;

// Proportions of the flaky three-way split.
struct FlakySplit {
    std::uint32_t ok = 1;
    std::uint32_t fail = 1;
    std::uint32_t hang = 1;

    [[nodiscard]] std::uint64_t total() const noexcept {
        return static_cast<std::uint64_t>(ok) + fail + hang;
    }
};

// Upper bound on the base latency (one year); slow mode multiplies it.
constexpr std::uint64_t MAX_LATENCY_MS = 365ULL * 24 * 60 * 60 * 1000;

struct Config {
    Policy policy = Policy::Ok;
    WeightTable weights = defaultWeights();
    std::uint64_t baseLatencyMs = 250;
    std::uint64_t seed = 1337;
    std::string failMessage = "simulated error";
    std::uint64_t failDelayCapMs = 200;
    FlakySplit flakySplit;
    std::int64_t defaultTimeoutMs = 8000;

    // Reads DUMMYLLM_* variables; anything missing or unparsable keeps its default.
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] static WeightTable defaultWeights();
};

// "ok=70,echo=10,..." -> table. Unknown keys are ignored, missing keys are 0,
// negative or non-numeric values become 0.
[[nodiscard]] WeightTable parseWeights(const std::string& text);

// "ok=1,fail=1,hang=1" -> split. Keys other than ok/fail/hang are ignored.
[[nodiscard]] FlakySplit parseFlakySplit(const std::string& text);

[[nodiscard]] std::string formatWeights(const WeightTable& weights);

}
