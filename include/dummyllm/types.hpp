/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace dummyllm {

// Concrete behavior assigned to a job at creation.
enum class Mode : std::uint8_t { Ok, Echo, Slow, Fail, Hang, Timeout };

// Configured global policy. Flaky and Random resolve to a Mode per job.
enum class Policy : std::uint8_t { Ok, Echo, Slow, Fail, Hang, Timeout, Flaky, Random };

// Job lifecycle states.
enum class State : std::uint8_t { Queued, Running, Ok, Fail, Timeout, Cancelled };

// Opaque job identifier.
using JobId = std::string;

// Simulated outcome codes carried in JobRecord::error.
constexpr const char* ERR_SIM_FAIL = "SIM_FAIL";
constexpr const char* ERR_TIMEOUT = "TIMEOUT";
constexpr const char* ERR_CANCELLED = "CANCELLED";

[[nodiscard]] const char* modeName(Mode mode) noexcept;
[[nodiscard]] const char* policyName(Policy policy) noexcept;
[[nodiscard]] const char* stateName(State state) noexcept;

[[nodiscard]] std::optional<Mode> parseMode(const std::string& name) noexcept;
[[nodiscard]] std::optional<Policy> parsePolicy(const std::string& name) noexcept;

[[nodiscard]] constexpr bool isTerminal(State state) noexcept {
    return state == State::Ok || state == State::Fail ||
           state == State::Timeout || state == State::Cancelled;
}

// Fixed policies map one-to-one onto a mode; Flaky and Random do not.
[[nodiscard]] std::optional<Mode> fixedMode(Policy policy) noexcept;

}
