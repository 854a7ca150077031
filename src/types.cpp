/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/types.hpp"
#include <algorithm>
#include <cctype>
#include <exception>

namespace dummyllm {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

const char* modeName(Mode mode) noexcept {
    switch (mode) {
        case Mode::Ok:      return "ok";
        case Mode::Echo:    return "echo";
        case Mode::Slow:    return "slow";
        case Mode::Fail:    return "fail";
        case Mode::Hang:    return "hang";
        case Mode::Timeout: return "timeout";
    }
    return "unknown";
}

const char* policyName(Policy policy) noexcept {
    switch (policy) {
        case Policy::Ok:      return "ok";
        case Policy::Echo:    return "echo";
        case Policy::Slow:    return "slow";
        case Policy::Fail:    return "fail";
        case Policy::Hang:    return "hang";
        case Policy::Timeout: return "timeout";
        case Policy::Flaky:   return "flaky";
        case Policy::Random:  return "random";
    }
    return "unknown";
}

const char* stateName(State state) noexcept {
    switch (state) {
        case State::Queued:    return "queued";
        case State::Running:   return "running";
        case State::Ok:        return "ok";
        case State::Fail:      return "fail";
        case State::Timeout:   return "timeout";
        case State::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<Mode> parseMode(const std::string& name) noexcept {
    try {
        auto policy = parsePolicy(name);
        if (!policy) return std::nullopt;
        return fixedMode(*policy);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Policy> parsePolicy(const std::string& name) noexcept {
    try {
        std::string key = toLowerCopy(name);
        if (key == "ok") return Policy::Ok;
        if (key == "echo") return Policy::Echo;
        if (key == "slow") return Policy::Slow;
        if (key == "fail") return Policy::Fail;
        if (key == "hang") return Policy::Hang;
        if (key == "timeout") return Policy::Timeout;
        if (key == "flaky") return Policy::Flaky;
        if (key == "random") return Policy::Random;
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Mode> fixedMode(Policy policy) noexcept {
    switch (policy) {
        case Policy::Ok:      return Mode::Ok;
        case Policy::Echo:    return Mode::Echo;
        case Policy::Slow:    return Mode::Slow;
        case Policy::Fail:    return Mode::Fail;
        case Policy::Hang:    return Mode::Hang;
        case Policy::Timeout: return Mode::Timeout;
        default:              return std::nullopt;
    }
}

}
