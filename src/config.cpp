/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/config.hpp"
#include "dummyllm/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace dummyllm {

namespace {
constexpr const char* DEFAULT_WEIGHTS = "ok=70,echo=10,slow=10,fail=5,hang=3,timeout=2,flaky=0";

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

const char* env_str(const char* name) {
    const char* val = std::getenv(name);
    if (!val || trim(val).empty()) {
        return nullptr;
    }
    return val;
}

long long env_int(const char* name, long long defv) {
    const char* val = env_str(name);
    if (!val) {
        return defv;
    }
    try {
        return std::stoll(trim(val));
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring non-numeric ") + name + "=" + val);
        return defv;
    }
}

std::uint32_t parseWeightValue(const std::string& text) {
    try {
        long long parsed = std::stoll(trim(text));
        if (parsed <= 0) return 0;
        return static_cast<std::uint32_t>(
            std::min<long long>(parsed, std::numeric_limits<std::uint32_t>::max()));
    } catch (const std::exception&) {
        return 0;
    }
}

// Splits "a=1,b=2" into trimmed key/value pairs, skipping entries without '='
std::vector<std::pair<std::string, std::string>> splitPairs(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> pairs;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        part = trim(part);
        auto eq = part.find('=');
        if (part.empty() || eq == std::string::npos) {
            continue;
        }
        pairs.emplace_back(trim(part.substr(0, eq)), part.substr(eq + 1));
    }
    return pairs;
}
}

WeightTable Config::defaultWeights() {
    return parseWeights(DEFAULT_WEIGHTS);
}

Config Config::fromEnv() {
    Config cfg;

    if (const char* mode = env_str("DUMMYLLM_MODE")) {
        if (auto policy = parsePolicy(trim(mode))) {
            cfg.policy = *policy;
        } else {
            LOG_WARN(std::string("Unknown DUMMYLLM_MODE '") + mode + "', using ok");
        }
    }

    if (const char* weights = env_str("DUMMYLLM_RANDOM_WEIGHTS")) {
        cfg.weights = parseWeights(weights);
    }

    cfg.baseLatencyMs = static_cast<std::uint64_t>(
        std::max<long long>(0, env_int("DUMMYLLM_LATENCY_MS", static_cast<long long>(cfg.baseLatencyMs))));
    if (cfg.baseLatencyMs > MAX_LATENCY_MS) {
        LOG_WARN("DUMMYLLM_LATENCY_MS capped at " + std::to_string(MAX_LATENCY_MS));
        cfg.baseLatencyMs = MAX_LATENCY_MS;
    }
    cfg.seed = static_cast<std::uint64_t>(env_int("DUMMYLLM_SEED", static_cast<long long>(cfg.seed)));

    if (const char* message = env_str("DUMMYLLM_FAIL_MESSAGE")) {
        cfg.failMessage = message;
    }

    if (const char* split = env_str("DUMMYLLM_FLAKY_SPLIT")) {
        cfg.flakySplit = parseFlakySplit(split);
    }

    return cfg;
}

WeightTable parseWeights(const std::string& text) {
    WeightTable out;
    for (Policy policy : {Policy::Ok, Policy::Echo, Policy::Slow, Policy::Fail,
                          Policy::Hang, Policy::Timeout, Policy::Flaky}) {
        out[policy] = 0;
    }

    for (const auto& [key, value] : splitPairs(text)) {
        auto policy = parsePolicy(key);
        if (!policy || *policy == Policy::Random) {
            LOG_DEBUG("Ignoring unknown weight key: " + key);
            continue;
        }
        out[*policy] = parseWeightValue(value);
    }
    return out;
}

FlakySplit parseFlakySplit(const std::string& text) {
    FlakySplit split{0, 0, 0};
    for (const auto& [key, value] : splitPairs(text)) {
        if (key == "ok") {
            split.ok = parseWeightValue(value);
        } else if (key == "fail") {
            split.fail = parseWeightValue(value);
        } else if (key == "hang") {
            split.hang = parseWeightValue(value);
        }
    }
    if (split.total() == 0) {
        LOG_WARN("Flaky split '" + text + "' has no positive weight, using ok=1,fail=1,hang=1");
        return FlakySplit{};
    }
    return split;
}

std::string formatWeights(const WeightTable& weights) {
    std::string out;
    for (const auto& [policy, weight] : weights) {
        if (!out.empty()) out += ",";
        out += std::string(policyName(policy)) + "=" + std::to_string(weight);
    }
    return out;
}

}
