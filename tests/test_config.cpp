/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "dummyllm/config.hpp"
#include <cstdlib>

using namespace dummyllm;

namespace {

class EnvGuard {
public:
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }

    static void clear() {
        for (const char* name : {"DUMMYLLM_MODE", "DUMMYLLM_RANDOM_WEIGHTS", "DUMMYLLM_LATENCY_MS",
                                 "DUMMYLLM_SEED", "DUMMYLLM_FAIL_MESSAGE", "DUMMYLLM_FLAKY_SPLIT"}) {
            unsetenv(name);
        }
    }
};

}

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    EnvGuard env;
    Config cfg = Config::fromEnv();
    EXPECT_EQ(cfg.policy, Policy::Ok);
    EXPECT_EQ(cfg.baseLatencyMs, 250u);
    EXPECT_EQ(cfg.seed, 1337u);
    EXPECT_EQ(cfg.failMessage, "simulated error");
    EXPECT_EQ(cfg.defaultTimeoutMs, 8000);
    EXPECT_EQ(cfg.weights.at(Policy::Ok), 70u);
    EXPECT_EQ(cfg.weights.at(Policy::Timeout), 2u);
    EXPECT_EQ(cfg.weights.at(Policy::Flaky), 0u);
    EXPECT_EQ(cfg.flakySplit.total(), 3u);
}

TEST(ConfigTest, ReadsEnvironment) {
    EnvGuard env;
    setenv("DUMMYLLM_MODE", " Random ", 1);
    setenv("DUMMYLLM_RANDOM_WEIGHTS", "ok=1,fail=3", 1);
    setenv("DUMMYLLM_LATENCY_MS", "40", 1);
    setenv("DUMMYLLM_SEED", "7", 1);
    setenv("DUMMYLLM_FAIL_MESSAGE", "backend exploded", 1);
    setenv("DUMMYLLM_FLAKY_SPLIT", "ok=2,fail=1,hang=0", 1);

    Config cfg = Config::fromEnv();
    EXPECT_EQ(cfg.policy, Policy::Random);
    EXPECT_EQ(cfg.weights.at(Policy::Ok), 1u);
    EXPECT_EQ(cfg.weights.at(Policy::Fail), 3u);
    EXPECT_EQ(cfg.weights.at(Policy::Echo), 0u);
    EXPECT_EQ(cfg.baseLatencyMs, 40u);
    EXPECT_EQ(cfg.seed, 7u);
    EXPECT_EQ(cfg.failMessage, "backend exploded");
    EXPECT_EQ(cfg.flakySplit.ok, 2u);
    EXPECT_EQ(cfg.flakySplit.hang, 0u);
}

TEST(ConfigTest, BadValuesKeepDefaults) {
    EnvGuard env;
    setenv("DUMMYLLM_MODE", "chaotic", 1);
    setenv("DUMMYLLM_LATENCY_MS", "fast", 1);
    setenv("DUMMYLLM_SEED", "", 1);

    Config cfg = Config::fromEnv();
    EXPECT_EQ(cfg.policy, Policy::Ok);
    EXPECT_EQ(cfg.baseLatencyMs, 250u);
    EXPECT_EQ(cfg.seed, 1337u);
}

TEST(ConfigTest, NegativeLatencyClampsToZero) {
    EnvGuard env;
    setenv("DUMMYLLM_LATENCY_MS", "-30", 1);
    EXPECT_EQ(Config::fromEnv().baseLatencyMs, 0u);
}

TEST(ConfigTest, HugeLatencyIsCapped) {
    EnvGuard env;
    setenv("DUMMYLLM_LATENCY_MS", "3074457345618258603", 1);
    EXPECT_EQ(Config::fromEnv().baseLatencyMs, MAX_LATENCY_MS);
}

TEST(ConfigTest, ParseWeightsIgnoresUnknownAndMalformed) {
    WeightTable w = parseWeights("ok=5, bogus=9 ,echo=-3,slow=abc,hang,random=4,timeout=2");
    EXPECT_EQ(w.size(), 7u);
    EXPECT_EQ(w.at(Policy::Ok), 5u);
    EXPECT_EQ(w.at(Policy::Echo), 0u);
    EXPECT_EQ(w.at(Policy::Slow), 0u);
    EXPECT_EQ(w.at(Policy::Hang), 0u);
    EXPECT_EQ(w.at(Policy::Timeout), 2u);
    EXPECT_EQ(w.count(Policy::Random), 0u);
}

TEST(ConfigTest, EmptyWeightStringIsAllZero) {
    WeightTable w = parseWeights("");
    for (const auto& [policy, weight] : w) {
        EXPECT_EQ(weight, 0u) << policyName(policy);
    }
}

TEST(ConfigTest, AllZeroFlakySplitFallsBackToEqualThirds) {
    FlakySplit split = parseFlakySplit("ok=0,fail=0,hang=0");
    EXPECT_EQ(split.ok, 1u);
    EXPECT_EQ(split.fail, 1u);
    EXPECT_EQ(split.hang, 1u);
}

TEST(ConfigTest, FormatWeightsUsesCanonicalOrder) {
    EXPECT_EQ(formatWeights(parseWeights("timeout=2,ok=70")),
              "ok=70,echo=0,slow=0,fail=0,hang=0,timeout=2,flaky=0");
}
