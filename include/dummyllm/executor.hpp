/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>

#include "dummyllm/config.hpp"
#include "dummyllm/reply.hpp"
#include "dummyllm/store.hpp"
#include "dummyllm/types.hpp"

namespace dummyllm {

enum class ExecOutcome : uint8_t {
    Completed,    // committed the mode's own terminal state
    Cancelled,    // committed cancelled after observing the flag
    Superseded,   // another actor committed first
    Interrupted,  // shutdown cut the wait short; nothing committed
    NotFound
};

[[nodiscard]] const char* execOutcomeName(ExecOutcome outcome) noexcept;

// Drives one job: queued -> running -> latency wait -> one terminal state.
// Runs once per job on its own thread and never retries.
class Executor {
public:
    Executor(const Config& config, JobStore& store, const ResponseGenerator& responses) noexcept;

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(Executor&&) = delete;

    [[nodiscard]] ExecOutcome execute(const JobId& jobId) noexcept;

    // Simulated latency for a mode; nullopt means the wait never elapses.
    [[nodiscard]] std::optional<std::chrono::milliseconds> latencyFor(Mode mode) const noexcept;

private:
    const Config& config_;
    JobStore& store_;
    const ResponseGenerator& responses_;

    [[nodiscard]] ExecOutcome finish(const JobRecord& job) noexcept;
    [[nodiscard]] ExecOutcome commitCancelled(const JobId& jobId) noexcept;
    [[nodiscard]] ExecOutcome commit(const JobId& jobId, const JobStore::Mutator& mutator) noexcept;
};

}
