/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "dummyllm/config.hpp"
#include "dummyllm/draw.hpp"
#include "dummyllm/executor.hpp"
#include "dummyllm/pool.hpp"
#include "dummyllm/reply.hpp"
#include "dummyllm/resolver.hpp"
#include "dummyllm/store.hpp"

namespace dummyllm {

struct JobRequest {
    std::string op;
    Json args = Json::object();
    std::optional<std::int64_t> timeoutMs;
    std::optional<std::string> traceId;
};

// Debug view of what a job was created with.
struct RequestView {
    std::string op;
    Json args;
    std::int64_t timeoutMs = 0;
    std::optional<std::string> traceId;
    Mode mode = Mode::Ok;
    Policy policy = Policy::Ok;
    std::uint64_t baseLatencyMs = 0;
    std::uint64_t seed = 0;
    std::optional<WeightTable> weights;  // only under the random policy
};

struct InspectResult {
    bool ok = false;
    RequestView view;
    StoreError error = StoreError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Entry point for collaborators (CLI, transport layers). Owns the store,
// the draw source and one thread per running job.
class Simulator final {
public:
    explicit Simulator(Config config);
    ~Simulator();

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;
    Simulator(Simulator&&) = delete;
    Simulator& operator=(Simulator&&) = delete;

    // Resolves the mode, stores the job as queued and schedules it.
    // The returned record is the queued snapshot.
    [[nodiscard]] StoreResult submit(const JobRequest& request);
    [[nodiscard]] StoreResult get(const JobId& id) const;
    // Returns the cancelled record, or AlreadyTerminal / NotFound.
    [[nodiscard]] StoreResult cancel(const JobId& id);
    [[nodiscard]] InspectResult inspect(const JobId& id) const;
    // Waits until the job is terminal or the timeout passes, then returns it.
    [[nodiscard]] StoreResult wait(const JobId& id, std::chrono::milliseconds timeout) const;

    // Interrupts pending waits and joins job threads. Idempotent.
    void shutdown() noexcept;

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] Clock::time_point epoch() const noexcept { return epoch_; }
    [[nodiscard]] std::uint64_t drawCount() const;
    [[nodiscard]] std::size_t activeJobs() const noexcept { return pool_.activeCount(); }

private:
    [[nodiscard]] JobId generateId();

    const Config config_;
    const Clock::time_point epoch_;

    JobStore store_;
    ResponseGenerator responses_;
    ModeResolver resolver_;
    Executor executor_;

    // Guards draws_, id generation, stopped_ and dispatch; job creation is serialized through it
    mutable std::mutex createMutex_;
    DrawSource draws_;
    std::uint64_t idNonce_;
    std::uint64_t idCounter_ = 0;

    std::atomic<bool> stopped_{false};
    Pool pool_;
};

}
