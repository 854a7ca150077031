/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/simulator.hpp"
#include "dummyllm/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <unistd.h>

namespace dummyllm {

namespace {
constexpr std::uint64_t ID_MASK = (1ULL << 48) - 1;

// Bijective on 48-bit values, so distinct counters never share an id
std::uint64_t mix48(std::uint64_t x) {
    x &= ID_MASK;
    x ^= x >> 24;
    x = (x * 0x9E3779B97F4BULL) & ID_MASK;
    x ^= x >> 21;
    x = (x * 0xC2B2AE3D27D5ULL) & ID_MASK;
    x ^= x >> 24;
    return x;
}
}

Simulator::Simulator(Config config)
    : config_(std::move(config)),
      epoch_(Clock::now()),
      responses_(config_.seed),
      resolver_(config_.policy, config_.weights, config_.flakySplit),
      executor_(config_, store_, responses_),
      draws_(config_.seed) {
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        epoch_.time_since_epoch()).count();
    idNonce_ = static_cast<std::uint64_t>(now) ^ (static_cast<std::uint64_t>(getpid()) << 32);

    if (!pool_.start([this](const JobId& jobId, std::uint64_t slot) {
            auto outcome = executor_.execute(jobId);
            LOG_TRACE("Slot " + std::to_string(slot) + " done with " + jobId + ": " + execOutcomeName(outcome));
        })) {
        throw std::runtime_error("Failed to start job pool");
    }

    LOG_INFO(std::string("Simulator started - policy: ") + policyName(config_.policy) +
             ", latency: " + std::to_string(config_.baseLatencyMs) + "ms" +
             ", seed: " + std::to_string(config_.seed));
    if (config_.policy == Policy::Random) {
        LOG_INFO("Random weights: " + formatWeights(config_.weights));
    }
}

Simulator::~Simulator() {
    shutdown();
}

StoreResult Simulator::submit(const JobRequest& request) {
    JobRecord record;
    record.op = request.op;
    record.args = request.args;
    record.timeoutMs = request.timeoutMs.value_or(config_.defaultTimeoutMs);
    record.traceId = request.traceId;

    // Held through dispatch so shutdown cannot slip in between store and pool
    std::lock_guard<std::mutex> lock(createMutex_);
    if (stopped_.load()) {
        return {false, {}, StoreError::InvalidTransition, "Simulator is shut down"};
    }

    // Draws happen here, in submission order, before any job runs
    record.mode = resolver_.resolve(draws_);
    record.id = generateId();
    auto created = store_.create(std::move(record));
    if (!created) {
        return created;
    }

    LOG_INFO("Job submitted: " + created.record.id + " op=" + created.record.op +
             " mode=" + modeName(created.record.mode));

    if (!pool_.submit(created.record.id)) {
        LOG_ERROR("Job " + created.record.id + " could not be scheduled");
        return {false, created.record, StoreError::InvalidTransition,
                "Job " + created.record.id + " could not be scheduled"};
    }
    return created;
}

StoreResult Simulator::get(const JobId& id) const {
    return store_.get(id);
}

StoreResult Simulator::cancel(const JobId& id) {
    auto flagged = store_.requestCancel(id);
    if (!flagged) {
        LOG_DEBUG("Cancel rejected for " + id + ": " + flagged.message);
        return flagged;
    }

    // Force the terminal state now; the executor's own attempt will lose
    auto cancelled = store_.transition(id,
        [](const JobRecord& job) { return !isTerminal(job.state); },
        [](JobRecord& job) {
            job.state = State::Cancelled;
            job.error = JobError{ERR_CANCELLED, "cancelled by client"};
        });
    if (cancelled) {
        LOG_INFO("Job cancelled: " + id);
    } else if (cancelled.error == StoreError::AlreadyTerminal && cancelled.record.state == State::Cancelled) {
        // The executor observed our flag and committed first
        LOG_INFO("Job cancelled: " + id);
        cancelled.ok = true;
        cancelled.error = StoreError::None;
        cancelled.message.clear();
    } else {
        LOG_DEBUG("Cancel of " + id + " lost to completion: " + cancelled.message);
    }
    return cancelled;
}

InspectResult Simulator::inspect(const JobId& id) const {
    auto found = store_.get(id);
    if (!found) {
        return {false, {}, found.error, found.message};
    }

    const JobRecord& job = found.record;
    RequestView view;
    view.op = job.op;
    view.args = job.args;
    view.timeoutMs = job.timeoutMs;
    view.traceId = job.traceId;
    view.mode = job.mode;
    view.policy = config_.policy;
    view.baseLatencyMs = config_.baseLatencyMs;
    view.seed = config_.seed;
    if (config_.policy == Policy::Random) {
        view.weights = config_.weights;
    }
    return {true, std::move(view), StoreError::None, ""};
}

StoreResult Simulator::wait(const JobId& id, std::chrono::milliseconds timeout) const {
    // Cap before converting to the clock's nanosecond duration
    return store_.waitTerminal(id, std::min<std::chrono::milliseconds>(timeout, MAX_WAIT));
}

void Simulator::shutdown() noexcept {
    {
        // Waits out any submit that is mid-dispatch
        std::lock_guard<std::mutex> lock(createMutex_);
        if (stopped_.exchange(true)) {
            return;
        }
    }

    LOG_INFO("Shutting down simulator...");
    store_.interruptAll();
    pool_.stop();
    LOG_INFO("Simulator shutdown complete");
}

std::uint64_t Simulator::drawCount() const {
    std::lock_guard<std::mutex> lock(createMutex_);
    return draws_.count();
}

// Caller holds createMutex_
JobId Simulator::generateId() {
    std::ostringstream ss;
    ss << "job_" << std::hex << std::setw(12) << std::setfill('0') << mix48(idNonce_ + idCounter_++);
    return ss.str();
}

}
