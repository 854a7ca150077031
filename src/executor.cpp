/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/executor.hpp"
#include "dummyllm/logger.hpp"
#include <algorithm>

namespace dummyllm {

namespace {
constexpr std::uint64_t SLOW_FACTOR = 6;
constexpr const char* TIMEOUT_MESSAGE = "simulated timeout";
constexpr const char* CANCELLED_MESSAGE = "cancelled by client";

bool notTerminal(const JobRecord& job) {
    return !isTerminal(job.state);
}
}

const char* execOutcomeName(ExecOutcome outcome) noexcept {
    switch (outcome) {
        case ExecOutcome::Completed:   return "completed";
        case ExecOutcome::Cancelled:   return "cancelled";
        case ExecOutcome::Superseded:  return "superseded";
        case ExecOutcome::Interrupted: return "interrupted";
        case ExecOutcome::NotFound:    return "not-found";
    }
    return "unknown";
}

Executor::Executor(const Config& config, JobStore& store, const ResponseGenerator& responses) noexcept
    : config_(config), store_(store), responses_(responses) {
}

ExecOutcome Executor::execute(const JobId& jobId) noexcept {
    try {
        // Step 1: queued -> running
        auto started = store_.transition(jobId,
            [](const JobRecord& job) { return job.state == State::Queued; },
            [](JobRecord& job) { job.state = State::Running; });
        if (!started) {
            if (started.error == StoreError::NotFound) {
                LOG_ERROR("Executor given unknown job: " + jobId);
                return ExecOutcome::NotFound;
            }
            // Cancelled before it was scheduled
            LOG_DEBUG("Job " + jobId + " not started: " + started.message);
            return ExecOutcome::Superseded;
        }

        const JobRecord& job = started.record;
        auto latency = latencyFor(job.mode);
        LOG_DEBUG("Job " + jobId + " running in mode " + modeName(job.mode) +
                  (latency ? ", latency " + std::to_string(latency->count()) + "ms" : ", no deadline"));

        // Step 2: simulated latency, preempted by cancellation
        switch (store_.waitCancellable(jobId, latency)) {
            case WaitOutcome::Elapsed:
                break;
            case WaitOutcome::Cancelled:
                return commitCancelled(jobId);
            case WaitOutcome::Interrupted:
                LOG_DEBUG("Job " + jobId + " abandoned at shutdown");
                return ExecOutcome::Interrupted;
            case WaitOutcome::NotFound:
                return ExecOutcome::NotFound;
        }

        // Step 3: mode-specific terminal state
        return finish(job);

    } catch (const std::exception& e) {
        LOG_ERROR("Exception executing job " + jobId + ": " + std::string(e.what()));
        return ExecOutcome::Interrupted;
    }
}

std::optional<std::chrono::milliseconds> Executor::latencyFor(Mode mode) const noexcept {
    const std::uint64_t base = std::min(config_.baseLatencyMs, MAX_LATENCY_MS);
    switch (mode) {
        case Mode::Ok:
        case Mode::Echo:
        case Mode::Timeout:
            return std::chrono::milliseconds(base);
        case Mode::Slow:
            return std::chrono::milliseconds(base * SLOW_FACTOR);
        case Mode::Fail:
            // Short delay so a poller can still observe running
            return std::chrono::milliseconds(std::min(config_.failDelayCapMs, base));
        case Mode::Hang:
            return std::nullopt;
    }
    return std::nullopt;
}

ExecOutcome Executor::finish(const JobRecord& job) noexcept {
    try {
        switch (job.mode) {
            case Mode::Ok:
            case Mode::Slow: {
                JobOutput output = responses_.chat(job.op, job.args);
                return commit(job.id, [&output](JobRecord& rec) {
                    rec.state = State::Ok;
                    rec.result = output;
                });
            }
            case Mode::Echo: {
                JobOutput output = responses_.echo(job.args);
                return commit(job.id, [&output](JobRecord& rec) {
                    rec.state = State::Ok;
                    rec.result = output;
                });
            }
            case Mode::Fail:
                return commit(job.id, [this](JobRecord& rec) {
                    rec.state = State::Fail;
                    rec.error = JobError{ERR_SIM_FAIL, config_.failMessage};
                });
            case Mode::Timeout:
                return commit(job.id, [](JobRecord& rec) {
                    rec.state = State::Timeout;
                    rec.error = JobError{ERR_TIMEOUT, TIMEOUT_MESSAGE};
                });
            case Mode::Hang:
                break;
        }
        LOG_ERROR("Job " + job.id + " reached completion in mode " + modeName(job.mode));
        return ExecOutcome::Interrupted;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to build result for job " + job.id + ": " + std::string(e.what()));
        return ExecOutcome::Interrupted;
    }
}

ExecOutcome Executor::commitCancelled(const JobId& jobId) noexcept {
    auto outcome = commit(jobId, [](JobRecord& rec) {
        rec.state = State::Cancelled;
        rec.error = JobError{ERR_CANCELLED, CANCELLED_MESSAGE};
    });
    return outcome == ExecOutcome::Completed ? ExecOutcome::Cancelled : outcome;
}

ExecOutcome Executor::commit(const JobId& jobId, const JobStore::Mutator& mutator) noexcept {
    try {
        auto committed = store_.transition(jobId, notTerminal, mutator);
        if (committed) {
            LOG_INFO("Job " + jobId + " finished: " + stateName(committed.record.state));
            return ExecOutcome::Completed;
        }
        if (committed.error == StoreError::AlreadyTerminal) {
            // Lost the race to cancellation; the winner's state stands
            LOG_DEBUG("Job " + jobId + " already terminal, dropping result");
            return ExecOutcome::Superseded;
        }
        LOG_ERROR("Failed to commit job " + jobId + ": " + committed.message);
        return committed.error == StoreError::NotFound ? ExecOutcome::NotFound : ExecOutcome::Interrupted;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception committing job " + jobId + ": " + std::string(e.what()));
        return ExecOutcome::Interrupted;
    }
}

}
