/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "dummyllm/reply.hpp"
#include "dummyllm/types.hpp"

namespace dummyllm {

using Clock = std::chrono::steady_clock;

// Longest single wait; larger timeouts are capped so deadline arithmetic cannot overflow.
constexpr std::chrono::hours MAX_WAIT{24 * 365};

struct JobError {
    std::string code;
    std::string message;
};

struct JobRecord {
    JobId id;
    State state = State::Queued;
    Mode mode = Mode::Ok;
    Clock::time_point createdAt;
    Clock::time_point updatedAt;

    std::string op;
    Json args = Json::object();
    std::int64_t timeoutMs = 0;
    std::optional<std::string> traceId;

    std::optional<JobOutput> result;
    std::optional<JobError> error;
    bool cancelRequested = false;
};

enum class StoreError : uint8_t {
    None = 0,
    NotFound,
    AlreadyTerminal,
    DuplicateId,
    InvalidTransition
};

[[nodiscard]] const char* storeErrorName(StoreError error) noexcept;

struct StoreResult {
    bool ok = false;
    JobRecord record;
    StoreError error = StoreError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

enum class WaitOutcome : uint8_t {
    Elapsed,
    Cancelled,
    Interrupted,
    NotFound
};

// In-memory job registry. The map lock is only held for lookup/insert; each
// record has its own lock, so no store-wide lock is held while a job waits.
class JobStore {
public:
    using Predicate = std::function<bool(const JobRecord&)>;
    using Mutator = std::function<void(JobRecord&)>;

    JobStore() = default;

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;
    JobStore(JobStore&&) = delete;
    JobStore& operator=(JobStore&&) = delete;

    // Inserts in state queued; stamps createdAt/updatedAt.
    [[nodiscard]] StoreResult create(JobRecord record);
    [[nodiscard]] StoreResult get(const JobId& id) const;

    // Atomic compare-and-commit. Fails with AlreadyTerminal if the record is
    // terminal, InvalidTransition if the predicate rejects it or the mutator
    // leaves an edge outside the state graph or breaks result/error pairing.
    // The first terminal commit wins; every later attempt sees AlreadyTerminal.
    [[nodiscard]] StoreResult transition(const JobId& id, const Predicate& predicate, const Mutator& mutator);

    // Sets cancelRequested and wakes any waiter. AlreadyTerminal once the job has finished.
    [[nodiscard]] StoreResult requestCancel(const JobId& id);

    // Blocks up to `delay` (forever when nullopt, at most MAX_WAIT otherwise)
    // unless cancellation or interruptAll() cuts the wait short.
    [[nodiscard]] WaitOutcome waitCancellable(const JobId& id, std::optional<Clock::duration> delay) const;

    // Blocks until the record is terminal or the timeout (capped at MAX_WAIT) passes.
    [[nodiscard]] StoreResult waitTerminal(const JobId& id, Clock::duration timeout) const;

    // Wakes every waiter for shutdown; waits started afterwards return at once.
    void interruptAll() noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

private:
    struct Entry {
        mutable std::mutex mutex;
        mutable std::condition_variable changed;
        JobRecord record;
    };

    [[nodiscard]] std::shared_ptr<Entry> find(const JobId& id) const;
    [[nodiscard]] static bool validEdge(State from, State to) noexcept;
    [[nodiscard]] static bool payloadMatches(const JobRecord& record) noexcept;

    mutable std::mutex mapMutex_;
    std::unordered_map<JobId, std::shared_ptr<Entry>> entries_;
    std::atomic<bool> interrupted_{false};
};

}
