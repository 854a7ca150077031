/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/store.hpp"
#include "dummyllm/logger.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace dummyllm {

const char* storeErrorName(StoreError error) noexcept {
    switch (error) {
        case StoreError::None:              return "NONE";
        case StoreError::NotFound:          return "NOT_FOUND";
        case StoreError::AlreadyTerminal:   return "ALREADY_TERMINAL";
        case StoreError::DuplicateId:       return "DUPLICATE_ID";
        case StoreError::InvalidTransition: return "INVALID_TRANSITION";
    }
    return "UNKNOWN";
}

StoreResult JobStore::create(JobRecord record) {
    if (record.id.empty()) {
        return {false, {}, StoreError::InvalidTransition, "Job id is empty"};
    }

    auto entry = std::make_shared<Entry>();
    auto now = Clock::now();
    record.state = State::Queued;
    record.createdAt = now;
    record.updatedAt = now;
    record.result.reset();
    record.error.reset();
    record.cancelRequested = false;
    entry->record = std::move(record);

    const JobId& id = entry->record.id;
    std::lock_guard<std::mutex> lock(mapMutex_);
    if (entries_.count(id) > 0) {
        LOG_ERROR("Duplicate job id: " + id);
        return {false, {}, StoreError::DuplicateId, "Job id already exists: " + id};
    }
    entries_.emplace(id, entry);
    LOG_TRACE("Stored job: " + id);
    return {true, entry->record, StoreError::None, ""};
}

StoreResult JobStore::get(const JobId& id) const {
    auto entry = find(id);
    if (!entry) {
        return {false, {}, StoreError::NotFound, "Job not found: " + id};
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return {true, entry->record, StoreError::None, ""};
}

StoreResult JobStore::transition(const JobId& id, const Predicate& predicate, const Mutator& mutator) {
    auto entry = find(id);
    if (!entry) {
        return {false, {}, StoreError::NotFound, "Job not found: " + id};
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    const JobRecord& current = entry->record;

    if (isTerminal(current.state)) {
        return {false, current, StoreError::AlreadyTerminal,
                "Job " + id + " is already " + stateName(current.state)};
    }
    if (predicate && !predicate(current)) {
        return {false, current, StoreError::InvalidTransition, "Transition precondition failed for " + id};
    }

    JobRecord next = current;
    mutator(next);

    // Identity and request metadata are immutable
    next.id = current.id;
    next.mode = current.mode;
    next.createdAt = current.createdAt;
    next.op = current.op;
    next.args = current.args;
    next.timeoutMs = current.timeoutMs;
    next.traceId = current.traceId;
    next.cancelRequested = current.cancelRequested || next.cancelRequested;

    if (!validEdge(current.state, next.state)) {
        return {false, current, StoreError::InvalidTransition,
                std::string("Illegal transition ") + stateName(current.state) + " -> " + stateName(next.state)};
    }
    if (!payloadMatches(next)) {
        return {false, current, StoreError::InvalidTransition,
                std::string("Result/error do not match state ") + stateName(next.state)};
    }

    next.updatedAt = std::max(Clock::now(), current.updatedAt);
    LOG_DEBUG("Job " + id + ": " + stateName(current.state) + " -> " + stateName(next.state));
    entry->record = std::move(next);
    entry->changed.notify_all();
    return {true, entry->record, StoreError::None, ""};
}

StoreResult JobStore::requestCancel(const JobId& id) {
    auto entry = find(id);
    if (!entry) {
        return {false, {}, StoreError::NotFound, "Job not found: " + id};
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (isTerminal(entry->record.state)) {
        return {false, entry->record, StoreError::AlreadyTerminal,
                "Job " + id + " is already " + stateName(entry->record.state)};
    }
    entry->record.cancelRequested = true;
    entry->changed.notify_all();
    return {true, entry->record, StoreError::None, ""};
}

WaitOutcome JobStore::waitCancellable(const JobId& id, std::optional<Clock::duration> delay) const {
    auto entry = find(id);
    if (!entry) {
        return WaitOutcome::NotFound;
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    auto woken = [this, &entry] {
        return entry->record.cancelRequested || interrupted_.load();
    };

    if (delay) {
        if (!entry->changed.wait_for(lock, std::min<Clock::duration>(*delay, MAX_WAIT), woken)) {
            return WaitOutcome::Elapsed;
        }
    } else {
        entry->changed.wait(lock, woken);
    }
    return entry->record.cancelRequested ? WaitOutcome::Cancelled : WaitOutcome::Interrupted;
}

StoreResult JobStore::waitTerminal(const JobId& id, Clock::duration timeout) const {
    auto entry = find(id);
    if (!entry) {
        return {false, {}, StoreError::NotFound, "Job not found: " + id};
    }

    std::unique_lock<std::mutex> lock(entry->mutex);
    (void)entry->changed.wait_for(lock, std::min<Clock::duration>(timeout, MAX_WAIT), [this, &entry] {
        return isTerminal(entry->record.state) || interrupted_.load();
    });
    return {true, entry->record, StoreError::None, ""};
}

void JobStore::interruptAll() noexcept {
    interrupted_.store(true);

    std::vector<std::shared_ptr<Entry>> snapshot;
    try {
        std::lock_guard<std::mutex> lock(mapMutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            snapshot.push_back(entry);
        }
    } catch (...) {
        LOG_ERROR("Failed to snapshot jobs for interrupt");
        return;
    }

    // Taking each record lock orders the flag store before any waiter's re-check
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->changed.notify_all();
    }
    LOG_DEBUG("Interrupted waits on " + std::to_string(snapshot.size()) + " jobs");
}

std::size_t JobStore::size() const noexcept {
    std::lock_guard<std::mutex> lock(mapMutex_);
    return entries_.size();
}

std::shared_ptr<JobStore::Entry> JobStore::find(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

bool JobStore::validEdge(State from, State to) noexcept {
    switch (from) {
        case State::Queued:
            // Cancellation may finish a job that never started
            return to == State::Running || to == State::Cancelled;
        case State::Running:
            return isTerminal(to);
        default:
            return false;
    }
}

bool JobStore::payloadMatches(const JobRecord& record) noexcept {
    switch (record.state) {
        case State::Ok:
            return record.result.has_value() && !record.error.has_value();
        case State::Fail:
        case State::Timeout:
        case State::Cancelled:
            return record.error.has_value() && !record.result.has_value();
        default:
            return !record.result.has_value() && !record.error.has_value();
    }
}

}
