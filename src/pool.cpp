/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/pool.hpp"
#include "dummyllm/logger.hpp"
#include <utility>

namespace dummyllm {

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    std::lock_guard<std::mutex> lock(slotsMutex_);
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    LOG_DEBUG("Pool started");
    return true;
}

void Pool::stop() noexcept {
    std::list<Slot> slots;
    {
        // Flipping running_ under the lock closes the window where a submit
        // could add a thread after the swap
        std::lock_guard<std::mutex> lock(slotsMutex_);
        if (!running_.exchange(false)) {
            return;
        }
        slots.swap(slots_);
    }

    LOG_DEBUG("Stopping pool...");

    // Join outside the lock; job threads never touch slots_
    for (auto& slot : slots) {
        if (slot.thread.joinable()) {
            slot.thread.join();
        }
    }

    LOG_INFO("Pool stopped, joined " + std::to_string(slots.size()) + " job thread(s)");
}

bool Pool::submit(const JobId& jobId) noexcept {
    try {
        std::lock_guard<std::mutex> lock(slotsMutex_);
        if (!running_.load()) {
            LOG_WARN("Cannot submit job to stopped pool: " + jobId);
            return false;
        }
        reapFinished();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::uint64_t slot = nextSlot_++;
        slots_.push_back({std::thread(&Pool::runJob, this, jobId, slot, done), done});
        LOG_DEBUG("Job dispatched: " + jobId + " (slot " + std::to_string(slot) + ")");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to dispatch job " + jobId + ": " + e.what());
        return false;
    }
}

std::size_t Pool::activeCount() const noexcept {
    std::lock_guard<std::mutex> lock(slotsMutex_);
    std::size_t active = 0;
    for (const auto& slot : slots_) {
        if (!slot.done->load()) {
            ++active;
        }
    }
    return active;
}

void Pool::runJob(JobId jobId, std::uint64_t slot, std::shared_ptr<std::atomic<bool>> done) {
    setThreadName("Job-" + std::to_string(slot));

    try {
        processor_(jobId, slot);
    } catch (const std::exception& e) {
        LOG_ERROR("Job processing error: " + std::string(e.what()) + " (job: " + jobId + ")");
    } catch (...) {
        LOG_ERROR("Unknown job processing error (job: " + jobId + ")");
    }

    clearThreadName();
    done->store(true);
}

// Caller holds slotsMutex_
void Pool::reapFinished() {
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
}

}
