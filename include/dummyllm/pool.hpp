/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "dummyllm/types.hpp"

namespace dummyllm {

using JobProcessor = std::function<void(const JobId&, std::uint64_t slot)>;

// One thread per submitted job, so a job that never finishes (hang) cannot
// starve the others. Finished threads are reaped on the next submit;
// stop() joins everything, so callers must first make running jobs return.
class Pool {
public:
    Pool() noexcept = default;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t activeCount() const noexcept;

private:
    struct Slot {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void runJob(JobId jobId, std::uint64_t slot, std::shared_ptr<std::atomic<bool>> done);
    void reapFinished();

    JobProcessor processor_;
    std::atomic<bool> running_{false};
    std::uint64_t nextSlot_ = 0;

    mutable std::mutex slotsMutex_;
    std::list<Slot> slots_;
};

}
