/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "dummyllm/simulator.hpp"

namespace dummyllm {

struct ParsedRequest {
    bool ok = false;
    JobRequest request;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// JSON shapes exchanged with collaborators. Timestamps are milliseconds since `epoch`.
[[nodiscard]] Json renderCreated(const JobRecord& job, Clock::time_point epoch);
[[nodiscard]] Json renderStatus(const JobRecord& job, Clock::time_point epoch);
[[nodiscard]] Json renderCancel(const JobRecord& job);
[[nodiscard]] Json renderRequest(const RequestView& view);
[[nodiscard]] Json renderError(const std::string& code, const std::string& message);
[[nodiscard]] Json renderError(StoreError error, const std::string& message);

// {op, args?, timeout_ms?, trace_id?}; op must be a non-empty string.
[[nodiscard]] ParsedRequest parseJobRequest(const Json& body);

}
