/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/view.hpp"

namespace dummyllm {

namespace {
std::int64_t sinceEpochMs(Clock::time_point at, Clock::time_point epoch) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at - epoch).count();
}
}

Json renderCreated(const JobRecord& job, Clock::time_point epoch) {
    Json out;
    out["id"] = job.id;
    out["state"] = stateName(job.state);
    out["created_at"] = sinceEpochMs(job.createdAt, epoch);
    return out;
}

Json renderStatus(const JobRecord& job, Clock::time_point epoch) {
    Json out;
    out["id"] = job.id;
    out["state"] = stateName(job.state);
    out["mode"] = modeName(job.mode);
    out["created_at"] = sinceEpochMs(job.createdAt, epoch);
    out["updated_at"] = sinceEpochMs(job.updatedAt, epoch);
    if (job.result) {
        out["result"] = {
            {"text", job.result->text},
            {"usage", {
                {"prompt_tokens", job.result->usage.promptTokens},
                {"completion_tokens", job.result->usage.completionTokens},
            }},
        };
    } else {
        out["result"] = nullptr;
    }
    if (job.error) {
        out["error"] = {{"code", job.error->code}, {"message", job.error->message}};
    } else {
        out["error"] = nullptr;
    }
    return out;
}

Json renderCancel(const JobRecord& job) {
    return {{"id", job.id}, {"state", stateName(job.state)}};
}

Json renderRequest(const RequestView& view) {
    Json out;
    out["op"] = view.op;
    out["args"] = view.args;
    out["timeout_ms"] = view.timeoutMs;
    out["trace_id"] = view.traceId ? Json(*view.traceId) : Json(nullptr);
    out["chosen_mode"] = modeName(view.mode);
    out["policy"] = policyName(view.policy);
    out["base_latency_ms"] = view.baseLatencyMs;
    if (view.weights) {
        Json weights = Json::object();
        for (const auto& [policy, weight] : *view.weights) {
            weights[policyName(policy)] = weight;
        }
        out["random_weights"] = weights;
    } else {
        out["random_weights"] = nullptr;
    }
    out["seed"] = view.seed;
    return out;
}

Json renderError(const std::string& code, const std::string& message) {
    return {{"error", {{"code", code}, {"message", message}}}};
}

Json renderError(StoreError error, const std::string& message) {
    return renderError(storeErrorName(error), message);
}

ParsedRequest parseJobRequest(const Json& body) {
    ParsedRequest parsed;
    if (!body.is_object()) {
        parsed.message = "Request must be a JSON object";
        return parsed;
    }

    auto op = body.find("op");
    if (op == body.end() || !op->is_string() || op->get<std::string>().empty()) {
        parsed.message = "Missing op";
        return parsed;
    }
    parsed.request.op = op->get<std::string>();

    if (auto args = body.find("args"); args != body.end() && !args->is_null()) {
        if (!args->is_object()) {
            parsed.message = "args must be an object";
            return parsed;
        }
        parsed.request.args = *args;
    }

    if (auto timeout = body.find("timeout_ms"); timeout != body.end() && !timeout->is_null()) {
        if (!timeout->is_number_integer() || timeout->get<std::int64_t>() < 0) {
            parsed.message = "timeout_ms must be a non-negative integer";
            return parsed;
        }
        parsed.request.timeoutMs = timeout->get<std::int64_t>();
    }

    if (auto trace = body.find("trace_id"); trace != body.end() && !trace->is_null()) {
        if (!trace->is_string()) {
            parsed.message = "trace_id must be a string";
            return parsed;
        }
        parsed.request.traceId = trace->get<std::string>();
    }

    parsed.ok = true;
    return parsed;
}

}
