/*
 * dummyllm - Simulator command driver (dllm)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/config.hpp"
#include "dummyllm/logger.hpp"
#include "dummyllm/simulator.hpp"
#include "dummyllm/view.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <signal.h>

using namespace dummyllm;

constexpr const char* VERSION = "0.3.0";
constexpr std::int64_t DEFAULT_WAIT_MS = 10000;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "dummyllm Simulator Driver v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] < commands.jsonl\n\n";
    std::cout << "Reads one JSON command per line from stdin, writes one JSON reply per line.\n\n";
    std::cout << "Commands:\n";
    std::cout << "  {\"cmd\":\"submit\",\"op\":\"llm.chat\",\"args\":{...},\"timeout_ms\":8000,\"trace_id\":\"t1\"}\n";
    std::cout << "  {\"cmd\":\"get\",\"id\":\"job_...\"}\n";
    std::cout << "  {\"cmd\":\"cancel\",\"id\":\"job_...\"}\n";
    std::cout << "  {\"cmd\":\"inspect\",\"id\":\"job_...\"}\n";
    std::cout << "  {\"cmd\":\"wait\",\"id\":\"job_...\",\"timeout_ms\":10000}\n\n";
    std::cout << "Options (override environment):\n";
    std::cout << "  --mode <policy>         ok|echo|slow|fail|hang|timeout|flaky|random\n";
    std::cout << "  --weights <table>       e.g. ok=70,echo=10,slow=10,fail=5,hang=3,timeout=2,flaky=0\n";
    std::cout << "  --latency <ms>          Base latency in milliseconds\n";
    std::cout << "  --seed <n>              Seed for mode draws and reply variants\n";
    std::cout << "  --fail-message <text>   Message for SIM_FAIL errors\n";
    std::cout << "  --flaky-split <split>   e.g. ok=1,fail=1,hang=1\n";
    std::cout << "  --log-level <level>     ERROR, WARN, INFO, DEBUG, TRACE\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DUMMYLLM_MODE, DUMMYLLM_RANDOM_WEIGHTS, DUMMYLLM_LATENCY_MS, DUMMYLLM_SEED,\n";
    std::cout << "  DUMMYLLM_FAIL_MESSAGE, DUMMYLLM_FLAKY_SPLIT, DUMMYLLM_LOG_LEVEL\n";
}

std::optional<long long> parseNumber(const std::string& text) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Applies command-line overrides; returns false with a message on bad input.
bool applyArgs(int argc, char* argv[], Config& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            error = "Unknown or incomplete option: " + arg;
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--mode") {
            auto policy = parsePolicy(value);
            if (!policy) {
                error = "Unknown mode: " + value;
                return false;
            }
            config.policy = *policy;
        } else if (arg == "--weights") {
            config.weights = parseWeights(value);
        } else if (arg == "--latency") {
            auto ms = parseNumber(value);
            if (!ms || *ms < 0 || static_cast<std::uint64_t>(*ms) > MAX_LATENCY_MS) {
                error = "--latency expects an integer between 0 and " + std::to_string(MAX_LATENCY_MS);
                return false;
            }
            config.baseLatencyMs = static_cast<std::uint64_t>(*ms);
        } else if (arg == "--seed") {
            auto seed = parseNumber(value);
            if (!seed) {
                error = "--seed expects an integer";
                return false;
            }
            config.seed = static_cast<std::uint64_t>(*seed);
        } else if (arg == "--fail-message") {
            config.failMessage = value;
        } else if (arg == "--flaky-split") {
            config.flakySplit = parseFlakySplit(value);
        } else if (arg == "--log-level") {
            auto level = Logger::parseLevel(value);
            if (!level) {
                error = "Unknown log level: " + value;
                return false;
            }
            Logger::setLevel(*level);
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

std::optional<std::string> requireId(const Json& command) {
    auto id = command.find("id");
    if (id == command.end() || !id->is_string() || id->get<std::string>().empty()) {
        return std::nullopt;
    }
    return id->get<std::string>();
}

Json handleCommand(Simulator& sim, const Json& command) {
    if (!command.is_object()) {
        return renderError("BAD_REQUEST", "Command must be a JSON object");
    }
    auto cmdIt = command.find("cmd");
    if (cmdIt == command.end() || !cmdIt->is_string()) {
        return renderError("BAD_REQUEST", "Missing cmd");
    }
    const std::string cmd = cmdIt->get<std::string>();

    if (cmd == "submit") {
        auto parsed = parseJobRequest(command);
        if (!parsed) {
            return renderError("BAD_REQUEST", parsed.message);
        }
        auto created = sim.submit(parsed.request);
        if (!created) {
            return renderError(created.error, created.message);
        }
        return renderCreated(created.record, sim.epoch());
    }

    auto id = requireId(command);
    if (!id) {
        return renderError("BAD_REQUEST", "Missing id");
    }

    if (cmd == "get") {
        auto found = sim.get(*id);
        return found ? renderStatus(found.record, sim.epoch()) : renderError(found.error, found.message);
    }
    if (cmd == "cancel") {
        auto cancelled = sim.cancel(*id);
        return cancelled ? renderCancel(cancelled.record) : renderError(cancelled.error, cancelled.message);
    }
    if (cmd == "inspect") {
        auto inspected = sim.inspect(*id);
        return inspected ? renderRequest(inspected.view) : renderError(inspected.error, inspected.message);
    }
    if (cmd == "wait") {
        std::int64_t timeoutMs = DEFAULT_WAIT_MS;
        if (auto t = command.find("timeout_ms"); t != command.end() && t->is_number_integer()) {
            timeoutMs = std::max<std::int64_t>(0, t->get<std::int64_t>());
        }
        auto waited = sim.wait(*id, std::chrono::milliseconds(timeoutMs));
        return waited ? renderStatus(waited.record, sim.epoch()) : renderError(waited.error, waited.message);
    }

    return renderError("BAD_REQUEST", "Unknown cmd: " + cmd);
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    // No SA_RESTART: a signal interrupts the blocking stdin read
    struct sigaction action{};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    try {
        Logger::initFromEnv();
        setThreadName("Main");

        Config config = Config::fromEnv();
        std::string error;
        if (!applyArgs(argc, argv, config, error)) {
            std::cerr << "Error: " << error << "\n\n";
            printUsage(argv[0]);
            return 1;
        }

        Simulator sim(config);

        std::string line;
        while (!g_shutdown_requested && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            Json reply;
            try {
                reply = handleCommand(sim, Json::parse(line));
            } catch (const Json::parse_error& e) {
                reply = renderError("BAD_REQUEST", std::string("Invalid JSON: ") + e.what());
            }
            std::cout << reply.dump(-1, ' ', false, Json::error_handler_t::replace) << std::endl;
        }

        if (g_shutdown_requested) {
            LOG_INFO("Shutdown requested");
        }
        sim.shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
