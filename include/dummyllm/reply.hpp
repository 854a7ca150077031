/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dummyllm {

using Json = nlohmann::ordered_json;

struct Usage {
    std::uint64_t promptTokens = 0;
    std::uint64_t completionTokens = 0;
};

struct JobOutput {
    std::string text;
    Usage usage;
};

// Matches against the lowercased user message. On a hit, returns the offset
// just past the match; the remainder of the message feeds the {x} slot.
class Matcher {
public:
    virtual ~Matcher() = default;
    [[nodiscard]] virtual std::optional<std::size_t> match(const std::string& lowered) const = 0;
};

class SubstringMatcher final : public Matcher {
public:
    explicit SubstringMatcher(std::string needle);
    [[nodiscard]] std::optional<std::size_t> match(const std::string& lowered) const override;

private:
    std::string needle_;
};

// Whole-word match against any of a set of keywords; earliest hit wins.
class KeywordMatcher final : public Matcher {
public:
    explicit KeywordMatcher(std::vector<std::string> keywords);
    [[nodiscard]] std::optional<std::size_t> match(const std::string& lowered) const override;

private:
    std::vector<std::string> keywords_;
};

class RegexMatcher final : public Matcher {
public:
    explicit RegexMatcher(const std::string& pattern);
    [[nodiscard]] std::optional<std::size_t> match(const std::string& lowered) const override;

private:
    std::regex pattern_;
};

// A rule without a matcher is the catch-all.
struct ReplyRule {
    std::shared_ptr<const Matcher> matcher;
    std::vector<std::string> templates;
};

class ResponseGenerator {
public:
    explicit ResponseGenerator(std::uint64_t seed);
    ResponseGenerator(std::uint64_t seed, std::vector<ReplyRule> rules);

    // ok/slow payload: pattern reply for llm.chat, a generic line otherwise
    [[nodiscard]] JobOutput chat(const std::string& op, const Json& args) const;
    // echo payload: canonical args.messages
    [[nodiscard]] JobOutput echo(const Json& args) const;

    [[nodiscard]] std::string reply(const std::string& userText) const;

    [[nodiscard]] static std::vector<ReplyRule> defaultRules();
    [[nodiscard]] static std::string canonicalize(const Json& value);
    [[nodiscard]] static std::string lastUserMessage(const Json& args);
    [[nodiscard]] static std::uint64_t countTokens(const std::string& text) noexcept;
    [[nodiscard]] static std::uint64_t promptTokens(const Json& args) noexcept;
    [[nodiscard]] static std::string reflect(const std::string& text);
    [[nodiscard]] static std::uint64_t variantHash(const std::string& content, std::uint64_t seed) noexcept;

private:
    std::uint64_t seed_;
    std::vector<ReplyRule> rules_;

    [[nodiscard]] const std::string& pickTemplate(const std::vector<std::string>& templates,
                                                  const std::string& content) const noexcept;
};

}
