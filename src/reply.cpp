/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "dummyllm/reply.hpp"
#include "dummyllm/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace dummyllm {

namespace {
constexpr const char* EMPTY_PROMPT_REPLY = "Hello. What would you like to talk about?";
constexpr const char* NO_RULE_REPLY = "Please tell me more.";
constexpr std::uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr std::uint64_t FNV_PRIME = 1099511628211ULL;

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string stripChars(const std::string& value, const char* chars) {
    auto begin = value.find_first_not_of(chars);
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(chars);
    return value.substr(begin, end - begin + 1);
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\'';
}

std::uint64_t fnv1a(std::uint64_t h, const void* data, std::size_t len) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= bytes[i];
        h *= FNV_PRIME;
    }
    return h;
}

std::string fill(const std::string& tpl, const std::string& x) {
    static const std::string slot = "{x}";
    std::string out = tpl;
    for (auto pos = out.find(slot); pos != std::string::npos; pos = out.find(slot, pos + x.size())) {
        out.replace(pos, slot.size(), x);
    }
    return out;
}

std::vector<std::string> greetings() {
    return {"Hello. How are you feeling today?", "Hi. What's on your mind?"};
}
}

SubstringMatcher::SubstringMatcher(std::string needle) : needle_(toLowerCopy(std::move(needle))) {}

std::optional<std::size_t> SubstringMatcher::match(const std::string& lowered) const {
    auto pos = lowered.find(needle_);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos + needle_.size();
}

KeywordMatcher::KeywordMatcher(std::vector<std::string> keywords) : keywords_(std::move(keywords)) {
    for (auto& keyword : keywords_) {
        keyword = toLowerCopy(keyword);
    }
}

std::optional<std::size_t> KeywordMatcher::match(const std::string& lowered) const {
    std::optional<std::size_t> bestStart;
    std::size_t bestEnd = 0;

    for (const auto& keyword : keywords_) {
        if (keyword.empty()) continue;
        for (auto pos = lowered.find(keyword); pos != std::string::npos; pos = lowered.find(keyword, pos + 1)) {
            auto end = pos + keyword.size();
            bool leftOk = pos == 0 || !isWordChar(lowered[pos - 1]);
            bool rightOk = end == lowered.size() || !isWordChar(lowered[end]);
            if (leftOk && rightOk) {
                if (!bestStart || pos < *bestStart) {
                    bestStart = pos;
                    bestEnd = end;
                }
                break;
            }
        }
    }

    if (!bestStart) {
        return std::nullopt;
    }
    return bestEnd;
}

RegexMatcher::RegexMatcher(const std::string& pattern)
    : pattern_(pattern, std::regex::ECMAScript | std::regex::icase) {}

std::optional<std::size_t> RegexMatcher::match(const std::string& lowered) const {
    std::smatch m;
    if (!std::regex_search(lowered, m, pattern_)) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(m.position(0) + m.length(0));
}

ResponseGenerator::ResponseGenerator(std::uint64_t seed)
    : ResponseGenerator(seed, defaultRules()) {}

ResponseGenerator::ResponseGenerator(std::uint64_t seed, std::vector<ReplyRule> rules)
    : seed_(seed), rules_(std::move(rules)) {
    LOG_DEBUG("ResponseGenerator created with " + std::to_string(rules_.size()) + " rules");
}

std::vector<ReplyRule> ResponseGenerator::defaultRules() {
    std::vector<ReplyRule> rules;
    rules.push_back({std::make_shared<RegexMatcher>(R"(\bi need\b)"),
        {"Why do you need {x}?", "Would it really help you to get {x}?", "Are you sure you need {x}?"}});
    rules.push_back({std::make_shared<RegexMatcher>(R"(\bi am\b)"),
        {"How long have you been {x}?", "How do you feel about being {x}?", "Why do you say you're {x}?"}});
    rules.push_back({std::make_shared<RegexMatcher>(R"(\bi feel\b)"),
        {"Do you often feel {x}?", "When do you usually feel {x}?", "What makes you feel {x}?"}});
    rules.push_back({std::make_shared<SubstringMatcher>("because"),
        {"Is that the real reason?", "What other reasons come to mind?", "Does that reason apply to anything else?"}});
    rules.push_back({std::make_shared<RegexMatcher>(R"(\bwhy\b)"),
        {"What do you think?", "Why do you ask?", "What answer would satisfy you?"}});
    rules.push_back({std::make_shared<KeywordMatcher>(std::vector<std::string>{"hello", "hi", "hey"}),
        greetings()});
    rules.push_back({std::make_shared<SubstringMatcher>("mother"),
        {"Tell me more about your family.", "How is your relationship with your mother?"}});
    rules.push_back({std::make_shared<SubstringMatcher>("father"),
        {"Tell me more about your family.", "How is your relationship with your father?"}});
    rules.push_back({std::make_shared<SubstringMatcher>("always"),
        {"Can you think of a specific example?", "When exactly does that happen?"}});
    rules.push_back({nullptr,
        {"Please tell me more.", "How does that make you feel?", "Why do you say that?",
         "Can you elaborate on that?", "Let's explore that a bit further."}});
    return rules;
}

JobOutput ResponseGenerator::chat(const std::string& op, const Json& args) const {
    JobOutput out;
    if (op == "llm.chat") {
        out.text = reply(lastUserMessage(args));
    } else {
        out.text = "ok :: op=" + op;
    }
    out.usage.promptTokens = promptTokens(args);
    out.usage.completionTokens = countTokens(out.text);
    return out;
}

JobOutput ResponseGenerator::echo(const Json& args) const {
    JobOutput out;
    if (args.is_object() && args.contains("messages")) {
        out.text = canonicalize(args.at("messages"));
    } else {
        out.text = canonicalize(Json::array());
    }
    out.usage.promptTokens = promptTokens(args);
    out.usage.completionTokens = countTokens(out.text);
    return out;
}

std::string ResponseGenerator::reply(const std::string& userText) const {
    std::string text = stripChars(userText, " \t\r\n");
    if (text.empty()) {
        return EMPTY_PROMPT_REPLY;
    }

    // ASCII lowering keeps byte offsets aligned with the original text
    std::string lowered = toLowerCopy(text);

    for (const auto& rule : rules_) {
        if (rule.templates.empty()) {
            continue;
        }
        if (!rule.matcher) {
            return fill(pickTemplate(rule.templates, userText), "that");
        }
        auto end = rule.matcher->match(lowered);
        if (!end) {
            continue;
        }
        std::string tail = stripChars(text.substr(std::min(*end, text.size())), " .!?");
        std::string x = tail.empty() ? "that" : reflect(tail);
        LOG_TRACE("Reply rule matched, tail='" + tail + "'");
        return fill(pickTemplate(rule.templates, userText), x);
    }

    return NO_RULE_REPLY;
}

const std::string& ResponseGenerator::pickTemplate(const std::vector<std::string>& templates,
                                                   const std::string& content) const noexcept {
    return templates[variantHash(content, seed_) % templates.size()];
}

std::string ResponseGenerator::canonicalize(const Json& value) {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string ResponseGenerator::lastUserMessage(const Json& args) {
    if (!args.is_object()) {
        return "";
    }
    auto it = args.find("messages");
    if (it == args.end() || !it->is_array()) {
        return "";
    }
    for (auto msg = it->rbegin(); msg != it->rend(); ++msg) {
        if (!msg->is_object()) continue;
        auto role = msg->find("role");
        if (role == msg->end() || !role->is_string() || role->get<std::string>() != "user") {
            continue;
        }
        auto content = msg->find("content");
        if (content != msg->end() && content->is_string()) {
            return content->get<std::string>();
        }
        return "";
    }
    return "";
}

std::uint64_t ResponseGenerator::countTokens(const std::string& text) noexcept {
    std::uint64_t count = 0;
    bool inToken = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            inToken = false;
        } else if (!inToken) {
            inToken = true;
            ++count;
        }
    }
    return count;
}

std::uint64_t ResponseGenerator::promptTokens(const Json& args) noexcept {
    try {
        if (!args.is_object()) return 0;
        auto it = args.find("messages");
        if (it == args.end() || !it->is_array()) return 0;

        // Summing per message equals counting over the space-joined contents
        std::uint64_t total = 0;
        for (const auto& msg : *it) {
            if (!msg.is_object()) continue;
            auto content = msg.find("content");
            if (content != msg.end() && content->is_string()) {
                total += countTokens(content->get_ref<const std::string&>());
            }
        }
        return total;
    } catch (const std::exception& e) {
        LOG_WARN("Failed to count prompt tokens: " + std::string(e.what()));
        return 0;
    }
}

std::string ResponseGenerator::reflect(const std::string& text) {
    static const std::unordered_map<std::string, std::string> reflections = {
        {"i", "you"}, {"me", "you"}, {"my", "your"}, {"am", "are"},
        {"you", "I"}, {"your", "my"}, {"yours", "mine"}, {"mine", "yours"},
    };

    std::istringstream words(text);
    std::string word;
    std::string out;
    while (words >> word) {
        if (!out.empty()) out += " ";
        auto it = reflections.find(toLowerCopy(word));
        out += it != reflections.end() ? it->second : word;
    }
    return out;
}

std::uint64_t ResponseGenerator::variantHash(const std::string& content, std::uint64_t seed) noexcept {
    std::uint64_t h = fnv1a(FNV_OFFSET, content.data(), content.size());
    unsigned char seedBytes[8];
    for (int i = 0; i < 8; ++i) {
        seedBytes[i] = static_cast<unsigned char>(seed >> (8 * i));
    }
    return fnv1a(h, seedBytes, sizeof(seedBytes));
}

}
