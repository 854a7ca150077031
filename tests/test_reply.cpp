/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "dummyllm/reply.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace dummyllm;

namespace {

Json chatArgs(const std::string& content) {
    return Json{{"messages", Json::array({Json{{"role", "user"}, {"content", content}}})}};
}

bool oneOf(const std::string& value, const std::vector<std::string>& options) {
    return std::find(options.begin(), options.end(), value) != options.end();
}

}

TEST(EchoTest, CanonicalSerializationOfMessages) {
    ResponseGenerator gen(1337);
    JobOutput out = gen.echo(Json::parse(R"({"messages":[{"role":"user","content":"Hi"}]})"));
    EXPECT_EQ(out.text, R"([{"role":"user","content":"Hi"}])");
    EXPECT_EQ(out.usage.promptTokens, 1u);
    EXPECT_EQ(out.usage.completionTokens, 1u);
}

TEST(EchoTest, PreservesKeyAndArrayOrderAndDropsWhitespace) {
    ResponseGenerator gen(1);
    Json args = Json::parse(R"({
        "messages": [
            {"content": "second key first", "role": "user", "meta": {"z": 1, "a": [3, 2, 1]}},
            {"role": "assistant", "content": "ok"}
        ]
    })");
    EXPECT_EQ(gen.echo(args).text,
              R"([{"content":"second key first","role":"user","meta":{"z":1,"a":[3,2,1]}},{"role":"assistant","content":"ok"}])");
}

TEST(EchoTest, MissingMessagesEchoesEmptyArray) {
    ResponseGenerator gen(1);
    EXPECT_EQ(gen.echo(Json::object()).text, "[]");
    EXPECT_EQ(gen.echo(Json{{"prompt", "x"}}).text, "[]");
}

TEST(TokenTest, CountsWhitespaceSeparatedTokens) {
    EXPECT_EQ(ResponseGenerator::countTokens(""), 0u);
    EXPECT_EQ(ResponseGenerator::countTokens("   "), 0u);
    EXPECT_EQ(ResponseGenerator::countTokens("one"), 1u);
    EXPECT_EQ(ResponseGenerator::countTokens("  a b\tc\n d  "), 4u);
}

TEST(TokenTest, PromptTokensSumAllMessageContents) {
    Json args = Json::parse(R"({"messages":[
        {"role":"system","content":"be brief"},
        {"role":"user","content":"hello   world"},
        {"role":"user","content":42},
        "not an object"
    ]})");
    EXPECT_EQ(ResponseGenerator::promptTokens(args), 4u);
    EXPECT_EQ(ResponseGenerator::promptTokens(Json::object()), 0u);
    EXPECT_EQ(ResponseGenerator::promptTokens(Json::array()), 0u);
}

TEST(ChatTest, LastUserMessageSkipsOtherRoles) {
    Json args = Json::parse(R"({"messages":[
        {"role":"user","content":"first"},
        {"role":"user","content":"second"},
        {"role":"assistant","content":"reply"}
    ]})");
    EXPECT_EQ(ResponseGenerator::lastUserMessage(args), "second");

    Json nonString = Json::parse(R"({"messages":[{"role":"user","content":"older"},{"role":"user","content":["x"]}]})");
    EXPECT_EQ(ResponseGenerator::lastUserMessage(nonString), "");
    EXPECT_EQ(ResponseGenerator::lastUserMessage(Json{{"messages", "nope"}}), "");
}

TEST(ChatTest, EmptyMessageGetsGreeting) {
    ResponseGenerator gen(1337);
    EXPECT_EQ(gen.reply(""), "Hello. What would you like to talk about?");
    EXPECT_EQ(gen.reply("  \n"), "Hello. What would you like to talk about?");
}

TEST(ChatTest, NeedRuleReflectsTail) {
    ResponseGenerator gen(1337);
    std::string reply = gen.reply("I need a vacation.");
    EXPECT_TRUE(oneOf(reply, {"Why do you need a vacation?",
                              "Would it really help you to get a vacation?",
                              "Are you sure you need a vacation?"})) << reply;
}

TEST(ChatTest, ReflectionSwapsPerson) {
    EXPECT_EQ(ResponseGenerator::reflect("I am sad about my job"), "you are sad about your job");
    EXPECT_EQ(ResponseGenerator::reflect("you  and  ME"), "I and you");

    ResponseGenerator gen(5);
    std::string reply = gen.reply("i am tired of my boss!");
    EXPECT_NE(reply.find("tired of your boss"), std::string::npos) << reply;
}

TEST(ChatTest, MatchWithoutTailUsesThat) {
    ResponseGenerator gen(5);
    std::string reply = gen.reply("I need");
    EXPECT_NE(reply.find("that?"), std::string::npos) << reply;
}

TEST(ChatTest, GreetingIsWholeWord) {
    ResponseGenerator gen(1337);
    EXPECT_TRUE(oneOf(gen.reply("hi there"),
                      {"Hello. How are you feeling today?", "Hi. What's on your mind?"}));

    // "this" contains "hi" but is not a greeting
    EXPECT_TRUE(oneOf(gen.reply("this is it"),
                      {"Please tell me more.", "How does that make you feel?", "Why do you say that?",
                       "Can you elaborate on that?", "Let's explore that a bit further."}));
}

TEST(ChatTest, FirstMatchingRuleWins) {
    ResponseGenerator gen(1337);
    // Both "because" and "mother" match; "because" comes first
    EXPECT_TRUE(oneOf(gen.reply("because of my mother"),
                      {"Is that the real reason?", "What other reasons come to mind?",
                       "Does that reason apply to anything else?"}));
}

TEST(ChatTest, VariantIsContentKeyed) {
    ResponseGenerator a(1337);
    ResponseGenerator b(1337);
    for (int i = 0; i < 20; ++i) {
        std::string msg = "I need item " + std::to_string(i);
        EXPECT_EQ(a.reply(msg), b.reply(msg));
        EXPECT_EQ(a.reply(msg), a.reply(msg));
    }
}

TEST(ChatTest, SeedChangesVariantSelection) {
    int differing = 0;
    for (int i = 0; i < 40; ++i) {
        std::string msg = "I feel like number " + std::to_string(i);
        if (ResponseGenerator::variantHash(msg, 1) % 3 != ResponseGenerator::variantHash(msg, 2) % 3) {
            ++differing;
        }
    }
    EXPECT_GT(differing, 0);
}

TEST(ChatTest, CustomRulesArePolymorphic) {
    std::vector<ReplyRule> rules;
    rules.push_back({std::make_shared<RegexMatcher>(R"(^deploy\s+)"), {"Deploying {x} now."}});
    rules.push_back({std::make_shared<KeywordMatcher>(std::vector<std::string>{"status", "health"}), {"All green."}});
    rules.push_back({std::make_shared<SubstringMatcher>("roll"), {"Rolling {x}."}});
    rules.push_back({nullptr, {"Unknown request."}});
    ResponseGenerator gen(0, std::move(rules));

    EXPECT_EQ(gen.reply("Deploy service-a."), "Deploying service-a now.");
    EXPECT_EQ(gen.reply("what is the health"), "All green.");
    EXPECT_EQ(gen.reply("rollback my change"), "Rolling back your change.");
    EXPECT_EQ(gen.reply("something else"), "Unknown request.");
}

TEST(ChatTest, MatchersReportEndOffset) {
    EXPECT_EQ(SubstringMatcher("need").match("i need it").value_or(0), 6u);
    EXPECT_EQ(KeywordMatcher({"hi"}).match("oh hi").value_or(0), 5u);
    EXPECT_FALSE(KeywordMatcher({"hi"}).match("chip").has_value());
    EXPECT_EQ(RegexMatcher(R"(\bwhy\b)").match("but why not").value_or(0), 7u);
    EXPECT_FALSE(RegexMatcher(R"(\bwhy\b)").match("whyever").has_value());
}

TEST(ChatTest, ChatOpUsesRulesAndCountsUsage) {
    ResponseGenerator gen(1337);
    JobOutput out = gen.chat("llm.chat", chatArgs("hello there friend"));
    EXPECT_TRUE(oneOf(out.text, {"Hello. How are you feeling today?", "Hi. What's on your mind?"}));
    EXPECT_EQ(out.usage.promptTokens, 3u);
    EXPECT_EQ(out.usage.completionTokens, ResponseGenerator::countTokens(out.text));
}

TEST(ChatTest, OtherOpsGetGenericText) {
    ResponseGenerator gen(1337);
    JobOutput out = gen.chat("tool.run", chatArgs("ignored words"));
    EXPECT_EQ(out.text, "ok :: op=tool.run");
    EXPECT_EQ(out.usage.promptTokens, 2u);
    EXPECT_EQ(out.usage.completionTokens, 3u);
}
