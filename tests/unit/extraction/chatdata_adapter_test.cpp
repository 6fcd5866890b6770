#include "../../common/test_helpers.h"
#include <gtest/gtest.h>
#include <chatmine/crypto/hasher.h>
#include <chatmine/extraction/chatdata_adapter.h>

#include <cstdint>
#include <limits>

using namespace chatmine;
using namespace chatmine::extraction;
using namespace chatmine::test;
using json = nlohmann::json;

class ChatDataAdapterTest : public ::testing::Test {
protected:
    MemorySource source;
    CapturingLogger capture;
    ChatDataAdapter adapter;

    ExtractionContext context(const std::string& workspaceId = "ws1") {
        ExtractionContext ctx;
        ctx.workspaceId = workspaceId;
        ctx.logger = capture.logger;
        ctx.now = [] { return EpochMillis{9'000'000}; };
        return ctx;
    }

    AdapterOutput run(const std::string& workspaceId = "ws1") {
        auto out = adapter.extract(source, context(workspaceId));
        EXPECT_TRUE(out);
        return out ? std::move(out).value() : AdapterOutput{};
    }

    static json session(json messages) {
        json s = json::object();
        s["messages"] = std::move(messages);
        return s;
    }
};

TEST_F(ChatDataAdapterTest, PromptPairBecomesTwoMessageThread) {
    source.putJson(std::string(ChatDataAdapter::kPromptsKey),
                   json::array({{{"prompt", "fix bug"}, {"response", "done"}, {"timestamp", 1000}}}));

    auto out = run();
    ASSERT_EQ(out.threads.size(), 1u);
    ASSERT_EQ(out.messages.size(), 2u);

    const auto& t = out.threads[0];
    EXPECT_EQ(t.messageCount, 2u);
    EXPECT_EQ(t.createdAt, 1000);
    EXPECT_EQ(t.updatedAt, 1001);
    EXPECT_EQ(t.title, "fix bug");
    EXPECT_EQ(t.workspaceId, "ws1");
    EXPECT_EQ(t.metadata.at("source"), "prompts");

    EXPECT_EQ(out.messages[0].role, MessageRole::User);
    EXPECT_EQ(out.messages[0].content, "fix bug");
    EXPECT_EQ(out.messages[0].timestamp, 1000);
    EXPECT_EQ(out.messages[1].role, MessageRole::Assistant);
    EXPECT_EQ(out.messages[1].content, "done");
    EXPECT_EQ(out.messages[1].timestamp, 1001);
    for (const auto& m : out.messages) {
        EXPECT_EQ(m.threadId, t.id);
    }
}

TEST_F(ChatDataAdapterTest, SinglePromptObjectIsAccepted) {
    source.putJson(std::string(ChatDataAdapter::kPromptsKey),
                   {{"prompt", "fix bug"}, {"response", "done"}, {"timestamp", 1000}});
    auto out = run();
    ASSERT_EQ(out.threads.size(), 1u);
    EXPECT_EQ(out.messages.size(), 2u);
}

TEST_F(ChatDataAdapterTest, ToleratesEverySessionShape) {
    const json msgs = json::array({{{"role", "user"}, {"content", "hi"}, {"timestamp", 10}},
                                   {{"role", "assistant"}, {"text", "hello"}, {"time", 20}}});
    const std::string key(ChatDataAdapter::kChatDataKey);

    std::vector<json> payloads;
    payloads.push_back(json::array({session(msgs)}));
    payloads.push_back(json{{"conversations", json::array({session(msgs)})}});
    payloads.push_back(json{{"chats", json::array({session(msgs)})}});
    payloads.push_back(session(msgs));
    payloads.push_back(json{{"history", msgs}});

    for (const json& payload : payloads) {
        MemorySource src;
        src.putJson(key, payload);
        auto out = adapter.extract(src, context());
        ASSERT_TRUE(out);
        ASSERT_EQ(out.value().threads.size(), 1u) << payload.dump();
        EXPECT_EQ(out.value().messages.size(), 2u) << payload.dump();
        EXPECT_EQ(out.value().threads[0].updatedAt, 20);
        EXPECT_EQ(out.value().threads[0].lastMessage, "hello");
    }
}

TEST_F(ChatDataAdapterTest, MessagesWithoutContentAreDropped) {
    source.putJson(std::string(ChatDataAdapter::kChatDataKey),
                   json::array({session({{{"role", "user"}, {"content", "first"}, {"timestamp", 1}},
                                         {{"role", "assistant"}},
                                         {{"role", "assistant"}, {"content", ""}},
                                         {{"role", "user"}, {"message", "last"}, {"timestamp", 2}}})}));
    auto out = run();
    ASSERT_EQ(out.threads.size(), 1u);
    EXPECT_EQ(out.threads[0].messageCount, 2u);
    ASSERT_EQ(out.messages.size(), 2u);
    EXPECT_EQ(out.messages[1].content, "last");
}

TEST_F(ChatDataAdapterTest, SessionWithNoMessagesIsSkipped) {
    source.putJson(std::string(ChatDataAdapter::kChatDataKey),
                   json::array({json{{"messages", json::array()}},
                                session({{{"role", "assistant"}}})}));
    auto out = run();
    EXPECT_TRUE(out.threads.empty());
    EXPECT_TRUE(out.messages.empty());
}

TEST_F(ChatDataAdapterTest, MalformedEntryDoesNotAffectOthers) {
    source.put(std::string(ChatDataAdapter::kChatDataKey), "{not json");
    source.putJson(std::string(ChatDataAdapter::kPromptsKey),
                   json::array({{{"prompt", "a"}, {"timestamp", 1}}, {{"prompt", "b"}, {"timestamp", 2}}}));

    auto out = run();
    EXPECT_EQ(out.threads.size(), 2u);
    EXPECT_EQ(out.skippedRecords, 1u);
    EXPECT_EQ(capture.count("[warning]"), 1u);
    EXPECT_NE(capture.text().find("not valid JSON"), std::string::npos);
}

TEST_F(ChatDataAdapterTest, MalformedSessionDoesNotAffectSiblings) {
    source.putJson(std::string(ChatDataAdapter::kChatDataKey),
                   json::array({42, session({{{"content", "ok"}, {"timestamp", 5}}})}));
    auto out = run();
    ASSERT_EQ(out.threads.size(), 1u);
    EXPECT_EQ(out.skippedRecords, 1u);
    EXPECT_EQ(out.threads[0].metadata.at("originalIndex"), 1);
}

TEST_F(ChatDataAdapterTest, UnrecognizedShapeIsLoggedAndSkipped) {
    source.putJson(std::string(ChatDataAdapter::kChatDataKey), json{{"unexpected", true}});
    auto out = run();
    EXPECT_TRUE(out.threads.empty());
    EXPECT_EQ(out.skippedRecords, 1u);
    EXPECT_NE(capture.text().find("unrecognized shape"), std::string::npos);
}

TEST_F(ChatDataAdapterTest, IdsAreStableAndDerivedFromSourcePosition) {
    source.putJson(std::string(ChatDataAdapter::kChatDataKey),
                   json::array({session({{{"role", "user"}, {"content", "hi"}, {"timestamp", 100}}})}));
    auto first = run("ws9");
    auto second = run("ws9");
    ASSERT_EQ(first.threads.size(), 1u);
    EXPECT_EQ(first.threads[0].id, second.threads[0].id);
    EXPECT_EQ(first.messages[0].id, second.messages[0].id);

    EXPECT_EQ(first.threads[0].id, crypto::stableId({"ws9", "chatdata", "0", "100"}));
    EXPECT_EQ(first.messages[0].id, crypto::stableId({first.threads[0].id, "user", "0"}));
}

TEST_F(ChatDataAdapterTest, GlobalWorkspaceIsNotReportedAsWorkspaceId) {
    source.putJson(std::string(ChatDataAdapter::kPromptsKey),
                   json::array({{{"prompt", "x"}, {"timestamp", 1}}}));
    auto out = run("_global_");
    ASSERT_EQ(out.threads.size(), 1u);
    EXPECT_FALSE(out.threads[0].workspaceId.has_value());
}

TEST_F(ChatDataAdapterTest, MissingTimestampsUseTheClock) {
    source.putJson(std::string(ChatDataAdapter::kChatDataKey),
                   json::array({session({{{"role", "user"}, {"content", "no time"}}})}));
    auto out = run();
    ASSERT_EQ(out.messages.size(), 1u);
    EXPECT_EQ(out.messages[0].timestamp, 9'000'000);
}

TEST_F(ChatDataAdapterTest, QueryFailurePropagates) {
    FailingSource failing;
    auto out = adapter.extract(failing, context());
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, ErrorCode::QueryFailed);
}

TEST_F(ChatDataAdapterTest, NonArrayMessageListIsSkippedWithWarning) {
    json bad = json::object();
    bad["messages"] = json{{"role", "user"}, {"content", "not a list"}};
    json text = json::object();
    text["history"] = "just text";
    source.putJson(std::string(ChatDataAdapter::kChatDataKey),
                   json::array({bad, text, session({{{"content", "ok"}, {"timestamp", 5}}})}));

    auto out = run();
    ASSERT_EQ(out.threads.size(), 1u);
    EXPECT_EQ(out.skippedRecords, 2u);
    EXPECT_EQ(capture.count("[warning]"), 2u);
    EXPECT_NE(capture.text().find("not an array"), std::string::npos);
    EXPECT_NE(capture.text().find("Malformed record"), std::string::npos);
}

TEST_F(ChatDataAdapterTest, ResponseAtLargestTimestampStaysAfterPrompt) {
    const auto maxMillis = std::numeric_limits<EpochMillis>::max();
    source.putJson(std::string(ChatDataAdapter::kPromptsKey),
                   json::array({{{"prompt", "late"},
                                 {"response", "reply"},
                                 {"timestamp", maxMillis}}}));

    auto out = run();
    ASSERT_EQ(out.messages.size(), 2u);
    EXPECT_EQ(out.messages[0].timestamp, maxMillis);
    EXPECT_EQ(out.messages[1].timestamp, maxMillis);
    EXPECT_EQ(out.threads[0].createdAt, maxMillis);
    EXPECT_EQ(out.threads[0].updatedAt, maxMillis);
}

TEST_F(ChatDataAdapterTest, OutOfRangeTimestampsFallBackToTheClock) {
    json prompts = json::array();
    prompts.push_back({{"prompt", "huge float"}, {"timestamp", 1e300}});
    prompts.push_back({{"prompt", "negative float"}, {"timestamp", -1e300}});
    prompts.push_back(
        {{"prompt", "huge unsigned"}, {"timestamp", std::numeric_limits<std::uint64_t>::max()}});
    source.putJson(std::string(ChatDataAdapter::kPromptsKey), prompts);

    auto out = run();
    ASSERT_EQ(out.messages.size(), 3u);
    for (const auto& m : out.messages) {
        EXPECT_EQ(m.timestamp, 9'000'000) << m.content;
    }
}

TEST_F(ChatDataAdapterTest, LargeButValidFloatTimestampIsKept) {
    source.putJson(std::string(ChatDataAdapter::kChatDataKey),
                   json::array({session({{{"content", "float"}, {"timestamp", 1.7e12}}})}));
    auto out = run();
    ASSERT_EQ(out.messages.size(), 1u);
    EXPECT_EQ(out.messages[0].timestamp, EpochMillis{1'700'000'000'000});
}
