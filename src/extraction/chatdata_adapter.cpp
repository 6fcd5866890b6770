#include <chatmine/extraction/chatdata_adapter.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chatmine/crypto/hasher.h>
#include <chatmine/extraction/content_util.h>

#include "json_fields.h"
#include "thread_assembly.h"

namespace chatmine::extraction {

using json = nlohmann::json;
using namespace json_fields;

namespace {

constexpr std::string_view kPromptsSource = "prompts";

struct Pass {
    const ExtractionContext& ctx;
    spdlog::logger& log;
    EpochMillis now;
    AdapterOutput& out;

    void skip(std::string_view what, std::string_view reason) {
        ++out.skippedRecords;
        log.warn("chatdata: skipping {} ({}): {}", what, ErrorCode::MalformedRecord, reason);
    }
};

std::optional<Message> extractMessage(const json& raw, const std::string& threadId, size_t index,
                                      EpochMillis now) {
    auto content = firstString(raw, {"content", "text", "message"});
    if (!content)
        return std::nullopt;

    auto roleText = firstString(raw, {"role", "type", "sender"}).value_or("user");
    Message message;
    message.role = util::normalizeRole(roleText);
    message.id = crypto::stableId({threadId, roleToString(message.role), std::to_string(index)});
    message.threadId = threadId;
    message.content = std::move(*content);
    message.timestamp = firstTimestamp(raw, {"timestamp", "time"}).value_or(now);
    message.codeBlocks = util::extractCodeBlocks(message.content);
    message.metadata = json{{"originalIndex", index}, {"source", raw}};
    return message;
}

void extractSession(Pass& pass, const json& session, size_t index) {
    const std::string what = "chat session " + std::to_string(index);
    if (!session.is_object()) {
        pass.skip(what, "not an object");
        return;
    }

    const json* rawMessages = firstTruthy(session, {"messages", "history", "entries"});
    if (rawMessages && !rawMessages->is_array()) {
        pass.skip(what, "message list is not an array");
        return;
    }
    if (!rawMessages || rawMessages->empty()) {
        pass.log.debug("chatdata: {} has no messages", what);
        return;
    }

    const json* firstTs = field(rawMessages->front(), "timestamp");
    const std::string threadId =
        crypto::stableId({pass.ctx.workspaceId, ChatDataAdapter::kName, std::to_string(index),
                          timestampKey(firstTs, pass.now)});

    std::vector<Message> messages;
    for (size_t i = 0; i < rawMessages->size(); ++i) {
        if (auto m = extractMessage((*rawMessages)[i], threadId, i, pass.now)) {
            messages.push_back(std::move(*m));
        } else {
            pass.log.debug("chatdata: {} message {} has no content", what, i);
        }
    }
    if (messages.empty()) {
        pass.log.debug("chatdata: {} has no usable messages", what);
        return;
    }

    json metadata = {{"source", std::string(ChatDataAdapter::kName)}, {"originalIndex", index}};
    pass.out.threads.push_back(assembleThread(threadId, messages, pass.ctx.workspaceId,
                                              firstString(session, {"title"}),
                                              firstString(session, {"workspace"}),
                                              std::move(metadata)));
    for (auto& m : messages) {
        pass.out.messages.push_back(std::move(m));
    }
}

void extractChatData(Pass& pass, const json& data) {
    if (data.is_array()) {
        for (size_t i = 0; i < data.size(); ++i) {
            try {
                extractSession(pass, data[i], i);
            } catch (const json::exception& e) {
                pass.skip("chat session " + std::to_string(i), e.what());
            }
        }
        return;
    }

    if (data.is_object()) {
        if (const json* wrapped = firstTruthy(data, {"conversations", "chats"})) {
            if (!wrapped->is_array()) {
                pass.skip("chat data", "conversation list is not an array");
                return;
            }
            for (size_t i = 0; i < wrapped->size(); ++i) {
                try {
                    extractSession(pass, (*wrapped)[i], i);
                } catch (const json::exception& e) {
                    pass.skip("chat session " + std::to_string(i), e.what());
                }
            }
            return;
        }
        if (firstTruthy(data, {"messages", "history"})) {
            extractSession(pass, data, 0);
            return;
        }
    }

    pass.skip("chat data", "unrecognized shape");
}

void extractPrompt(Pass& pass, const json& prompt, size_t index) {
    const std::string what = "prompt " + std::to_string(index);
    auto text = firstString(prompt, {"prompt"});
    if (!text) {
        pass.skip(what, "missing prompt text");
        return;
    }

    const json* rawTs = field(prompt, "timestamp");
    const EpochMillis ts = firstTimestamp(prompt, {"timestamp"}).value_or(pass.now);
    const std::string threadId = crypto::stableId(
        {pass.ctx.workspaceId, kPromptsSource, std::to_string(index), timestampKey(rawTs, pass.now)});

    std::vector<Message> messages;
    Message user;
    user.id = crypto::stableId({threadId, "user", "0"});
    user.threadId = threadId;
    user.role = MessageRole::User;
    user.content = std::move(*text);
    user.timestamp = ts;
    user.codeBlocks = util::extractCodeBlocks(user.content);
    messages.push_back(std::move(user));

    if (auto response = firstString(prompt, {"response"})) {
        Message assistant;
        assistant.id = crypto::stableId({threadId, "assistant", "1"});
        assistant.threadId = threadId;
        assistant.role = MessageRole::Assistant;
        assistant.content = std::move(*response);
        // Responses carry no timestamp of their own; keep them ordered after the prompt
        assistant.timestamp = nextMillis(ts);
        assistant.codeBlocks = util::extractCodeBlocks(assistant.content);
        messages.push_back(std::move(assistant));
    }

    json metadata = {{"source", std::string(kPromptsSource)}, {"originalIndex", index}};
    pass.out.threads.push_back(assembleThread(threadId, messages, pass.ctx.workspaceId,
                                              std::nullopt, std::nullopt, std::move(metadata)));
    for (auto& m : messages) {
        pass.out.messages.push_back(std::move(m));
    }
}

void extractPrompts(Pass& pass, const json& data) {
    if (data.is_object() && field(data, "prompt")) {
        extractPrompt(pass, data, 0);
        return;
    }
    if (!data.is_array()) {
        pass.skip("prompt data", "unrecognized shape");
        return;
    }
    for (size_t i = 0; i < data.size(); ++i) {
        try {
            extractPrompt(pass, data[i], i);
        } catch (const json::exception& e) {
            pass.skip("prompt " + std::to_string(i), e.what());
        }
    }
}

} // namespace

Result<AdapterOutput> ChatDataAdapter::extract(storage::IKeyValueSource& source,
                                               const ExtractionContext& context) {
    auto entries =
        source.getEntriesByKeys({std::string(kChatDataKey), std::string(kPromptsKey)});
    if (!entries)
        return entries.error();

    AdapterOutput out;
    auto logger = context.logger ? context.logger : spdlog::default_logger();
    Pass pass{context, *logger, context.now ? context.now() : systemNowMillis(), out};

    for (const auto& entry : entries.value()) {
        json data = json::parse(entry.value, nullptr, false);
        if (data.is_discarded()) {
            pass.skip(entry.key, "value is not valid JSON");
            continue;
        }
        if (!truthy(data))
            continue;

        try {
            if (entry.key == kChatDataKey) {
                extractChatData(pass, data);
            } else {
                extractPrompts(pass, data);
            }
        } catch (const json::exception& e) {
            pass.skip(entry.key, e.what());
        }
    }

    logger->debug("chatdata: {} threads, {} messages, {} records skipped", out.threads.size(),
                  out.messages.size(), out.skippedRecords);
    return out;
}

} // namespace chatmine::extraction
