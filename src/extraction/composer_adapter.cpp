#include <chatmine/extraction/composer_adapter.h>

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

constexpr std::string_view kUnknownComposerId = "unknown";

struct Pass {
    const ExtractionContext& ctx;
    spdlog::logger& log;
    EpochMillis now;
    AdapterOutput& out;

    void skip(std::string_view what, std::string_view reason) {
        ++out.skippedRecords;
        log.warn("composer: skipping {} ({}): {}", what, ErrorCode::MalformedRecord, reason);
    }
};

std::string composerIdFromKey(std::string_view key) {
    auto pos = key.find(ComposerAdapter::kKeyPrefix);
    if (pos == std::string_view::npos)
        return std::string(kUnknownComposerId);
    auto id = key.substr(pos + ComposerAdapter::kKeyPrefix.size());
    return id.empty() ? std::string(kUnknownComposerId) : std::string(id);
}

// Message content and timestamp are extracted first; ids are assigned once the thread id is known
std::optional<Message> extractMessage(const json& raw, const std::string& composerId, size_t index,
                                      EpochMillis now) {
    auto content = firstString(raw, {"content", "text", "message", "prompt", "response"});
    if (!content)
        return std::nullopt;

    auto roleText = firstString(raw, {"role", "type", "sender"}).value_or("user");
    Message message;
    message.role = util::normalizeRole(roleText);
    message.content = std::move(*content);
    message.timestamp = firstTimestamp(raw, {"timestamp", "createdAt", "time"}).value_or(now);
    message.codeBlocks = util::extractCodeBlocks(message.content);

    json metadata = {{"originalIndex", index}, {"composerId", composerId}, {"source", raw}};
    for (const char* key : {"messageType", "contextFiles", "codebaseContexts"}) {
        if (const json* v = field(raw, key))
            metadata[key] = *v;
    }
    message.metadata = std::move(metadata);
    return message;
}

std::vector<Message> messagesFromConversation(Pass& pass, const json& conversation,
                                              const std::string& composerId) {
    std::vector<Message> messages;
    if (conversation.is_array()) {
        for (size_t i = 0; i < conversation.size(); ++i) {
            if (auto m = extractMessage(conversation[i], composerId, i, pass.now)) {
                messages.push_back(std::move(*m));
            }
        }
    } else if (conversation.is_object()) {
        if (auto m = extractMessage(conversation, composerId, 0, pass.now)) {
            messages.push_back(std::move(*m));
        }
    } else {
        pass.skip("composer " + composerId, "conversation is neither a list nor an object");
    }
    return messages;
}

std::vector<Message> messagesFromPrompt(const json& data, EpochMillis now) {
    const EpochMillis ts = firstTimestamp(data, {"timestamp"}).value_or(now);
    std::vector<Message> messages;
    if (auto prompt = firstString(data, {"prompt"})) {
        Message user;
        user.role = MessageRole::User;
        user.content = std::move(*prompt);
        user.timestamp = ts;
        user.codeBlocks = util::extractCodeBlocks(user.content);
        messages.push_back(std::move(user));
    }
    if (auto response = firstString(data, {"response"})) {
        Message assistant;
        assistant.role = MessageRole::Assistant;
        assistant.content = std::move(*response);
        assistant.timestamp = nextMillis(ts);
        assistant.codeBlocks = util::extractCodeBlocks(assistant.content);
        messages.push_back(std::move(assistant));
    }
    return messages;
}

void extractComposer(Pass& pass, const json& data, const std::string& composerId) {
    if (!data.is_object()) {
        pass.skip("composer " + composerId, "record is not an object");
        return;
    }

    std::vector<Message> messages;
    const json* conversation = firstTruthy(data, {"conversation", "messages", "history"});
    if (conversation) {
        messages = messagesFromConversation(pass, *conversation, composerId);
    } else if (firstString(data, {"prompt"})) {
        messages = messagesFromPrompt(data, pass.now);
    }
    if (messages.empty()) {
        pass.log.debug("composer: {} has no messages", composerId);
        return;
    }

    const std::string threadId =
        crypto::stableId({pass.ctx.workspaceId, ComposerAdapter::kName, composerId,
                          std::to_string(messages.front().timestamp)});
    for (size_t i = 0; i < messages.size(); ++i) {
        auto& m = messages[i];
        size_t index = i;
        if (m.metadata && m.metadata->contains("originalIndex")) {
            index = m.metadata->at("originalIndex").get<size_t>();
        }
        m.threadId = threadId;
        m.id = crypto::stableId({threadId, roleToString(m.role), std::to_string(index)});
    }

    json metadata = {{"source", std::string(ComposerAdapter::kName)}, {"composerId", composerId}};
    json original = json::object();
    for (const char* key : {"title", "tags", "starred"}) {
        if (const json* v = field(data, key))
            original[key] = *v;
    }
    if (!original.empty())
        metadata["originalData"] = std::move(original);

    pass.out.threads.push_back(assembleThread(threadId, messages, pass.ctx.workspaceId,
                                              firstString(data, {"title", "name"}),
                                              firstString(data, {"workspaceName"}),
                                              std::move(metadata)));
    for (auto& m : messages) {
        pass.out.messages.push_back(std::move(m));
    }
}

} // namespace

Result<AdapterOutput> ComposerAdapter::extract(storage::IKeyValueSource& source,
                                               const ExtractionContext& context) {
    auto entries = source.getEntriesByPrefix(kKeyPattern);
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
            extractComposer(pass, data, composerIdFromKey(entry.key));
        } catch (const json::exception& e) {
            pass.skip(entry.key, e.what());
        }
    }

    logger->debug("composer: {} threads, {} messages, {} records skipped", out.threads.size(),
                  out.messages.size(), out.skippedRecords);
    return out;
}

} // namespace chatmine::extraction
