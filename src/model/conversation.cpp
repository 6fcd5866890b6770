#include <chatmine/model/conversation.h>

#include <stdexcept>

namespace chatmine {

using json = nlohmann::json;

namespace {

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void getOptional(const json& j, const char* key, std::optional<T>& value) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        value = it->template get<T>();
    } else {
        value.reset();
    }
}

} // namespace

std::optional<MessageRole> roleFromString(std::string_view name) {
    if (name == "user")
        return MessageRole::User;
    if (name == "assistant")
        return MessageRole::Assistant;
    if (name == "system")
        return MessageRole::System;
    if (name == "tool")
        return MessageRole::Tool;
    return std::nullopt;
}

bool CodeBlock::operator==(const CodeBlock& other) const {
    return language == other.language && content == other.content && filename == other.filename;
}

bool Message::operator==(const Message& other) const {
    return id == other.id && threadId == other.threadId && role == other.role &&
           content == other.content && timestamp == other.timestamp &&
           codeBlocks == other.codeBlocks && metadata == other.metadata;
}

bool Thread::operator==(const Thread& other) const {
    return id == other.id && title == other.title && workspaceId == other.workspaceId &&
           workspaceName == other.workspaceName && createdAt == other.createdAt &&
           updatedAt == other.updatedAt && messageCount == other.messageCount &&
           lastMessage == other.lastMessage && metadata == other.metadata;
}

void to_json(json& j, const CodeBlock& block) {
    j = json{{"language", block.language}, {"content", block.content}};
    putOptional(j, "filename", block.filename);
}

void from_json(const json& j, CodeBlock& block) {
    block.language = j.value("language", std::string("text"));
    block.content = j.value("content", std::string());
    getOptional(j, "filename", block.filename);
}

void to_json(json& j, const Message& message) {
    j = json{{"id", message.id},
             {"threadId", message.threadId},
             {"role", roleToString(message.role)},
             {"content", message.content},
             {"timestamp", message.timestamp},
             {"codeBlocks", message.codeBlocks}};
    putOptional(j, "metadata", message.metadata);
}

void from_json(const json& j, Message& message) {
    message.id = j.at("id").get<std::string>();
    message.threadId = j.at("threadId").get<std::string>();
    auto role = roleFromString(j.at("role").get<std::string>());
    if (!role) {
        throw std::invalid_argument("unknown message role: " + j.at("role").dump());
    }
    message.role = *role;
    message.content = j.at("content").get<std::string>();
    message.timestamp = j.at("timestamp").get<EpochMillis>();
    message.codeBlocks = j.value("codeBlocks", std::vector<CodeBlock>{});
    getOptional(j, "metadata", message.metadata);
}

void to_json(json& j, const Thread& thread) {
    j = json{{"id", thread.id},
             {"createdAt", thread.createdAt},
             {"updatedAt", thread.updatedAt},
             {"messageCount", thread.messageCount},
             {"lastMessage", thread.lastMessage},
             {"metadata", thread.metadata}};
    putOptional(j, "title", thread.title);
    putOptional(j, "workspaceId", thread.workspaceId);
    putOptional(j, "workspaceName", thread.workspaceName);
}

void from_json(const json& j, Thread& thread) {
    thread.id = j.at("id").get<std::string>();
    getOptional(j, "title", thread.title);
    getOptional(j, "workspaceId", thread.workspaceId);
    getOptional(j, "workspaceName", thread.workspaceName);
    thread.createdAt = j.at("createdAt").get<EpochMillis>();
    thread.updatedAt = j.at("updatedAt").get<EpochMillis>();
    thread.messageCount = j.value("messageCount", size_t{0});
    thread.lastMessage = j.value("lastMessage", std::string());
    thread.metadata = j.value("metadata", json::object());
}

void to_json(json& j, const ResultMetadata& metadata) {
    j = json{{"databasePath", metadata.databasePath},
             {"workspaceId", metadata.workspaceId},
             {"extractedAt", metadata.extractedAt},
             {"adaptersUsed", metadata.adaptersUsed},
             {"totalThreads", metadata.totalThreads},
             {"totalMessages", metadata.totalMessages}};
}

void from_json(const json& j, ResultMetadata& metadata) {
    metadata.databasePath = j.value("databasePath", std::string());
    metadata.workspaceId = j.value("workspaceId", std::string("unknown"));
    metadata.extractedAt = j.value("extractedAt", EpochMillis{0});
    metadata.adaptersUsed = j.value("adaptersUsed", std::vector<std::string>{});
    metadata.totalThreads = j.value("totalThreads", size_t{0});
    metadata.totalMessages = j.value("totalMessages", size_t{0});
}

void to_json(json& j, const NormalizationResult& result) {
    j = json{{"threads", result.threads},
             {"messages", result.messages},
             {"metadata", result.metadata}};
}

void from_json(const json& j, NormalizationResult& result) {
    result.threads = j.value("threads", std::vector<Thread>{});
    result.messages = j.value("messages", std::vector<Message>{});
    result.metadata = j.value("metadata", ResultMetadata{});
}

void to_json(json& j, const SnapshotDiff& diff) {
    j = json{{"newThreads", diff.newThreads},
             {"newMessages", diff.newMessages},
             {"updatedThreads", diff.updatedThreads}};
}

} // namespace chatmine
