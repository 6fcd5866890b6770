#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <chatmine/core/types.h>

namespace chatmine {

/**
 * @brief Speaker of a message after normalization
 */
enum class MessageRole { User, Assistant, System, Tool };

constexpr const char* roleToString(MessageRole role) {
    switch (role) {
        case MessageRole::User:
            return "user";
        case MessageRole::Assistant:
            return "assistant";
        case MessageRole::System:
            return "system";
        case MessageRole::Tool:
            return "tool";
    }
    return "user";
}

/**
 * @brief Parse an already-normalized role name ("user", "assistant", ...)
 * @return The role, or std::nullopt for anything outside the four canonical names
 */
std::optional<MessageRole> roleFromString(std::string_view name);

/**
 * @brief A fenced code region lifted out of message content
 */
struct CodeBlock {
    std::string language; ///< Fence info tag, "text" when the fence has none
    std::string content;  ///< Trimmed text between the fences
    std::optional<std::string> filename;

    bool operator==(const CodeBlock& other) const;
};

/**
 * @brief One turn in a conversation
 */
struct Message {
    std::string id;
    std::string threadId;
    MessageRole role = MessageRole::User;
    std::string content;
    EpochMillis timestamp = 0;
    std::vector<CodeBlock> codeBlocks;
    std::optional<nlohmann::json> metadata;

    bool operator==(const Message& other) const;
};

/**
 * @brief One normalized conversation
 *
 * messageCount always equals the number of Message records carrying this id
 * in the same NormalizationResult, and updatedAt >= createdAt.
 */
struct Thread {
    std::string id;
    std::optional<std::string> title;
    std::optional<std::string> workspaceId;
    std::optional<std::string> workspaceName;
    EpochMillis createdAt = 0;
    EpochMillis updatedAt = 0;
    size_t messageCount = 0;
    std::string lastMessage; ///< Preview of the latest message, at most 100 characters
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const Thread& other) const;
};

/**
 * @brief Provenance and totals of one per-database normalization pass
 */
struct ResultMetadata {
    std::string databasePath;
    std::string workspaceId;
    EpochMillis extractedAt = 0;
    std::vector<std::string> adaptersUsed;
    size_t totalThreads = 0;
    size_t totalMessages = 0;
};

/**
 * @brief Output bundle of normalizing one database. Treated as immutable once returned.
 */
struct NormalizationResult {
    std::vector<Thread> threads;
    std::vector<Message> messages;
    ResultMetadata metadata;
};

/**
 * @brief Entities to push for an incremental sync between two snapshots
 */
struct SnapshotDiff {
    std::vector<Thread> newThreads;
    std::vector<Message> newMessages;
    std::vector<Thread> updatedThreads;

    [[nodiscard]] bool empty() const {
        return newThreads.empty() && newMessages.empty() && updatedThreads.empty();
    }
};

// JSON wire mapping (camelCase field names, absent optionals omitted)
void to_json(nlohmann::json& j, const CodeBlock& block);
void from_json(const nlohmann::json& j, CodeBlock& block);
void to_json(nlohmann::json& j, const Message& message);
void from_json(const nlohmann::json& j, Message& message);
void to_json(nlohmann::json& j, const Thread& thread);
void from_json(const nlohmann::json& j, Thread& thread);
void to_json(nlohmann::json& j, const ResultMetadata& metadata);
void from_json(const nlohmann::json& j, ResultMetadata& metadata);
void to_json(nlohmann::json& j, const NormalizationResult& result);
void from_json(const nlohmann::json& j, NormalizationResult& result);
void to_json(nlohmann::json& j, const SnapshotDiff& diff);

} // namespace chatmine
