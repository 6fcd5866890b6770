#pragma once

#include <nlohmann/json.hpp>
#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include <chatmine/discovery/path_discovery.h>
#include <chatmine/extraction/content_util.h>
#include <chatmine/model/conversation.h>

namespace chatmine::extraction {

/// Thread summary over its already-extracted, non-empty message list
inline Thread assembleThread(std::string id, const std::vector<Message>& messages,
                             const std::string& workspaceId,
                             const std::optional<std::string>& explicitTitle,
                             std::optional<std::string> workspaceName, nlohmann::json metadata) {
    Thread thread;
    thread.id = std::move(id);
    thread.title = util::generateTitle(messages.front().content, explicitTitle);
    if (workspaceId != discovery::kGlobalWorkspaceId) {
        thread.workspaceId = workspaceId;
    }
    thread.workspaceName = std::move(workspaceName);
    thread.createdAt = messages.front().timestamp;
    thread.updatedAt = thread.createdAt;
    for (const auto& m : messages) {
        thread.updatedAt = std::max(thread.updatedAt, m.timestamp);
    }
    thread.messageCount = messages.size();
    thread.lastMessage = util::previewOf(messages.back().content);
    thread.metadata = std::move(metadata);
    return thread;
}

} // namespace chatmine::extraction
