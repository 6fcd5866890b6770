#include <chatmine/normalize/snapshot_differ.h>

#include <spdlog/spdlog.h>
#include <unordered_map>
#include <unordered_set>

namespace chatmine::normalize {

SnapshotDiff diff(const NormalizationResult* previous, const NormalizationResult& current) {
    SnapshotDiff result;
    if (!previous) {
        result.newThreads = current.threads;
        result.newMessages = current.messages;
        return result;
    }

    std::unordered_map<std::string_view, const Thread*> oldThreads;
    oldThreads.reserve(previous->threads.size());
    for (const auto& t : previous->threads) {
        oldThreads.emplace(t.id, &t);
    }
    std::unordered_set<std::string_view> oldMessages;
    oldMessages.reserve(previous->messages.size());
    for (const auto& m : previous->messages) {
        oldMessages.insert(m.id);
    }

    for (const auto& t : current.threads) {
        auto it = oldThreads.find(t.id);
        if (it == oldThreads.end()) {
            result.newThreads.push_back(t);
        } else if (!(*it->second == t)) {
            result.updatedThreads.push_back(t);
        }
    }
    for (const auto& m : current.messages) {
        if (!oldMessages.count(m.id)) {
            result.newMessages.push_back(m);
        }
    }

    spdlog::debug("Snapshot diff: {} new threads, {} updated threads, {} new messages",
                  result.newThreads.size(), result.updatedThreads.size(),
                  result.newMessages.size());
    return result;
}

bool isEqual(const NormalizationResult& a, const NormalizationResult& b) {
    return a.threads == b.threads && a.messages == b.messages;
}

} // namespace chatmine::normalize
