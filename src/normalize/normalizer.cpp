#include <chatmine/normalize/normalizer.h>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <chatmine/extraction/content_util.h>
#include <chatmine/storage/safe_reader.h>

namespace chatmine::normalize {

namespace fs = std::filesystem;

bool NormalizerOptions::isAdapterEnabled(std::string_view name) const {
    auto it = enabledAdapters.find(name);
    return it == enabledAdapters.end() || it->second;
}

Normalizer::Normalizer(NormalizerOptions options, discovery::DiscoveryOptions discoveryOptions,
                       std::shared_ptr<spdlog::logger> logger,
                       extraction::AdapterRegistry registry)
    : options_(std::move(options)),
      discovery_(std::move(discoveryOptions), logger),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      registry_(std::move(registry)) {}

Result<NormalizationResult> Normalizer::normalizeDatabase(const fs::path& dbPath) {
    const std::string workspaceId = discovery::PathDiscovery::workspaceIdFor(dbPath).value_or(
        std::string(discovery::kUnknownWorkspaceId));

    storage::SafeReader reader(dbPath, logger_);
    if (auto opened = reader.open(); !opened) {
        return opened.error();
    }

    extraction::ExtractionContext context;
    context.workspaceId = workspaceId;
    context.logger = logger_;
    context.now = clock_;

    NormalizationResult merged;
    for (const auto& name : registry_.names()) {
        if (!options_.isAdapterEnabled(name)) {
            logger_->debug("Adapter '{}' disabled by configuration", name);
            continue;
        }
        if (options_.preferModern && !merged.threads.empty()) {
            logger_->debug("Skipping adapter '{}' for {}: an earlier adapter produced threads",
                           name, dbPath.string());
            continue;
        }

        auto adapter = registry_.create(name);
        if (!adapter)
            continue;

        auto output = adapter->extract(reader, context);
        if (!output) {
            return Error{ErrorCode::QueryFailed, "Adapter '" + name + "' failed on " +
                                                     dbPath.string() + ": " +
                                                     output.error().message};
        }
        auto& out = output.value();
        stats_.recordsSkipped += out.skippedRecords;
        if (out.threads.empty())
            continue;

        if (merged.threads.empty()) {
            merged.threads = std::move(out.threads);
            merged.messages = std::move(out.messages);
            merged.metadata.adaptersUsed.push_back(name);
            continue;
        }

        // Earlier adapters win: only threads with unseen ids are added, with their messages
        std::unordered_set<std::string> known;
        for (const auto& t : merged.threads) {
            known.insert(t.id);
        }
        std::unordered_set<std::string> added;
        for (auto& t : out.threads) {
            if (known.insert(t.id).second) {
                added.insert(t.id);
                merged.threads.push_back(std::move(t));
            }
        }
        if (added.empty()) {
            logger_->debug("Adapter '{}' added nothing new for {}", name, dbPath.string());
            continue;
        }
        for (auto& m : out.messages) {
            if (added.count(m.threadId)) {
                merged.messages.push_back(std::move(m));
            }
        }
        merged.metadata.adaptersUsed.push_back(name);
    }
    reader.close();

    if (options_.redactSecrets) {
        redact(merged);
    }

    merged.metadata.databasePath = dbPath.string();
    merged.metadata.workspaceId = workspaceId;
    merged.metadata.extractedAt = clock_ ? clock_() : extraction::systemNowMillis();
    applyRetention(merged, options_.maxThreadsPerDb, options_.maxMessagesPerThread);

    logger_->debug("Normalized {}: {} threads, {} messages via [{}]", dbPath.string(),
                   merged.metadata.totalThreads, merged.metadata.totalMessages,
                   fmt::join(merged.metadata.adaptersUsed, ", "));
    return merged;
}

Result<std::vector<NormalizationResult>> Normalizer::normalizeAllDatabases() {
    stats_ = PassStats{};

    auto databases = discovery_.findDatabases();
    if (!databases) {
        return databases.error();
    }
    stats_.databasesFound = databases.value().size();

    std::vector<NormalizationResult> results;
    for (const auto& dbPath : databases.value()) {
        Result<NormalizationResult> result = Error{ErrorCode::Unknown, "not run"};
        try {
            result = normalizeDatabase(dbPath);
        } catch (const std::exception& e) {
            result = Error{ErrorCode::InternalError, e.what()};
        }

        if (!result) {
            ++stats_.databasesSkipped;
            logger_->error("Skipping database {}: {}", dbPath.string(), result.error().message);
            continue;
        }
        if (result.value().threads.empty()) {
            ++stats_.databasesEmpty;
            logger_->debug("No conversations in {}", dbPath.string());
            continue;
        }
        results.push_back(std::move(result).value());
    }

    logger_->info("Normalization pass: {} databases found, {} with conversations, {} skipped, "
                  "{} empty, {} records skipped",
                  stats_.databasesFound, results.size(), stats_.databasesSkipped,
                  stats_.databasesEmpty, stats_.recordsSkipped);
    return results;
}

void Normalizer::applyRetention(NormalizationResult& result, size_t maxThreads,
                                size_t maxMessages) {
    auto& threads = result.threads;
    if (maxThreads > 0 && threads.size() > maxThreads) {
        std::stable_sort(threads.begin(), threads.end(), [](const Thread& a, const Thread& b) {
            return a.updatedAt > b.updatedAt;
        });
        threads.resize(maxThreads);
    }

    std::unordered_map<std::string, std::vector<Message>> groups;
    for (const auto& t : threads) {
        groups.emplace(t.id, std::vector<Message>{});
    }
    for (auto& m : result.messages) {
        auto it = groups.find(m.threadId);
        if (it != groups.end()) {
            it->second.push_back(std::move(m));
        }
    }

    std::vector<Message> kept;
    for (auto& t : threads) {
        auto& group = groups[t.id];
        std::stable_sort(group.begin(), group.end(), [](const Message& a, const Message& b) {
            return a.timestamp < b.timestamp;
        });
        if (maxMessages > 0 && group.size() > maxMessages) {
            group.resize(maxMessages);
        }
        t.messageCount = group.size();
        if (!group.empty()) {
            t.lastMessage = extraction::util::previewOf(group.back().content);
        }
        for (auto& m : group) {
            kept.push_back(std::move(m));
        }
    }
    result.messages = std::move(kept);

    result.metadata.totalThreads = result.threads.size();
    result.metadata.totalMessages = result.messages.size();
}

void Normalizer::redact(NormalizationResult& result) const {
    using extraction::util::sanitizeContent;
    for (auto& m : result.messages) {
        m.content = sanitizeContent(m.content);
        m.codeBlocks = extraction::util::extractCodeBlocks(m.content);
    }
    for (auto& t : result.threads) {
        if (t.title) {
            t.title = sanitizeContent(*t.title);
        }
        t.lastMessage = sanitizeContent(t.lastMessage);
    }
}

} // namespace chatmine::normalize
