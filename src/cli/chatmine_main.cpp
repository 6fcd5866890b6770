#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <thread>
#include <chatmine/config/config_helpers.h>
#include <chatmine/normalize/normalizer.h>
#include <chatmine/normalize/snapshot_differ.h>

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

} // namespace

namespace chatmine::cli {

using json = nlohmann::json;

class ChatmineCli {
public:
    ChatmineCli() : app_("chatmine", "Extract AI chat history from local editor databases") {
        setupApp();
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }

        spdlog::set_level(spdlog::level::from_str(logLevel_));

        try {
            if (app_.got_subcommand("extract"))
                return runExtract();
            if (app_.got_subcommand("watch"))
                return runWatch();
        } catch (const std::exception& e) {
            spdlog::critical("chatmine: {}", e.what());
            return 1;
        }

        std::cout << app_.help() << std::endl;
        return 0;
    }

private:
    CLI::App app_;
    std::string logLevel_ = "info";
    std::string configPath_;

    bool dryRun_ = false;
    std::string outputPath_;
    std::string previousPath_;

    int64_t intervalMs_ = 5000;
    size_t iterations_ = 0;

    void setupApp() {
        app_.set_version_flag("-V,--version", "0.1.0");
        app_.require_subcommand(0, 1);
        // Global options are also accepted after the subcommand name
        app_.fallthrough();

        app_.add_option("--log-level", logLevel_, "Log level (logs go to stderr)")
            ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
        app_.add_option("-c,--config", configPath_, "Config file (default: standard config path)");

        auto* extract = app_.add_subcommand("extract", "Run one normalization pass");
        extract->add_flag("--dry", dryRun_, "Print a per-database summary instead of JSON");
        extract->add_option("-o,--output", outputPath_, "Write JSON to this file instead of stdout");
        extract->add_option("--previous", previousPath_,
                            "Earlier extract output; emit only the changes since then")
            ->check(CLI::ExistingFile);

        auto* watch = app_.add_subcommand("watch", "Poll databases and print one diff per change");
        watch->add_option("--interval", intervalMs_, "Poll interval in milliseconds")
            ->check(CLI::Range(int64_t{100}, int64_t{86'400'000}));
        watch->add_option("--iterations", iterations_, "Stop after N passes (0 = until interrupted)");
    }

    std::optional<normalize::Normalizer> makeNormalizer() {
        auto cfg = config::loadExtractorConfig(config::get_config_path(configPath_),
                                               !configPath_.empty());
        if (!cfg) {
            spdlog::error("Config error: {}", cfg.error().message);
            return std::nullopt;
        }

        auto discoveryOptions = discovery::DiscoveryOptions::fromEnvironment();
        if (discoveryOptions.baseDirOverride.empty() && cfg.value().cursorUserDir) {
            discoveryOptions.baseDirOverride.push_back(*cfg.value().cursorUserDir);
        }
        return normalize::Normalizer(cfg.value().normalizer, std::move(discoveryOptions));
    }

    static json diffToJson(const NormalizationResult& current, const SnapshotDiff& d) {
        json j = d;
        j["databasePath"] = current.metadata.databasePath;
        j["workspaceId"] = current.metadata.workspaceId;
        return j;
    }

    bool writeOutput(const std::string& text) {
        if (outputPath_.empty()) {
            std::cout << text << std::endl;
            return true;
        }
        std::ofstream out(outputPath_, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write {}", outputPath_);
            return false;
        }
        out << text << '\n';
        return static_cast<bool>(out);
    }

    std::optional<std::map<std::string, NormalizationResult>> loadPrevious() {
        std::ifstream in(previousPath_);
        if (!in) {
            spdlog::error("Cannot read {}", previousPath_);
            return std::nullopt;
        }
        try {
            auto previous = json::parse(in).get<std::vector<NormalizationResult>>();
            std::map<std::string, NormalizationResult> byPath;
            for (auto& r : previous) {
                byPath[r.metadata.databasePath] = std::move(r);
            }
            return byPath;
        } catch (const std::exception& e) {
            spdlog::error("Invalid snapshot file {}: {}", previousPath_, e.what());
            return std::nullopt;
        }
    }

    int runExtract() {
        auto normalizer = makeNormalizer();
        if (!normalizer)
            return 1;

        auto results = normalizer->normalizeAllDatabases();
        if (!results) {
            spdlog::error("{}", results.error().message);
            return 1;
        }
        const auto& stats = normalizer->lastPassStats();

        if (dryRun_) {
            for (const auto& r : results.value()) {
                std::cout << fmt::format("{}\n  workspace: {}  threads: {}  messages: {}  "
                                         "adapters: {}\n",
                                         r.metadata.databasePath, r.metadata.workspaceId,
                                         r.metadata.totalThreads, r.metadata.totalMessages,
                                         fmt::join(r.metadata.adaptersUsed, ","));
            }
            std::cout << fmt::format("{} databases found, {} skipped, {} empty, {} records "
                                     "skipped\n",
                                     stats.databasesFound, stats.databasesSkipped,
                                     stats.databasesEmpty, stats.recordsSkipped);
            return 0;
        }

        if (!previousPath_.empty()) {
            auto previous = loadPrevious();
            if (!previous)
                return 1;
            json diffs = json::array();
            for (const auto& r : results.value()) {
                auto it = previous->find(r.metadata.databasePath);
                const NormalizationResult* before = it == previous->end() ? nullptr : &it->second;
                if (before && normalize::isEqual(*before, r))
                    continue;
                auto d = normalize::diff(before, r);
                if (!d.empty())
                    diffs.push_back(diffToJson(r, d));
            }
            return writeOutput(diffs.dump(2)) ? 0 : 1;
        }

        json out = results.value();
        return writeOutput(out.dump(2)) ? 0 : 1;
    }

    int runWatch() {
        auto normalizer = makeNormalizer();
        if (!normalizer)
            return 1;

        std::map<std::string, NormalizationResult> snapshots;
        for (size_t pass = 0; !g_interrupted && (iterations_ == 0 || pass < iterations_); ++pass) {
            auto results = normalizer->normalizeAllDatabases();
            if (!results) {
                spdlog::error("{}", results.error().message);
                return 1;
            }

            for (auto& r : results.value()) {
                auto it = snapshots.find(r.metadata.databasePath);
                const NormalizationResult* before = it == snapshots.end() ? nullptr : &it->second;
                if (before && normalize::isEqual(*before, r))
                    continue;

                auto d = normalize::diff(before, r);
                if (!d.empty()) {
                    std::cout << diffToJson(r, d).dump() << std::endl;
                }
                snapshots[r.metadata.databasePath] = std::move(r);
            }

            if (iterations_ != 0 && pass + 1 >= iterations_)
                break;
            sleepInterruptibly(std::chrono::milliseconds(intervalMs_));
        }
        return 0;
    }

    static void sleepInterruptibly(std::chrono::milliseconds total) {
        constexpr auto kSlice = std::chrono::milliseconds(100);
        auto deadline = std::chrono::steady_clock::now() + total;
        while (!g_interrupted && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kSlice);
        }
    }
};

} // namespace chatmine::cli

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // stdout carries JSON only
    auto logger = spdlog::stderr_color_mt("chatmine");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_default_logger(logger);

    chatmine::cli::ChatmineCli app;
    return app.run(argc, argv);
}
