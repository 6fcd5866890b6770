#include <chatmine/extraction/format_adapter.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <chatmine/extraction/chatdata_adapter.h>
#include <chatmine/extraction/composer_adapter.h>

namespace chatmine::extraction {

EpochMillis systemNowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void AdapterRegistry::registerAdapter(const std::string& name, AdapterCreator creator) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const Entry& e) { return e.name == name; });
    if (it != entries_.end()) {
        it->creator = std::move(creator);
        spdlog::debug("AdapterRegistry: replaced adapter '{}'", name);
        return;
    }
    entries_.push_back(Entry{name, std::move(creator)});
    spdlog::debug("AdapterRegistry: registered adapter '{}' at precedence {}", name,
                  entries_.size() - 1);
}

std::unique_ptr<IFormatAdapter> AdapterRegistry::create(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return entry.creator();
        }
    }
    return nullptr;
}

std::vector<std::string> AdapterRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.name);
    }
    return out;
}

bool AdapterRegistry::contains(std::string_view name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [name](const Entry& e) { return e.name == name; });
}

AdapterRegistry AdapterRegistry::withBuiltins() {
    AdapterRegistry registry;
    registry.registerAdapter(std::string(ComposerAdapter::kName),
                             []() { return std::make_unique<ComposerAdapter>(); });
    registry.registerAdapter(std::string(ChatDataAdapter::kName),
                             []() { return std::make_unique<ChatDataAdapter>(); });
    return registry;
}

} // namespace chatmine::extraction
