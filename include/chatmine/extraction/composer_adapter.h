#pragma once

#include <string_view>
#include <chatmine/extraction/format_adapter.h>

namespace chatmine::extraction {

/**
 * @brief Adapter for the modern composer storage format
 *
 * Every "composerData:<id>" key holds one conversation. Messages are taken
 * from "conversation", "messages" or "history" (array or single object); a
 * record with only a top-level prompt/response becomes a two-message thread.
 */
class ComposerAdapter final : public IFormatAdapter {
public:
    static constexpr std::string_view kName = "composer";
    static constexpr std::string_view kKeyPrefix = "composerData:";
    static constexpr std::string_view kKeyPattern = "composerData:%";

    std::string name() const override { return std::string(kName); }

    Result<AdapterOutput> extract(storage::IKeyValueSource& source,
                                  const ExtractionContext& context) override;
};

} // namespace chatmine::extraction
