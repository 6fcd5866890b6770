#pragma once

#include <string_view>
#include <chatmine/extraction/format_adapter.h>

namespace chatmine::extraction {

/**
 * @brief Adapter for the legacy chat-panel storage format
 *
 * Reads two keys. The chat-panel key may hold a bare array of sessions, an
 * object wrapping "conversations" or "chats", or a single session object with
 * "messages"/"history". The prompts key holds prompt/response pairs; each pair
 * becomes a thread of its own.
 */
class ChatDataAdapter final : public IFormatAdapter {
public:
    static constexpr std::string_view kName = "chatdata";
    static constexpr std::string_view kChatDataKey = "workbench.panel.aichat.view.aichat.chatdata";
    static constexpr std::string_view kPromptsKey = "aiService.prompts";

    std::string name() const override { return std::string(kName); }

    Result<AdapterOutput> extract(storage::IKeyValueSource& source,
                                  const ExtractionContext& context) override;
};

} // namespace chatmine::extraction
