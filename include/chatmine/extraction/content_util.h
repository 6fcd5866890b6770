#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <chatmine/model/conversation.h>

namespace chatmine::extraction::util {

inline constexpr size_t kPreviewLength = 100;
inline constexpr size_t kMaxTitleLength = 60;
inline constexpr std::string_view kUntitledPlaceholder = "New Conversation";
inline constexpr std::string_view kDefaultCodeLanguage = "text";

/**
 * @brief Map a free-text role/type/sender value onto the four canonical roles
 *
 * Heuristic, case-insensitive substring match checked in this order:
 * "user"/"human" -> user, "assistant"/"ai"/"cursor"/"bot" -> assistant,
 * "system" -> system, "tool"/"function" -> tool. Anything else, including an
 * empty value, is treated as user. Unusual source labels can be misclassified.
 */
MessageRole normalizeRole(std::string_view raw);

/**
 * @brief Fenced code regions of @p content, in source order
 *
 * A region opens with ``` followed by an optional word-character language
 * tag (optionally "tag:filename") and a newline, and closes at the next ```.
 * The block content is the trimmed text in between; the language defaults to
 * "text". Unterminated fences produce nothing.
 */
std::vector<CodeBlock> extractCodeBlocks(std::string_view content);

/**
 * @brief Thread title from an explicit title or the first message
 *
 * A non-blank explicit title wins as-is. Otherwise the first line of
 * @p firstMessage is stripped of leading markdown markup; when that line opens
 * a fence, the next four lines are searched for the first non-fence line.
 * Results longer than kMaxTitleLength characters are cut with "...". Falls back
 * to kUntitledPlaceholder.
 */
std::string generateTitle(std::string_view firstMessage,
                          const std::optional<std::string>& explicitTitle = std::nullopt);

/// First kPreviewLength characters (UTF-8 code points) of @p content
std::string previewOf(std::string_view content);

/// Number of UTF-8 code points in @p text
size_t utf8Length(std::string_view text);

/// Leading @p maxChars code points of @p text, never splitting a multi-byte sequence
std::string utf8Prefix(std::string_view text, size_t maxChars);

/// @p text cut to @p maxChars code points with a trailing "..." when it is longer
std::string truncateWithEllipsis(std::string_view text, size_t maxChars);

std::string trimCopy(std::string_view input);

/**
 * @brief Mask likely secrets (API keys, bearer tokens, e-mail addresses)
 *
 * Every alphanumeric character inside a match is replaced with '*'.
 */
std::string sanitizeContent(std::string_view content);

} // namespace chatmine::extraction::util
