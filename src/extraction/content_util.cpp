#include <chatmine/extraction/content_util.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace chatmine::extraction::util {

namespace {

constexpr std::string_view kFence = "```";
constexpr size_t kTitleFenceLookahead = 4;

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isTitleMarkup(char c) {
    return c == '#' || c == '*' || c == '>' || c == '-' ||
           std::isspace(static_cast<unsigned char>(c));
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (true) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, end - pos));
        pos = end + 1;
    }
    return lines;
}

bool startsWithFence(std::string_view line) {
    return line.substr(0, kFence.size()) == kFence;
}

std::string lowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}


// Secret and e-mail scanners. Each one is a single forward pass so that
// arbitrarily long tokens (pasted blobs, minified code) stay linear.

constexpr size_t kMinSecretLength = 8;

bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiAlnum(char c) {
    return isAsciiAlpha(c) || (c >= '0' && c <= '9');
}

bool isSpaceOrQuote(char c) {
    return c == '"' || std::isspace(static_cast<unsigned char>(c));
}

bool isKeyValueChar(char c) {
    return isAsciiAlnum(c) || c == '_' || c == '-' || c == '/' || c == '+';
}

bool isTokenValueChar(char c) {
    return isKeyValueChar(c) || c == '.';
}

bool isEmailLocalChar(char c) {
    return isAsciiAlnum(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

bool isEmailDomainChar(char c) {
    return isAsciiAlnum(c) || c == '.' || c == '-';
}

bool startsWithIgnoreCase(std::string_view text, size_t pos, std::string_view word) {
    if (text.size() - pos < word.size())
        return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != word[i])
            return false;
    }
    return true;
}

void maskRange(std::string& text, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        if (std::isalnum(static_cast<unsigned char>(text[i])))
            text[i] = '*';
    }
}

// Length of `<keyword>["\s]*[:=]["\s]*<value>{8,}` starting at pos, or 0
size_t matchAssignment(std::string_view text, size_t pos,
                       std::initializer_list<std::string_view> keywords, bool (*valueChar)(char)) {
    for (std::string_view keyword : keywords) {
        if (!startsWithIgnoreCase(text, pos, keyword))
            continue;
        size_t i = pos + keyword.size();
        while (i < text.size() && isSpaceOrQuote(text[i]))
            ++i;
        if (i >= text.size() || (text[i] != ':' && text[i] != '='))
            continue;
        ++i;
        while (i < text.size() && isSpaceOrQuote(text[i]))
            ++i;
        const size_t valueStart = i;
        while (i < text.size() && valueChar(text[i]))
            ++i;
        if (i - valueStart >= kMinSecretLength)
            return i - pos;
    }
    return 0;
}

void maskAssignments(std::string& text, std::initializer_list<std::string_view> keywords,
                     bool (*valueChar)(char)) {
    size_t i = 0;
    while (i < text.size()) {
        if (size_t len = matchAssignment(text, i, keywords, valueChar)) {
            maskRange(text, i, i + len);
            i += len;
        } else {
            ++i;
        }
    }
}

// local@domain.tld where the tld is two or more letters after the last usable dot
void maskEmails(std::string& text) {
    size_t consumed = 0;
    for (size_t at = text.find('@'); at != std::string::npos; at = text.find('@', at + 1)) {
        if (at < consumed)
            continue;
        size_t begin = at;
        while (begin > consumed && isEmailLocalChar(text[begin - 1]))
            --begin;
        if (begin == at)
            continue;

        size_t domainEnd = at + 1;
        while (domainEnd < text.size() && isEmailDomainChar(text[domainEnd]))
            ++domainEnd;

        size_t end = 0;
        for (size_t dot = domainEnd; dot > at + 2; --dot) {
            if (text[dot - 1] != '.')
                continue;
            size_t tldEnd = dot;
            while (tldEnd < domainEnd && isAsciiAlpha(text[tldEnd]))
                ++tldEnd;
            if (tldEnd - dot >= 2) {
                end = tldEnd;
                break;
            }
        }
        if (end == 0)
            continue;

        maskRange(text, begin, end);
        consumed = end;
    }
}

} // namespace

std::string trimCopy(std::string_view input) {
    size_t start = 0;
    size_t end = input.size();
    while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

MessageRole normalizeRole(std::string_view raw) {
    const std::string role = lowerCopy(raw);
    auto has = [&role](std::string_view needle) { return role.find(needle) != std::string::npos; };

    if (has("user") || has("human"))
        return MessageRole::User;
    if (has("assistant") || has("ai") || has("cursor") || has("bot"))
        return MessageRole::Assistant;
    if (has("system"))
        return MessageRole::System;
    if (has("tool") || has("function"))
        return MessageRole::Tool;
    return MessageRole::User;
}

std::vector<CodeBlock> extractCodeBlocks(std::string_view content) {
    std::vector<CodeBlock> blocks;
    size_t pos = 0;
    while (pos < content.size()) {
        const size_t open = content.find(kFence, pos);
        if (open == std::string_view::npos)
            break;

        size_t i = open + kFence.size();
        const size_t tagStart = i;
        while (i < content.size() && isWordChar(content[i])) {
            ++i;
        }
        std::string language(content.substr(tagStart, i - tagStart));

        std::optional<std::string> filename;
        if (!language.empty() && i < content.size() && content[i] == ':') {
            const size_t nameStart = ++i;
            while (i < content.size() && content[i] != '\n' &&
                   !std::isspace(static_cast<unsigned char>(content[i]))) {
                ++i;
            }
            if (i > nameStart) {
                filename = std::string(content.substr(nameStart, i - nameStart));
            }
        }

        // The opener must end its line; otherwise retry from the next character
        if (i >= content.size() || content[i] != '\n') {
            pos = open + 1;
            continue;
        }

        const size_t bodyStart = i + 1;
        const size_t close = content.find(kFence, bodyStart);
        if (close == std::string_view::npos) {
            pos = open + 1;
            continue;
        }

        CodeBlock block;
        block.language = language.empty() ? std::string(kDefaultCodeLanguage) : std::move(language);
        block.content = trimCopy(content.substr(bodyStart, close - bodyStart));
        block.filename = std::move(filename);
        blocks.push_back(std::move(block));
        pos = close + kFence.size();
    }
    return blocks;
}

std::string generateTitle(std::string_view firstMessage,
                          const std::optional<std::string>& explicitTitle) {
    if (explicitTitle) {
        auto trimmed = trimCopy(*explicitTitle);
        if (!trimmed.empty())
            return trimmed;
    }

    const std::string content = trimCopy(firstMessage);
    const auto lines = splitLines(content);
    std::string_view first = lines.front();
    size_t skip = 0;
    while (skip < first.size() && isTitleMarkup(first[skip])) {
        ++skip;
    }
    std::string title = trimCopy(first.substr(skip));

    if (startsWithFence(title)) {
        title.clear();
        for (size_t i = 1; i < lines.size() && i <= kTitleFenceLookahead; ++i) {
            auto candidate = trimCopy(lines[i]);
            if (!candidate.empty() && !startsWithFence(lines[i])) {
                title = std::move(candidate);
                break;
            }
        }
    }

    title = truncateWithEllipsis(title, kMaxTitleLength);
    return title.empty() ? std::string(kUntitledPlaceholder) : title;
}

size_t utf8Length(std::string_view text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string utf8Prefix(std::string_view text, size_t maxChars) {
    size_t chars = 0;
    size_t i = 0;
    for (; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (chars == maxChars)
                break;
            ++chars;
        }
    }
    return std::string(text.substr(0, i));
}

std::string previewOf(std::string_view content) {
    return utf8Prefix(content, kPreviewLength);
}

std::string truncateWithEllipsis(std::string_view text, size_t maxChars) {
    if (utf8Length(text) <= maxChars)
        return std::string(text);
    if (maxChars <= 3)
        return utf8Prefix(text, maxChars);
    return utf8Prefix(text, maxChars - 3) + "...";
}

std::string sanitizeContent(std::string_view content) {
    std::string sanitized(content);
    maskAssignments(sanitized,
                    {"api_key", "api-key", "apikey", "secret", "token", "password", "pass", "pwd"},
                    isKeyValueChar);
    maskAssignments(sanitized, {"bearer", "authorization"}, isTokenValueChar);
    maskEmails(sanitized);
    return sanitized;
}

} // namespace chatmine::extraction::util
