#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace configdesk::text {

// Strict UTF-8 decode. Returns nullopt for malformed or truncated sequences
// instead of substituting replacement characters.
std::optional<std::string> decodeUtf8(std::string_view bytes);

// First maxChars code points of a UTF-8 string
std::string truncateChars(const std::string& text, std::size_t maxChars);

// Drops a trailing "\n" or "\r\n"
std::string_view stripLineEnding(std::string_view line);

} // namespace configdesk::text
