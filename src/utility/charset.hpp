#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace utility {
enum class charset { utf8, ascii, latin1 };

// case-insensitive charset label lookup, std::nullopt for unknown labels
std::optional<charset> charset_from_name(std::string_view name) noexcept(true);

// UTF-8 text -> bytes in cs. std::nullopt if a character does not fit.
std::optional<std::string> encode_text(std::string_view utf8, charset cs);
// bytes in cs -> UTF-8 text. std::nullopt on invalid input.
std::optional<std::string> decode_text(std::string_view bytes, charset cs);
}  // namespace utility
