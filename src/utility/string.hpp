#pragma once

#include <string>
#include <string_view>

namespace utility {
std::string to_lower(std::string_view sv);
bool iequals(std::string_view a, std::string_view b) noexcept(true);
std::string_view trim_ows(std::string_view sv) noexcept(true);
// true if sv is a non-empty RFC 7230 token
bool is_token(std::string_view sv) noexcept(true);
// removes the backslashes of quoted-pairs
std::string unescape_quoted(std::string_view sv);
}  // namespace utility
