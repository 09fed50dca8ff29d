#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace utility {
// strict UTF-8: rejects overlong forms, surrogates and code points above
// U+10FFFF
bool validate_utf8(const std::uint8_t* data, std::size_t length) noexcept(true);

inline bool validate_utf8(std::string_view sv) noexcept(true) {
    return validate_utf8(reinterpret_cast<const std::uint8_t*>(sv.data()),
                         sv.size());
}
}  // namespace utility
