#pragma once

#include <chx/media/value.hpp>

#include <cstddef>
#include <iterator>
#include <string>

namespace utility {
template <typename Container>
constexpr std::size_t base64_encode_length(Container&& view) noexcept(true) {
    const std::size_t _sz = std::size(view);
    return _sz != 0 ? (1 + ((_sz - 1) / 3)) * 4 : 0;
}

// standard alphabet, padded
std::string base64_encode(chx::media::binary_view input);
}  // namespace utility
