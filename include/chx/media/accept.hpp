#pragma once

#include "./media_type.hpp"

#include <string_view>
#include <vector>

namespace chx::media {
struct accept_range {
    media_type range;
    double quality = 1.0;
};

// Accept header -> weighted media ranges in header order. Ranges with q=0 are
// dropped. Throws malformed_media_type.
std::vector<accept_range> parse_accept(std::string_view header);
}  // namespace chx::media
