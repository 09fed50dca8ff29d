#pragma once

#include "./accept.hpp"
#include "./registry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chx::media {
/*
proactive negotiation, RFC 7231 section 5.3.2
1. each available type takes the quality of the most specific range that
   matches it: type/subtype beats type/* beats */*, then more parameters,
   then higher quality
2. a range matches only if every one of its parameters is present on the
   available type with the same value
3. highest quality wins, then the more specific match, then the earlier
   available type
*/
// index into available, std::nullopt when nothing matches
std::optional<std::size_t>
select_content_type(const std::vector<accept_range>& ranges,
                    const std::vector<media_type>& available);

// Picks the response type for an Accept header value against the registry.
// An absent header means the default content type, or */* without one. A
// malformed header or no match falls back to the default content type.
// Returns the normalized media type, throws no_acceptable_type.
std::string negotiate(const content_registry& registry,
                      std::optional<std::string_view> accept);
}  // namespace chx::media
