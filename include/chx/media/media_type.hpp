#pragma once

#include <map>
#include <string>
#include <string_view>

namespace chx::media {
/*
normalized media type
- type, subtype and suffix are lowercase
- parameter keys are lowercase, the charset value is lowercase, other values
  keep their case
- parameters are kept sorted by key, so to_string() is canonical
*/
struct media_type {
    std::string type;
    std::string subtype;
    std::string suffix;
    std::map<std::string, std::string> parameters;

    media_type() = default;
    media_type(const media_type&) = default;
    media_type(media_type&&) = default;
    media_type& operator=(const media_type&) = default;
    media_type& operator=(media_type&&) = default;

    media_type(std::string type, std::string subtype, std::string suffix = {});

    // throws malformed_media_type
    static media_type parse(std::string_view sv);

    bool is_wildcard() const noexcept(true) {
        return type == "*" && subtype == "*";
    }
    bool is_subtype_wildcard() const noexcept(true) {
        return type != "*" && subtype == "*";
    }

    // type/subtype[+suffix], no parameters
    std::string essence() const;
    // type/subtype[+suffix][; k=v]...
    std::string to_string() const;

    bool operator==(const media_type& other) const noexcept(true) {
        return type == other.type && subtype == other.subtype &&
               suffix == other.suffix && parameters == other.parameters;
    }
    bool operator!=(const media_type& other) const noexcept(true) {
        return !(*this == other);
    }
};

// canonical registry key, throws malformed_media_type
inline std::string normalize_media_type(std::string_view sv) {
    return media_type::parse(sv).to_string();
}
}  // namespace chx::media
