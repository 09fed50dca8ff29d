#include "./media_type_grammar.hpp"
#include "../utility/string.hpp"

#include <chx/media/exception.hpp>
#include <chx/media/media_type.hpp>

namespace media = chx::media;

namespace chx::media::detail {
media_type from_raw(const raw_media_type& raw) {
    media_type __r;
    __r.type = utility::to_lower(raw.type);
    __r.subtype = utility::to_lower(raw.sub_type);
    if (std::size_t plus = __r.subtype.rfind('+');
        plus != std::string::npos && plus != 0 &&
        plus + 1 != __r.subtype.size()) {
        __r.suffix = __r.subtype.substr(plus + 1);
        __r.subtype.resize(plus);
    }
    if (__r.type == "*" && __r.subtype != "*") {
        __CHXMEDIA_THROW(malformed_media_type,
                         "wildcard type with concrete subtype: " +
                             std::string(raw.type) + "/" +
                             std::string(raw.sub_type));
    }
    for (const auto& [k, v] : raw.parameters) {
        std::string key = utility::to_lower(k);
        std::string value = utility::unescape_quoted(v);
        if (key == "charset") {
            value = utility::to_lower(value);
        }
        __r.parameters.insert_or_assign(std::move(key), std::move(value));
    }
    return __r;
}
}  // namespace chx::media::detail

media::media_type::media_type(std::string t, std::string st, std::string sfx)
    : type(utility::to_lower(t)), subtype(utility::to_lower(st)),
      suffix(utility::to_lower(sfx)) {}

auto media::media_type::parse(std::string_view sv) -> media_type {
    sv = utility::trim_ows(sv);
    raw_media_type raw;
    const char *begin = sv.data(), *end = sv.data() + sv.size();
    if (!parse_media_range(begin, end, raw) || begin != end) {
        __CHXMEDIA_THROW(malformed_media_type,
                         "malformed media type \"" + std::string(sv) + "\"");
    }
    return detail::from_raw(raw);
}

std::string media::media_type::essence() const {
    std::string __ret;
    __ret.reserve(type.size() + subtype.size() + suffix.size() + 2);
    __ret.append(type).append("/").append(subtype);
    if (!suffix.empty()) {
        __ret.append("+").append(suffix);
    }
    return __ret;
}

std::string media::media_type::to_string() const {
    std::string __ret = essence();
    for (const auto& [k, v] : parameters) {
        __ret.append("; ").append(k).append("=");
        if (utility::is_token(v)) {
            __ret.append(v);
        } else {
            __ret.push_back('\"');
            for (char c : v) {
                if (c == '\"' || c == '\\') {
                    __ret.push_back('\\');
                }
                __ret.push_back(c);
            }
            __ret.push_back('\"');
        }
    }
    return __ret;
}
