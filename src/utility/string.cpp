#include "./string.hpp"

#include <algorithm>
#include <cstring>
#include <strings.h>

static constexpr bool is_tchar(char c) noexcept(true) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c != '\0' && std::string_view("!#$%&'*+-.^_`|~").find(c) !=
                             std::string_view::npos);
}

std::string utility::to_lower(std::string_view sv) {
    std::string __ret(sv);
    std::transform(__ret.begin(), __ret.end(), __ret.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return __ret;
}

bool utility::iequals(std::string_view a, std::string_view b) noexcept(true) {
    return a.size() == b.size() &&
           ::strncasecmp(a.data(), b.data(), a.size()) == 0;
}

std::string_view utility::trim_ows(std::string_view sv) noexcept(true) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
        sv.remove_suffix(1);
    }
    return sv;
}

bool utility::is_token(std::string_view sv) noexcept(true) {
    return !sv.empty() && std::all_of(sv.begin(), sv.end(), is_tchar);
}

std::string utility::unescape_quoted(std::string_view sv) {
    std::string __ret;
    __ret.reserve(sv.size());
    for (std::size_t i = 0; i < sv.size(); ++i) {
        if (sv[i] == '\\' && i + 1 < sv.size()) {
            ++i;
        }
        __ret.push_back(sv[i]);
    }
    return __ret;
}
