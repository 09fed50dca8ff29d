#include "./charset.hpp"
#include "./string.hpp"
#include "./utf8.hpp"

#include <array>

auto utility::charset_from_name(std::string_view name) noexcept(true)
    -> std::optional<charset> {
    constexpr std::array<std::pair<std::string_view, charset>, 9> labels = {{
        {"utf-8", charset::utf8},
        {"utf8", charset::utf8},
        {"us-ascii", charset::ascii},
        {"ascii", charset::ascii},
        {"iso-8859-1", charset::latin1},
        {"iso8859-1", charset::latin1},
        {"latin1", charset::latin1},
        {"latin-1", charset::latin1},
        {"l1", charset::latin1},
    }};
    for (const auto& [label, cs] : labels) {
        if (iequals(label, name)) {
            return cs;
        }
    }
    return std::nullopt;
}

auto utility::encode_text(std::string_view utf8, charset cs)
    -> std::optional<std::string> {
    switch (cs) {
    case charset::utf8: {
        return std::string(utf8);
    }
    case charset::ascii: {
        for (char c : utf8) {
            if (static_cast<unsigned char>(c) >= 0x80) {
                return std::nullopt;
            }
        }
        return std::string(utf8);
    }
    case charset::latin1: {
        std::string __ret;
        __ret.reserve(utf8.size());
        for (std::size_t i = 0; i < utf8.size(); ++i) {
            unsigned char c = utf8[i];
            if (c < 0x80) {
                __ret.push_back(static_cast<char>(c));
            } else if ((c == 0xC2 || c == 0xC3) && i + 1 < utf8.size()) {
                unsigned char c2 = utf8[++i];
                if ((c2 & 0xC0) != 0x80) {
                    return std::nullopt;
                }
                __ret.push_back(
                    static_cast<char>(((c & 0x1F) << 6) | (c2 & 0x3F)));
            } else {
                return std::nullopt;
            }
        }
        return __ret;
    }
    default: {
        return std::nullopt;
    }
    }
}

auto utility::decode_text(std::string_view bytes, charset cs)
    -> std::optional<std::string> {
    switch (cs) {
    case charset::utf8: {
        if (!validate_utf8(bytes)) {
            return std::nullopt;
        }
        return std::string(bytes);
    }
    case charset::ascii: {
        for (char c : bytes) {
            if (static_cast<unsigned char>(c) >= 0x80) {
                return std::nullopt;
            }
        }
        return std::string(bytes);
    }
    case charset::latin1: {
        std::string __ret;
        __ret.reserve(bytes.size() * 2);
        for (unsigned char c : bytes) {
            if (c < 0x80) {
                __ret.push_back(static_cast<char>(c));
            } else {
                __ret.push_back(static_cast<char>(0xC0 | (c >> 6)));
                __ret.push_back(static_cast<char>(0x80 | (c & 0x3F)));
            }
        }
        return __ret;
    }
    default: {
        return std::nullopt;
    }
    }
}
