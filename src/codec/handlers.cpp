#include "../utility/charset.hpp"
#include "../utility/string.hpp"

#include <chx/media/exception.hpp>
#include <chx/media/handlers.hpp>
#include <chx/media/media_type.hpp>

namespace media = chx::media;

static utility::charset lookup_charset(std::string_view name) {
    if (auto cs = utility::charset_from_name(name); cs) {
        return *cs;
    }
    __CHXMEDIA_THROW(unknown_encoding,
                     "unsupported charset \"" + std::string(name) + "\"");
}

// the charset is chosen per call and appended by to_bytes
static std::string without_charset(std::string content_type) {
    if (content_type.find(';') == std::string::npos) {
        return content_type;
    }
    media::media_type mt = media::media_type::parse(content_type);
    if (mt.parameters.erase("charset") == 0) {
        return content_type;
    }
    return mt.to_string();
}

media::text_transcoder::text_transcoder(std::string content_type,
                                        dumps_function dumps,
                                        loads_function loads,
                                        std::string default_encoding)
    : __M_content_type(without_charset(std::move(content_type))),
      __M_dumps(std::move(dumps)), __M_loads(std::move(loads)),
      __M_default_encoding(utility::to_lower(default_encoding)) {
    lookup_charset(__M_default_encoding);
}

auto media::text_transcoder::do_to_bytes(
    const value& v, std::optional<std::string_view> encoding) const
    -> result_type {
    const std::string selected =
        utility::to_lower(encoding.value_or(__M_default_encoding));
    const utility::charset cs = lookup_charset(selected);

    std::string text = __M_dumps(v);
    std::optional<std::string> encoded = utility::encode_text(text, cs);
    if (!encoded) {
        __CHXMEDIA_THROW(type_error,
                         "value cannot be represented in " + selected);
    }
    return {__M_content_type + "; charset=\"" + selected + "\"",
            binary_type(encoded->begin(), encoded->end())};
}

auto media::text_transcoder::do_from_bytes(
    binary_view bytes, std::optional<std::string_view> encoding) const
    -> value {
    const std::string selected =
        utility::to_lower(encoding.value_or(__M_default_encoding));
    const utility::charset cs = lookup_charset(selected);

    std::optional<std::string> text = utility::decode_text(
        std::string_view(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size()),
        cs);
    if (!text) {
        __CHXMEDIA_THROW(decode_error, "body is not valid " + selected);
    }
    try {
        return __M_loads(*text);
    } catch (const decode_error&) {
        throw;
    } catch (const std::exception& ex) {
        __CHXMEDIA_THROW(decode_error, ex.what());
    }
}

media::binary_transcoder::binary_transcoder(std::string content_type,
                                            pack_function pack,
                                            unpack_function unpack)
    : __M_content_type(std::move(content_type)), __M_pack(std::move(pack)),
      __M_unpack(std::move(unpack)) {}

auto media::binary_transcoder::do_to_bytes(const value& v,
                                           std::optional<std::string_view>)
    const -> result_type {
    return {__M_content_type, __M_pack(v)};
}

auto media::binary_transcoder::do_from_bytes(
    binary_view bytes, std::optional<std::string_view>) const -> value {
    try {
        return __M_unpack(bytes);
    } catch (const decode_error&) {
        throw;
    } catch (const std::exception& ex) {
        __CHXMEDIA_THROW(decode_error, ex.what());
    }
}
