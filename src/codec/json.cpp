#include "../utility/base64.hpp"

#include <chx/media/exception.hpp>
#include <chx/media/json.hpp>

#include <boost/json.hpp>
#include <cmath>
#include <limits>

namespace media = chx::media;

namespace {
boost::json::value to_json(const media::value& v,
                           const media::codec_options& options,
                           std::size_t depth) {
    if (depth > options.max_depth) {
        __CHXMEDIA_THROW(type_error, "value nested too deeply");
    }
    return std::visit(
        [&](const auto& a) -> boost::json::value {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, bool> ||
                                 std::is_same_v<T, std::int64_t> ||
                                 std::is_same_v<T, std::uint64_t>) {
                return a;
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(a)) {
                    __CHXMEDIA_THROW(type_error,
                                     "out of range float values are not JSON "
                                     "compliant");
                }
                return a;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return boost::json::string(a);
            } else if constexpr (std::is_same_v<T, media::binary_type> ||
                                 std::is_same_v<T, media::binary_view>) {
                return boost::json::string(
                    utility::base64_encode(media::binary_view(a)));
            } else if constexpr (std::is_same_v<T, media::array_type>) {
                boost::json::array arr;
                arr.reserve(a.size());
                for (const auto& item : a) {
                    arr.push_back(to_json(item, options, depth + 1));
                }
                return arr;
            } else if constexpr (std::is_same_v<T, media::object_type>) {
                boost::json::object obj;
                obj.reserve(a.size());
                for (const auto& [k, item] : a) {
                    obj.insert_or_assign(k, to_json(item, options, depth + 1));
                }
                return obj;
            } else if constexpr (std::is_same_v<T, media::uuid_type>) {
                return boost::json::string(media::uuid_to_string(a));
            } else if constexpr (std::is_same_v<T, media::timestamp>) {
                return boost::json::string(a.isoformat());
            } else if constexpr (std::is_same_v<T, media::opaque>) {
                std::optional<media::value> converted =
                    media::apply_adapters(options, a);
                if (!converted) {
                    __CHXMEDIA_THROW(type_error,
                                     std::string("object of type ") +
                                         a.type().name() +
                                         " is not JSON serializable");
                }
                return to_json(*converted, options, depth + 1);
            }
        },
        v.variant());
}

media::value from_json(const boost::json::value& jv) {
    switch (jv.kind()) {
    case boost::json::kind::null:
        return nullptr;
    case boost::json::kind::bool_:
        return jv.get_bool();
    case boost::json::kind::int64:
        return jv.get_int64();
    case boost::json::kind::uint64: {
        const std::uint64_t u = jv.get_uint64();
        if (u <= static_cast<std::uint64_t>(
                     std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(u);
        }
        return u;
    }
    case boost::json::kind::double_:
        return jv.get_double();
    case boost::json::kind::string:
        return std::string(jv.get_string().subview());
    case boost::json::kind::array: {
        const auto& ja = jv.get_array();
        media::array_type __r;
        __r.reserve(ja.size());
        for (const auto& item : ja) {
            __r.push_back(from_json(item));
        }
        return __r;
    }
    case boost::json::kind::object: {
        const auto& jo = jv.get_object();
        media::object_type __r;
        __r.reserve(jo.size());
        for (const auto& kv : jo) {
            __r.insert_or_assign(std::string(kv.key()), from_json(kv.value()));
        }
        return __r;
    }
    }
    __CHXMEDIA_THROW(decode_error, "unexpected JSON value kind");
}
}  // namespace

std::string media::json::dumps(const value& v, const codec_options& options) {
    return boost::json::serialize(to_json(v, options, 0));
}

auto media::json::loads(std::string_view text, const codec_options& options)
    -> value {
    boost::json::parse_options opt;
    opt.max_depth = options.max_depth;
    boost::json::error_code ec;
    boost::json::value jv = boost::json::parse(
        boost::json::string_view(text.data(), text.size()), ec, {}, opt);
    if (ec) {
        __CHXMEDIA_THROW(decode_error, "invalid JSON: " + ec.message());
    }
    return from_json(jv);
}

media::json_transcoder::json_transcoder(
    std::shared_ptr<const codec_options> options, std::string content_type,
    std::string default_encoding)
    : text_transcoder(
          std::move(content_type),
          [options](const value& v) { return json::dumps(v, *options); },
          [options](std::string_view text) {
              return json::loads(text, *options);
          },
          std::move(default_encoding)),
      __M_options(std::move(options)) {}

media::json_transcoder::json_transcoder(std::string content_type,
                                        std::string default_encoding,
                                        codec_options options)
    : json_transcoder(
          std::make_shared<const codec_options>(std::move(options)),
          std::move(content_type), std::move(default_encoding)) {}
