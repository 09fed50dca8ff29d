#include "../utility/utf8.hpp"

#include <chx/media/exception.hpp>
#include <chx/media/msgpack.hpp>

#include <msgpack.hpp>

#include <chrono>
#include <cstring>
#include <limits>

namespace media = chx::media;

namespace {
constexpr std::int8_t timestamp_ext_type = -1;

// msgpack::packer stream that appends to a binary_type
struct binary_writer {
    media::binary_type& out;

    void write(const char* p, std::size_t n) {
        out.insert(out.end(), reinterpret_cast<const unsigned char*>(p),
                   reinterpret_cast<const unsigned char*>(p) + n);
    }
};

std::uint32_t checked_length(std::size_t n, const char* what) {
    if (n > std::numeric_limits<std::uint32_t>::max()) {
        __CHXMEDIA_THROW(type_error,
                         std::string(what) + " too large for msgpack");
    }
    return static_cast<std::uint32_t>(n);
}

struct packer {
    msgpack::packer<binary_writer>& pk;
    const media::codec_options& options;

    void pack_string(std::string_view s) {
        pk.pack_str(checked_length(s.size(), "string"));
        pk.pack_str_body(s.data(), static_cast<std::uint32_t>(s.size()));
    }

    void pack_binary(media::binary_view b) {
        pk.pack_bin(checked_length(b.size(), "binary"));
        pk.pack_bin_body(reinterpret_cast<const char*>(b.data()),
                         static_cast<std::uint32_t>(b.size()));
    }

    void operator()(const media::value& v, std::size_t depth) {
        if (depth > options.max_depth) {
            __CHXMEDIA_THROW(type_error, "value nested too deeply");
        }
        std::visit(
            [&](const auto& a) {
                using T = std::decay_t<decltype(a)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    pk.pack_nil();
                } else if constexpr (std::is_same_v<T, bool>) {
                    a ? pk.pack_true() : pk.pack_false();
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    pk.pack_int64(a);
                } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                    pk.pack_uint64(a);
                } else if constexpr (std::is_same_v<T, double>) {
                    pk.pack_double(a);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    pack_string(a);
                } else if constexpr (std::is_same_v<T, media::binary_type> ||
                                     std::is_same_v<T, media::binary_view>) {
                    pack_binary(a);
                } else if constexpr (std::is_same_v<T, media::array_type>) {
                    pk.pack_array(checked_length(a.size(), "array"));
                    for (const auto& item : a) {
                        (*this)(item, depth + 1);
                    }
                } else if constexpr (std::is_same_v<T, media::object_type>) {
                    pk.pack_map(checked_length(a.size(), "map"));
                    for (const auto& [k, item] : a) {
                        pack_string(k);
                        (*this)(item, depth + 1);
                    }
                } else if constexpr (std::is_same_v<T, media::uuid_type>) {
                    pack_string(media::uuid_to_string(a));
                } else if constexpr (std::is_same_v<T, media::timestamp>) {
                    pack_string(a.isoformat());
                } else if constexpr (std::is_same_v<T, media::opaque>) {
                    std::optional<media::value> converted =
                        media::apply_adapters(options, a);
                    if (!converted) {
                        __CHXMEDIA_THROW(type_error,
                                         std::string("cannot pack object of "
                                                     "type ") +
                                             a.type().name());
                    }
                    (*this)(*converted, depth + 1);
                }
            },
            v.variant());
    }
};

template <typename T> T load_be(const char* p) noexcept(true) {
    T r = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        r = static_cast<T>((r << 8) | static_cast<unsigned char>(p[i]));
    }
    return r;
}

// timestamp extension, 32, 64 and 96 bit layouts
media::value from_timestamp_ext(const msgpack::object_ext& ext) {
    std::int64_t sec = 0;
    std::uint32_t nsec = 0;
    if (ext.size == 4) {
        sec = load_be<std::uint32_t>(ext.data());
    } else if (ext.size == 8) {
        const std::uint64_t v = load_be<std::uint64_t>(ext.data());
        nsec = static_cast<std::uint32_t>(v >> 34);
        sec = static_cast<std::int64_t>(v & 0x00000003ffffffffULL);
    } else if (ext.size == 12) {
        nsec = load_be<std::uint32_t>(ext.data());
        sec = static_cast<std::int64_t>(load_be<std::uint64_t>(ext.data() + 4));
    } else {
        __CHXMEDIA_THROW(decode_error, "malformed msgpack timestamp");
    }
    if (nsec > 999999999u) {
        __CHXMEDIA_THROW(decode_error, "malformed msgpack timestamp");
    }
    using namespace std::chrono;
    // calendar range of year_month_day
    constexpr std::int64_t min_sec =
        sys_seconds(sys_days(year::min() / January / 1))
            .time_since_epoch()
            .count();
    constexpr std::int64_t max_sec =
        sys_seconds(sys_days(year::max() / December / 31))
            .time_since_epoch()
            .count() +
        86399;
    if (sec < min_sec || sec > max_sec) {
        __CHXMEDIA_THROW(decode_error, "msgpack timestamp out of range");
    }
    return media::timestamp{
        sys_time<microseconds>(
            seconds(sec) + duration_cast<microseconds>(nanoseconds(nsec))),
        minutes(0)};
}

std::string to_string(const msgpack::object_str& s) {
    std::string_view sv(s.ptr, s.size);
    if (!utility::validate_utf8(sv)) {
        __CHXMEDIA_THROW(decode_error, "invalid UTF-8 in msgpack string");
    }
    return std::string(sv);
}

media::value from_object(const msgpack::object& o,
                         const media::codec_options& options,
                         std::size_t depth) {
    if (depth > options.max_depth) {
        __CHXMEDIA_THROW(decode_error, "msgpack data nested too deeply");
    }
    switch (o.type) {
    case msgpack::type::NIL:
        return nullptr;
    case msgpack::type::BOOLEAN:
        return o.via.boolean;
    case msgpack::type::POSITIVE_INTEGER:
        if (o.via.u64 <= static_cast<std::uint64_t>(
                             std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(o.via.u64);
        }
        return o.via.u64;
    case msgpack::type::NEGATIVE_INTEGER:
        return o.via.i64;
    case msgpack::type::FLOAT32:
    case msgpack::type::FLOAT64:
        return o.via.f64;
    case msgpack::type::STR:
        return to_string(o.via.str);
    case msgpack::type::BIN:
        return media::binary_type(
            reinterpret_cast<const unsigned char*>(o.via.bin.ptr),
            reinterpret_cast<const unsigned char*>(o.via.bin.ptr) +
                o.via.bin.size);
    case msgpack::type::ARRAY: {
        media::array_type __r;
        __r.reserve(o.via.array.size);
        for (std::uint32_t i = 0; i < o.via.array.size; ++i) {
            __r.push_back(from_object(o.via.array.ptr[i], options, depth + 1));
        }
        return __r;
    }
    case msgpack::type::MAP: {
        media::object_type __r;
        __r.reserve(o.via.map.size);
        for (std::uint32_t i = 0; i < o.via.map.size; ++i) {
            const msgpack::object_kv& kv = o.via.map.ptr[i];
            if (kv.key.type != msgpack::type::STR) {
                __CHXMEDIA_THROW(decode_error,
                                 "msgpack map keys must be strings");
            }
            __r.insert_or_assign(to_string(kv.key.via.str),
                                 from_object(kv.val, options, depth + 1));
        }
        return __r;
    }
    case msgpack::type::EXT:
        if (o.via.ext.type() == timestamp_ext_type) {
            return from_timestamp_ext(o.via.ext);
        }
        __CHXMEDIA_THROW(decode_error,
                         "unsupported msgpack extension type " +
                             std::to_string(o.via.ext.type()));
    default:
        __CHXMEDIA_THROW(decode_error, "unexpected msgpack object");
    }
}
}  // namespace

void media::msgpack::pack(const value& v, binary_type& out,
                          const codec_options& options) {
    binary_writer w{out};
    ::msgpack::packer<binary_writer> pk(w);
    packer{pk, options}(v, 0);
}

auto media::msgpack::packb(const value& v, const codec_options& options)
    -> binary_type {
    binary_type __ret;
    pack(v, __ret, options);
    return __ret;
}

auto media::msgpack::unpackb(binary_view bytes, const codec_options& options)
    -> value {
    // every element occupies at least one byte, larger counts are lies
    const std::size_t n = bytes.size();
    const ::msgpack::unpack_limit limit(n, n / 2, n, n, n,
                                        options.max_depth + 2);
    std::size_t offset = 0;
    ::msgpack::object_handle oh;
    try {
        oh = ::msgpack::unpack(reinterpret_cast<const char*>(bytes.data()), n,
                               offset, nullptr, nullptr, limit);
    } catch (const ::msgpack::unpack_error& ex) {
        __CHXMEDIA_THROW(decode_error,
                         std::string("malformed msgpack data: ") + ex.what());
    }
    if (offset != n) {
        __CHXMEDIA_THROW(decode_error, "trailing bytes after msgpack value");
    }
    return from_object(oh.get(), options, 0);
}

media::msgpack_transcoder::msgpack_transcoder(
    std::shared_ptr<const codec_options> options, std::string content_type)
    : binary_transcoder(
          std::move(content_type),
          [options](const value& v) { return msgpack::packb(v, *options); },
          [options](binary_view bytes) {
              return msgpack::unpackb(bytes, *options);
          }),
      __M_options(std::move(options)) {}

media::msgpack_transcoder::msgpack_transcoder(std::string content_type,
                                              codec_options options)
    : msgpack_transcoder(
          std::make_shared<const codec_options>(std::move(options)),
          std::move(content_type)) {}
