#pragma once

#include "./handlers.hpp"

#include <memory>

namespace chx::media {
namespace msgpack {
/*
canonical MessagePack
- every integer, string, binary, array and map uses the narrowest format
  that holds it, multi-byte fields are big-endian
- floating point is always float64
- uuid and timestamp are written as their text form (fixstr/str8/...)
- opaque values go through options.adapters, otherwise type_error
*/
void pack(const value& v, binary_type& out, const codec_options& options = {});
binary_type packb(const value& v, const codec_options& options = {});

// throws decode_error, never returns a partial value
value unpackb(binary_view bytes, const codec_options& options = {});
}  // namespace msgpack

class msgpack_transcoder : public binary_transcoder {
    std::shared_ptr<const codec_options> __M_options;

    msgpack_transcoder(std::shared_ptr<const codec_options> options,
                       std::string content_type);

  public:
    explicit msgpack_transcoder(
        std::string content_type = "application/msgpack",
        codec_options options = {});

    binary_type packb(const value& v) const {
        return msgpack::packb(v, *__M_options);
    }
    value unpackb(binary_view bytes) const {
        return msgpack::unpackb(bytes, *__M_options);
    }

    const codec_options& options() const noexcept(true) {
        return *__M_options;
    }
};
}  // namespace chx::media
