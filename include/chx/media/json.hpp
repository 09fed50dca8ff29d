#pragma once

#include "./handlers.hpp"

#include <memory>

namespace chx::media {
namespace json {
/*
compact JSON text, object members in insertion order
- binary is written as a base64 string
- uuid and timestamp are written as their text form
- opaque values go through options.adapters, otherwise type_error
- NaN and infinities are rejected with type_error
*/
std::string dumps(const value& v, const codec_options& options = {});

// throws decode_error
value loads(std::string_view text, const codec_options& options = {});
}  // namespace json

class json_transcoder : public text_transcoder {
    std::shared_ptr<const codec_options> __M_options;

    json_transcoder(std::shared_ptr<const codec_options> options,
                    std::string content_type, std::string default_encoding);

  public:
    explicit json_transcoder(std::string content_type = "application/json",
                             std::string default_encoding = "utf-8",
                             codec_options options = {});

    const codec_options& options() const noexcept(true) {
        return *__M_options;
    }
};
}  // namespace chx::media
