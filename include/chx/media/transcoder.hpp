#pragma once

#include "./value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chx::media {
/*
transcoder design
1. a transcoder converts between bytes and a value for one media type
2. transcoders hold no per-request state, one instance serves every request
   concurrently
3. from_bytes either returns the complete value or throws decode_error
*/
class transcoder {
  public:
    using result_type = std::pair<std::string, binary_type>;

    virtual ~transcoder() = default;

    // media type this transcoder produces
    std::string_view content_type() const noexcept(true) {
        return do_content_type();
    }

    // returns the Content-Type to send and the encoded body
    result_type
    to_bytes(const value& v,
             std::optional<std::string_view> encoding = std::nullopt) const {
        return do_to_bytes(v, encoding);
    }

    value
    from_bytes(binary_view bytes,
               std::optional<std::string_view> encoding = std::nullopt) const {
        return do_from_bytes(bytes, encoding);
    }

  private:
    virtual std::string_view do_content_type() const noexcept(true) = 0;
    virtual result_type
    do_to_bytes(const value& v,
                std::optional<std::string_view> encoding) const = 0;
    virtual value
    do_from_bytes(binary_view bytes,
                  std::optional<std::string_view> encoding) const = 0;
};
}  // namespace chx::media
