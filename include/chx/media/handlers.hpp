#pragma once

#include "./transcoder.hpp"

#include <functional>
#include <string>

namespace chx::media {
using dumps_function = std::function<std::string(const value&)>;
using loads_function = std::function<value(std::string_view)>;
using pack_function = std::function<binary_type(const value&)>;
using unpack_function = std::function<value(binary_view)>;

/// Adapts a string codec. The body is the dumped UTF-8 text converted to the
/// requested charset, and the charset is announced in the Content-Type.
class text_transcoder : public transcoder {
    std::string __M_content_type;
    dumps_function __M_dumps;
    loads_function __M_loads;
    std::string __M_default_encoding;

  public:
    // a charset parameter in content_type is dropped. throws
    // unknown_encoding for an unsupported default_encoding.
    text_transcoder(std::string content_type, dumps_function dumps,
                    loads_function loads, std::string default_encoding);

    const std::string& default_encoding() const noexcept(true) {
        return __M_default_encoding;
    }
    const dumps_function& dumps() const noexcept(true) { return __M_dumps; }
    const loads_function& loads() const noexcept(true) { return __M_loads; }

  private:
    std::string_view do_content_type() const noexcept(true) override {
        return __M_content_type;
    }
    result_type
    do_to_bytes(const value& v,
                std::optional<std::string_view> encoding) const override;
    value do_from_bytes(binary_view bytes,
                        std::optional<std::string_view> encoding) const override;
};

/// Adapts a byte codec. Character encodings do not apply.
class binary_transcoder : public transcoder {
    std::string __M_content_type;
    pack_function __M_pack;
    unpack_function __M_unpack;

  public:
    binary_transcoder(std::string content_type, pack_function pack,
                      unpack_function unpack);

    const pack_function& pack() const noexcept(true) { return __M_pack; }
    const unpack_function& unpack() const noexcept(true) { return __M_unpack; }

  private:
    std::string_view do_content_type() const noexcept(true) override {
        return __M_content_type;
    }
    result_type
    do_to_bytes(const value& v,
                std::optional<std::string_view> encoding) const override;
    value do_from_bytes(binary_view bytes,
                        std::optional<std::string_view> encoding) const override;
};
}  // namespace chx::media
