#pragma once

#include "./error_codes.hpp"
#include "./status_code.hpp"

#include <chx/net/exception.hpp>
#include <string>

namespace chx::media {
class runtime_exception : public net::exception {
    std::error_code __M_ec;

  public:
    runtime_exception(const std::error_code& ec, const char* cmsg)
        : exception(cmsg), __M_ec(ec) {}
    runtime_exception(const std::error_code& ec, const std::string& msg)
        : exception(msg), __M_ec(ec) {}

    const std::error_code& get_error_code() const noexcept(true) {
        return __M_ec;
    }
};

/// Header or registration key does not follow the media type grammar.
class malformed_media_type : public runtime_exception {
  public:
    explicit malformed_media_type(const std::string& msg)
        : runtime_exception(make_ec(errc::malformed_media_type), msg) {}
};

/// Registry lookup miss.
class not_found : public runtime_exception {
  public:
    explicit not_found(const std::string& msg)
        : runtime_exception(make_ec(errc::not_found), msg) {}
};

/// Negotiation found neither a match nor a default content type.
class no_acceptable_type : public runtime_exception {
  public:
    explicit no_acceptable_type(const std::string& msg)
        : runtime_exception(make_ec(errc::no_acceptable_type), msg) {}
};

/// A body could not be decoded. Never carries a partial value.
class decode_error : public runtime_exception {
  public:
    explicit decode_error(const std::string& msg)
        : runtime_exception(make_ec(errc::decode_error), msg) {}
};

/// The value contains something no encoder knows how to write. This is a
/// programming error of the producer, not a client fault.
class type_error : public runtime_exception {
  public:
    explicit type_error(const std::string& msg)
        : runtime_exception(make_ec(errc::type_error), msg) {}
};

class unknown_encoding : public runtime_exception {
  public:
    explicit unknown_encoding(const std::string& msg)
        : runtime_exception(make_ec(errc::unknown_encoding), msg) {}
};

/// Raised by content_context only; carries the status the framework should
/// answer with.
class http_error : public net::exception {
    status_code __M_code;

  public:
    http_error(status_code code, const std::string& msg)
        : exception(msg), __M_code(code) {}

    status_code code() const noexcept(true) { return __M_code; }
};
}  // namespace chx::media

#define __CHXMEDIA_MAKE_QUOTE_IMPL(x) #x
#define __CHXMEDIA_MAKE_QUOTE(x) __CHXMEDIA_MAKE_QUOTE_IMPL(x)

#define __CHXMEDIA_THROW(type, msg)                                            \
    throw ::chx::media::type(std::string(msg) +                                \
                             " at file: " __FILE__                             \
                             " line: " __CHXMEDIA_MAKE_QUOTE(__LINE__))
