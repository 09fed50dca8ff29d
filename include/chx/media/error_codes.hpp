#pragma once

#include <system_error>

namespace chx::media {
enum class [[nodiscard]] errc : int {
    success = 0,
    malformed_media_type = 1,
    not_found = 2,
    no_acceptable_type = 3,
    decode_error = 4,
    type_error = 5,
    unknown_encoding = 6
};

inline const std::error_category& error_category() noexcept(true) {
    class __category : public std::error_category {
      public:
        virtual const char* name() const noexcept(true) override {
            return "chxmedia error_category";
        }

        virtual std::error_condition default_error_condition(int ev) const
            noexcept(true) override {
            return std::error_condition(ev, *this);
        }

        virtual bool equivalent(const std::error_code& ec, int ev) const
            noexcept(true) override {
            return *this == ec.category() && static_cast<int>(ec.value()) == ev;
        }

        virtual std::string message(int ev) const override {
            switch (ev) {
            case static_cast<int>(errc::success): {
                return "Success";
            }
            case static_cast<int>(errc::malformed_media_type): {
                return "malformed media type";
            }
            case static_cast<int>(errc::not_found): {
                return "no transcoder registered for media type";
            }
            case static_cast<int>(errc::no_acceptable_type): {
                return "no acceptable content type";
            }
            case static_cast<int>(errc::decode_error): {
                return "failed to decode body";
            }
            case static_cast<int>(errc::type_error): {
                return "value cannot be encoded";
            }
            case static_cast<int>(errc::unknown_encoding): {
                return "unknown character encoding";
            }
            default: {
                return "UNKNOWN";
            }
            }
        }
    } static __c;
    return __c;
}

inline std::error_code make_ec(errc code) noexcept(true) {
    return std::error_code(static_cast<int>(code), error_category());
}
}  // namespace chx::media
