#pragma once

#include "./exception.hpp"
#include "./registry.hpp"
#include "./request.hpp"
#include "./response.hpp"

#include <optional>
#include <string>

namespace chx::media {
/*
content_context
1. one per request, must not outlive the registry or the request
2. the decoded body and the response type are computed on first use and
   reused afterwards
3. client faults surface as http_error (400, 415), type_error from an encoder
   propagates unchanged
*/
class content_context {
    const content_registry& __M_registry;
    const request_type& __M_request;

    std::optional<value> __M_body;
    bool __M_negotiated = false;
    std::optional<std::string> __M_response_type;

    std::shared_ptr<const transcoder>
    request_transcoder(std::optional<std::string>& charset) const;

  public:
    content_context(const content_registry& registry,
                    const request_type& request) noexcept(true)
        : __M_registry(registry), __M_request(request) {}

    const content_registry& registry() const noexcept(true) {
        return __M_registry;
    }
    const request_type& request() const noexcept(true) { return __M_request; }

    // throws http_error 415 or 400
    const value& get_request_body();

    // std::nullopt when neither the Accept header nor the default content
    // type yields a registered type
    const std::optional<std::string>& get_response_content_type();

    // throws http_error 415, type_error. a transcoder's own exceptions, such
    // as unknown_encoding from a custom text transcoder, propagate unchanged.
    action_result send_response(const value& body,
                                bool set_content_type = true);

    static action_result make_error_result(const http_error& err);
};
}  // namespace chx::media
