#include "./log.hpp"

#include <chx/media/content_context.hpp>
#include <chx/media/media_type.hpp>
#include <chx/media/negotiation.hpp>

namespace media = chx::media;
using namespace chx::log::literals;

auto media::content_context::request_transcoder(
    std::optional<std::string>& charset) const
    -> std::shared_ptr<const transcoder> {
    std::optional<std::string> header;
    if (auto v = __M_request.fields.get("Content-Type"); v) {
        header.emplace(*v);
    } else {
        header = __M_registry.default_content_type();
    }
    if (!header) {
        throw http_error(status_code::Unsupported_Media_Type,
                         "request has no Content-Type");
    }

    media_type mt;
    try {
        mt = media_type::parse(*header);
    } catch (const malformed_media_type& ex) {
        log_warn_req(__M_request, status_code::Unsupported_Media_Type,
                     ex.what());
        throw http_error(status_code::Unsupported_Media_Type,
                         "cannot decode body of type " + *header);
    }
    if (auto ite = mt.parameters.find("charset"); ite != mt.parameters.end()) {
        charset.emplace(std::move(ite->second));
        mt.parameters.erase(ite);
    }

    std::shared_ptr<const transcoder> __r = __M_registry.find(mt.to_string());
    if (!__r && !mt.parameters.empty()) {
        __r = __M_registry.find(mt.essence());
    }
    if (!__r) {
        throw http_error(status_code::Unsupported_Media_Type,
                         "cannot decode body of type " + mt.to_string());
    }
    return __r;
}

auto media::content_context::get_request_body() -> const value& {
    if (!__M_body) {
        std::optional<std::string> charset;
        std::shared_ptr<const transcoder> handler = request_transcoder(charset);
        try {
            __M_body.emplace(handler->from_bytes(__M_request.body, charset));
        } catch (const decode_error& ex) {
            log_warn_req(__M_request, status_code::Bad_Request, ex.what());
            throw http_error(status_code::Bad_Request,
                             "failed to decode request body");
        } catch (const unknown_encoding& ex) {
            log_warn_req(__M_request, status_code::Unsupported_Media_Type,
                         ex.what());
            throw http_error(status_code::Unsupported_Media_Type,
                             "unsupported charset");
        }
    }
    return *__M_body;
}

auto media::content_context::get_response_content_type()
    -> const std::optional<std::string>& {
    if (!__M_negotiated) {
        try {
            __M_response_type.emplace(
                negotiate(__M_registry, __M_request.fields.get("Accept")));
        } catch (const no_acceptable_type&) {
            __M_response_type.reset();
        }
        __M_negotiated = true;
    }
    return __M_response_type;
}

media::action_result media::content_context::send_response(const value& body,
                                                           bool set_content_type) {
    const std::optional<std::string>& ct = get_response_content_type();
    if (!ct) {
        throw http_error(status_code::Unsupported_Media_Type,
                         "no acceptable content type");
    }
    std::shared_ptr<const transcoder> handler = __M_registry.find(*ct);
    if (!handler) {
        throw http_error(status_code::Unsupported_Media_Type,
                         "no transcoder registered for " + *ct);
    }

    std::optional<std::string> encoding = __M_registry.default_encoding();
    transcoder::result_type r =
        encoding ? handler->to_bytes(body, *encoding) : handler->to_bytes(body);

    action_result __ret(status_code::OK);
    if (set_content_type) {
        __ret.fields.set_field("Content-Type", std::move(r.first));
        __ret.fields.add_field("Vary", "Accept");
    }
    __ret.payload = std::move(r.second);
    return __ret;
}

media::action_result
media::content_context::make_error_result(const http_error& err) {
    return action_result(err.code());
}
