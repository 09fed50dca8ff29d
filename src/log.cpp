#include "./log.hpp"

using namespace chx::log::literals;

static std::string_view user_agent(const chx::media::request_type& req) {
    return req.fields.get("User-Agent").value_or(std::string_view{});
}

void log_norm_resp(const chx::media::request_type& req,
                   chx::media::status_code st) {
    log_norm("%s %s \"%s\" %u\n"_str, req.method, req.request_target,
             user_agent(req), static_cast<unsigned short>(st));
}

void log_warn_req(const chx::media::request_type& req,
                  chx::media::status_code st, std::string_view what) {
    log_warn("%s %s \"%s\" %u %s\n"_str, req.method, req.request_target,
             user_agent(req), static_cast<unsigned short>(st), what);
}
