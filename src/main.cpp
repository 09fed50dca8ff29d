#include <chx/media/content_context.hpp>

#include "./global_conf.hpp"
#include "./log.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>

namespace media = chx::media;
using namespace chx::log::literals;

static media::binary_type read_body(const std::string& input) {
    std::istream* is = &std::cin;
    std::ifstream ifs;
    if (input != "-") {
        ifs.open(input, std::ios::binary);
        if (!ifs) {
            throw std::runtime_error("Cannot open input file " + input);
        }
        is = &ifs;
    }
    return media::binary_type(std::istreambuf_iterator<char>(*is),
                              std::istreambuf_iterator<char>());
}

static void write_body(const std::string& output,
                       const media::binary_type& payload) {
    if (output == "-") {
        std::fwrite(payload.data(), 1, payload.size(), stdout);
        std::fflush(stdout);
    } else {
        std::ofstream ofs(output, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot open output file " + output);
        }
        ofs.write(reinterpret_cast<const char*>(payload.data()),
                  payload.size());
    }
}

int main(int argc, char** argv) {
    media::content_registry registry;
    media::request_type req;
    try {
        application_init(argc, argv);
        registry_init(registry);

        req.request_target = global_conf.request.input;
        req.fields.set_field("Content-Type", global_conf.request.content_type);
        if (global_conf.request.accept) {
            req.fields.set_field("Accept", *global_conf.request.accept);
        }
        req.body = read_body(global_conf.request.input);
    } catch (const std::exception& ex) {
        log_fatal_direct("%s\n"_str, std::string_view{ex.what()});
        return 2;
    }

    media::content_context ctx(registry, req);
    media::action_result result;
    try {
        result = ctx.send_response(ctx.get_request_body());
    } catch (const media::http_error& ex) {
        log_warn_req(req, ex.code(), ex.what());
        result = media::content_context::make_error_result(ex);
    } catch (const media::type_error& ex) {
        log_error("%s\n"_str, std::string_view{ex.what()});
        result = media::action_result(media::status_code::Internal_Server_Error);
    } catch (const media::runtime_exception& ex) {
        log_error("%s\n"_str, std::string_view{ex.what()});
        result = media::action_result(media::status_code::Internal_Server_Error);
    }

    log_norm_resp(req, result.code);
    for (const auto& [k, v] : result.fields) {
        log_info("%s: %s\n"_str, k, v);
    }

    int __ret = 0;
    if (result.code == media::status_code::OK) {
        try {
            write_body(global_conf.request.output, result.payload);
        } catch (const std::exception& ex) {
            log_error("%s\n"_str, std::string_view{ex.what()});
            __ret = 1;
        }
    } else {
        __ret = 1;
    }
    terminate_log_backend();
    return __ret;
}
