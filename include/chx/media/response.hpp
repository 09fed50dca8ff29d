#pragma once

#include "./header.hpp"
#include "./status_code.hpp"
#include "./value.hpp"

namespace chx::media {
// what the serving framework writes back: status, headers and an encoded body
struct action_result {
    status_code code = status_code::OK;
    fields_type fields;
    binary_type payload;

    action_result() = default;

    action_result(status_code code) : action_result(code, fields_type{}) {}
    action_result(status_code code, fields_type fields)
        : code(code), fields(std::move(fields)) {}
    action_result(status_code code, fields_type fields, binary_type payload)
        : code(code), fields(std::move(fields)), payload(std::move(payload)) {}
};
}  // namespace chx::media
