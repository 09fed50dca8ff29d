#pragma once

#include "./header.hpp"
#include "./value.hpp"

#include <string>

namespace chx::media {
// what the serving framework hands over for one request
struct request_type {
    std::string method = "POST";
    std::string request_target = "/";
    fields_type fields;
    binary_type body;
};
}  // namespace chx::media
