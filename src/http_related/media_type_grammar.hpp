#pragma once

#include "../boost_spirit_parser.hpp"

#include <chx/media/media_type.hpp>

#include <string_view>
#include <utility>
#include <vector>

// views into the parsed header, parameters in header order
struct raw_media_type {
    std::string_view type;
    std::string_view sub_type;
    std::vector<std::pair<std::string_view, std::string_view>> parameters;
};

BOOST_FUSION_ADAPT_STRUCT(raw_media_type, type, sub_type, parameters);

namespace parser {
const auto parameter_name = svp[token];
const auto parameter_value = svp[token] | quoted_string;

const x3::rule<struct parameter, std::pair<std::string_view, std::string_view>>
    parameter;
const auto parameter_def = parameter_name >> '=' >> parameter_value;
BOOST_SPIRIT_DEFINE(parameter);

const x3::rule<struct parameters,
               std::vector<std::pair<std::string_view, std::string_view>>>
    parameters;
const auto parameters_def = *(x3::omit[OWS >> ';' >> OWS] >> parameter);
BOOST_SPIRIT_DEFINE(parameters);

const auto type = token;
const auto subtype = token;

const x3::rule<struct mt, raw_media_type> mt;
const auto mt_def = svp[type] >> '/' >> svp[subtype] >> parameters;
BOOST_SPIRIT_DEFINE(mt);

// a parameter list may end with a lone ';'
const auto mt_tail = x3::omit[OWS >> -(x3::lit(';') >> OWS)];
const auto list_gap = x3::omit[*(OWS >> ',') >> OWS];
}  // namespace parser

// parses one media type or media range starting at begin, leaves begin after
// it on success
inline bool parse_media_range(const char*& begin, const char* end,
                              raw_media_type& out) {
    const char* saved = begin;
    if (x3::parse(begin, end, parser::mt, out) &&
        x3::parse(begin, end, parser::mt_tail)) {
        return true;
    }
    begin = saved;
    return false;
}

namespace chx::media::detail {
// normalizes a parsed media type, throws malformed_media_type
media_type from_raw(const raw_media_type& raw);
}  // namespace chx::media::detail
