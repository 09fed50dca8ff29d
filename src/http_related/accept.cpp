#include "./media_type_grammar.hpp"
#include "../utility/string.hpp"

#include <chx/media/accept.hpp>
#include <chx/media/exception.hpp>

#include <algorithm>

namespace media = chx::media;

// qvalue = ( "0" [ "." 0*3DIGIT ] ) / ( "1" [ "." 0*3("0") ] )
static bool parse_qvalue(std::string_view sv, double& q) {
    const auto qvalue =
        (x3::char_('0') >> -(x3::char_('.') >> x3::repeat(0, 3)[DIGIT])) |
        (x3::char_('1') >> -(x3::char_('.') >> x3::repeat(0, 3)[x3::char_('0')]));
    const char *begin = sv.data(), *end = sv.data() + sv.size();
    if (!x3::parse(begin, end, x3::omit[qvalue]) || begin != end) {
        return false;
    }
    begin = sv.data();
    return x3::parse(begin, end, x3::double_, q) && begin == end;
}

static media::accept_range to_accept_range(raw_media_type& raw,
                                           std::string_view header) {
    media::accept_range __r;
    auto ite = std::find_if(
        raw.parameters.begin(), raw.parameters.end(),
        [](const auto& p) { return utility::iequals(p.first, "q"); });
    if (ite != raw.parameters.end()) {
        if (!parse_qvalue(ite->second, __r.quality)) {
            __CHXMEDIA_THROW(malformed_media_type,
                             "invalid quality value in Accept header \"" +
                                 std::string(header) + "\"");
        }
        // anything after q is an accept-ext
        raw.parameters.erase(ite, raw.parameters.end());
    }
    __r.range = media::detail::from_raw(raw);
    return __r;
}

auto media::parse_accept(std::string_view header) -> std::vector<accept_range> {
    std::vector<accept_range> __ret;
    const char *begin = header.data(), *end = header.data() + header.size();
    x3::parse(begin, end, parser::list_gap);
    while (begin != end) {
        raw_media_type raw;
        if (!parse_media_range(begin, end, raw)) {
            __CHXMEDIA_THROW(malformed_media_type,
                             "malformed Accept header \"" +
                                 std::string(header) + "\"");
        }
        if (begin != end && *begin != ',') {
            __CHXMEDIA_THROW(malformed_media_type,
                             "malformed Accept header \"" +
                                 std::string(header) + "\"");
        }
        x3::parse(begin, end, parser::list_gap);

        accept_range r = to_accept_range(raw, header);
        if (r.quality > 0.0) {
            __ret.push_back(std::move(r));
        }
    }
    return __ret;
}
