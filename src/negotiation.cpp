#include "./log.hpp"

#include <chx/media/exception.hpp>
#include <chx/media/negotiation.hpp>

#include <tuple>

namespace media = chx::media;
using namespace chx::log::literals;

namespace {
// (level, parameter count), level 0 for */*, 1 for type/*, 2 for type/subtype
using specificity = std::tuple<int, std::size_t>;

std::optional<specificity> match(const media::media_type& range,
                                 const media::media_type& available) {
    int level = 0;
    if (range.is_wildcard()) {
        level = 0;
    } else if (range.is_subtype_wildcard()) {
        if (range.type != available.type) {
            return std::nullopt;
        }
        level = 1;
    } else if (range.type == available.type &&
               range.subtype == available.subtype &&
               range.suffix == available.suffix) {
        level = 2;
    } else {
        return std::nullopt;
    }
    for (const auto& [k, v] : range.parameters) {
        auto ite = available.parameters.find(k);
        if (ite == available.parameters.end() || ite->second != v) {
            return std::nullopt;
        }
    }
    return specificity{level, range.parameters.size()};
}
}  // namespace

std::optional<std::size_t>
media::select_content_type(const std::vector<accept_range>& ranges,
                           const std::vector<media_type>& available) {
    std::optional<std::size_t> __ret;
    std::tuple<double, int, std::size_t> __best;
    for (std::size_t i = 0; i < available.size(); ++i) {
        std::optional<std::tuple<int, std::size_t, double>> m;
        for (const auto& r : ranges) {
            if (auto s = match(r.range, available[i]); s) {
                std::tuple<int, std::size_t, double> cur{
                    std::get<0>(*s), std::get<1>(*s), r.quality};
                if (!m || cur > *m) {
                    m = cur;
                }
            }
        }
        if (!m) {
            continue;
        }
        std::tuple<double, int, std::size_t> score{
            std::get<2>(*m), std::get<0>(*m), std::get<1>(*m)};
        // strict comparison keeps the earlier registration on ties
        if (!__ret || score > __best) {
            __ret = i;
            __best = score;
        }
    }
    return __ret;
}

std::string media::negotiate(const content_registry& registry,
                             std::optional<std::string_view> accept) {
    const std::optional<std::string> def = registry.default_content_type();
    if (!accept) {
        accept = def ? std::string_view{*def} : std::string_view{"*/*"};
    }

    std::vector<accept_range> ranges;
    try {
        ranges = parse_accept(*accept);
    } catch (const malformed_media_type& ex) {
        log_info("ignoring malformed Accept header: %s\n"_str,
                 std::string_view{ex.what()});
    }

    const std::vector<std::string> names = registry.available_content_types();
    std::vector<media_type> available;
    available.reserve(names.size());
    for (const auto& n : names) {
        available.push_back(media_type::parse(n));
    }

    if (auto idx = select_content_type(ranges, available); idx) {
        return names[*idx];
    }
    if (def) {
        log_info("no acceptable content type for \"%s\", using default %s\n"_str,
                 *accept, *def);
        return *def;
    }
    __CHXMEDIA_THROW(no_acceptable_type,
                     "no acceptable content type for \"" +
                         std::string(*accept) + "\"");
}
