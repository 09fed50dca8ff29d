#include <chx/media/value.hpp>

#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace media = chx::media;

media::object_type::object_type(const object_type&) = default;
media::object_type::object_type(object_type&&) noexcept(true) = default;
media::object_type::object_type(std::initializer_list<value_type> list)
    : __M_v(list) {}
media::object_type::~object_type() = default;
auto media::object_type::operator=(const object_type&)
    -> object_type& = default;
auto media::object_type::operator=(object_type&&) noexcept(true)
    -> object_type& = default;

auto media::object_type::find(std::string_view key) noexcept(true)
    -> iterator_type {
    return std::find_if(__M_v.begin(), __M_v.end(),
                        [key](const auto& i) { return i.first == key; });
}

auto media::object_type::find(std::string_view key) const noexcept(true)
    -> const_iterator_type {
    return std::find_if(__M_v.begin(), __M_v.end(),
                        [key](const auto& i) { return i.first == key; });
}

bool media::object_type::contains(std::string_view key) const noexcept(true) {
    return find(key) != end();
}

auto media::object_type::at(std::string_view key) -> value& {
    if (auto ite = find(key); ite != end()) {
        return ite->second;
    }
    throw std::out_of_range("chxmedia: no such key: " + std::string(key));
}

auto media::object_type::at(std::string_view key) const -> const value& {
    if (auto ite = find(key); ite != end()) {
        return ite->second;
    }
    throw std::out_of_range("chxmedia: no such key: " + std::string(key));
}

auto media::object_type::insert_or_assign(std::string key, value v) -> value& {
    if (auto ite = find(key); ite != end()) {
        ite->second = std::move(v);
        return ite->second;
    } else {
        return __M_v.emplace_back(std::move(key), std::move(v)).second;
    }
}

auto media::object_type::operator[](std::string_view key) -> value& {
    if (auto ite = find(key); ite != end()) {
        return ite->second;
    } else {
        return __M_v.emplace_back(std::string(key), value{}).second;
    }
}

bool media::object_type::operator==(const object_type& other) const {
    if (size() != other.size()) {
        return false;
    }
    return std::all_of(begin(), end(), [&other](const auto& p) {
        auto ite = other.find(p.first);
        return ite != other.end() && ite->second == p.second;
    });
}

bool media::value::operator==(const value& other) const {
    if (__M_v.index() != other.__M_v.index()) {
        return false;
    }
    return std::visit(
        [&other](const auto& a) -> bool {
            using T = std::decay_t<decltype(a)>;
            const T& b = std::get<T>(other.__M_v);
            if constexpr (std::is_same_v<T, std::monostate>) {
                return true;
            } else if constexpr (std::is_same_v<T, media::binary_view>) {
                return std::equal(a.begin(), a.end(), b.begin(), b.end());
            } else {
                return a == b;
            }
        },
        __M_v);
}

std::string media::timestamp::isoformat() const {
    using namespace std::chrono;
    const sys_days day = floor<days>(local_time);
    const year_month_day ymd(day);
    const hh_mm_ss<microseconds> hms(local_time - day);

    char buf[48] = {};
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02ld:%02ld:%02ld",
                          static_cast<int>(ymd.year()),
                          static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()),
                          static_cast<long>(hms.hours().count()),
                          static_cast<long>(hms.minutes().count()),
                          static_cast<long>(hms.seconds().count()));
    if (hms.subseconds().count() != 0) {
        n += std::snprintf(buf + n, sizeof(buf) - n, ".%06ld",
                           static_cast<long>(hms.subseconds().count()));
    }
    if (utc_offset) {
        const long off = utc_offset->count();
        const long abs_off = off < 0 ? -off : off;
        std::snprintf(buf + n, sizeof(buf) - n, "%c%02ld:%02ld",
                      off < 0 ? '-' : '+', abs_off / 60, abs_off % 60);
    }
    return buf;
}

auto media::timestamp::utc(std::chrono::system_clock::time_point tp)
    -> timestamp {
    return {std::chrono::floor<std::chrono::microseconds>(tp),
            std::chrono::minutes(0)};
}

auto media::timestamp::naive(std::chrono::system_clock::time_point tp)
    -> timestamp {
    return {std::chrono::floor<std::chrono::microseconds>(tp), std::nullopt};
}

std::optional<media::value>
media::apply_adapters(const codec_options& options, const opaque& o) {
    for (const auto& adapter : options.adapters) {
        if (adapter) {
            if (std::optional<value> v = adapter(o); v) {
                return v;
            }
        }
    }
    return std::nullopt;
}

std::string media::uuid_to_string(const uuid_type& u) {
    return boost::uuids::to_string(u);
}
