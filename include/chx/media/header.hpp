#pragma once

#include <algorithm>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <strings.h>

namespace chx::media {
/// Case-insensitive header list. Only the parts content negotiation reads
/// and writes: Accept, Content-Type, Vary.
class fields_type {
    using __container_type = std::vector<std::pair<std::string, std::string>>;
    __container_type __M_v;

    static bool __ncase_cmp(std::string_view a,
                            std::string_view b) noexcept(true) {
        if (a.size() == b.size()) {
            return ::strncasecmp(a.data(), b.data(), a.size()) == 0;
        } else {
            return false;
        }
    }

  public:
    using value_type = typename __container_type::value_type;
    using iterator_type = typename __container_type::iterator;
    using const_iterator_type = typename __container_type::const_iterator;

    fields_type() noexcept(true) = default;
    fields_type(const fields_type&) = default;
    fields_type(fields_type&&) noexcept(true) = default;
    fields_type(std::initializer_list<value_type> list) : __M_v(list) {}

    fields_type& operator=(const fields_type&) = default;
    fields_type& operator=(fields_type&&) noexcept(true) = default;

    iterator_type begin() noexcept(true) { return __M_v.begin(); }
    const_iterator_type begin() const noexcept(true) { return __M_v.begin(); }
    iterator_type end() noexcept(true) { return __M_v.end(); }
    const_iterator_type end() const noexcept(true) { return __M_v.end(); }
    std::size_t size() const noexcept(true) { return __M_v.size(); }
    bool empty() const noexcept(true) { return __M_v.empty(); }

    iterator_type find(std::string_view key) noexcept(true) {
        return std::find_if(
            __M_v.begin(), __M_v.end(),
            [key](const auto& i) -> bool { return __ncase_cmp(key, i.first); });
    }
    const_iterator_type find(std::string_view key) const noexcept(true) {
        return std::find_if(
            __M_v.begin(), __M_v.end(),
            [key](const auto& i) -> bool { return __ncase_cmp(key, i.first); });
    }
    bool contains(std::string_view key) const noexcept(true) {
        return find(key) != __M_v.end();
    }
    std::optional<std::string_view> get(std::string_view key) const
        noexcept(true) {
        if (auto ite = find(key); ite != end()) {
            return std::string_view{ite->second};
        } else {
            return std::nullopt;
        }
    }

    // appends to an existing field as a comma separated list
    template <typename Key, typename Value>
    value_type& add_field(Key&& key, Value&& value) {
        auto ite = find(key);
        if (ite != __M_v.end()) {
            if (ite->second.empty()) {
                ite->second = std::forward<Value>(value);
            } else {
                ite->second.append(", ").append(value);
            }
            return *ite;
        } else {
            return __M_v.emplace_back(std::forward<Key>(key),
                                      std::forward<Value>(value));
        }
    }
    template <typename Key, typename Value>
    value_type& set_field(Key&& key, Value&& value) {
        auto ite = find(key);
        if (ite != __M_v.end()) {
            ite->second = std::forward<Value>(value);
            return *ite;
        } else {
            return __M_v.emplace_back(std::forward<Key>(key),
                                      std::forward<Value>(value));
        }
    }
    std::size_t erase(std::string_view key) {
        auto ite = std::remove_if(
            __M_v.begin(), __M_v.end(),
            [key](const auto& i) -> bool { return __ncase_cmp(key, i.first); });
        std::size_t n = __M_v.end() - ite;
        __M_v.erase(ite, __M_v.end());
        return n;
    }

    void clear() noexcept(true) { __M_v.clear(); }
};
}  // namespace chx::media
