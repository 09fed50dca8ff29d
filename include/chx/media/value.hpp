#pragma once

#include <boost/uuid/uuid.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

namespace chx::media {
class value;

using array_type = std::vector<value>;
using binary_type = std::vector<unsigned char>;
using binary_view = std::span<const unsigned char>;
using uuid_type = boost::uuids::uuid;

/// String keyed mapping that remembers insertion order. Comparison ignores
/// the order.
class object_type {
    using __container_type = std::vector<std::pair<std::string, value>>;
    __container_type __M_v;

  public:
    using value_type = typename __container_type::value_type;
    using iterator_type = typename __container_type::iterator;
    using const_iterator_type = typename __container_type::const_iterator;

    object_type() noexcept(true) = default;
    object_type(const object_type&);
    object_type(object_type&&) noexcept(true);
    object_type(std::initializer_list<value_type> list);
    ~object_type();

    object_type& operator=(const object_type&);
    object_type& operator=(object_type&&) noexcept(true);

    iterator_type begin() noexcept(true) { return __M_v.begin(); }
    const_iterator_type begin() const noexcept(true) { return __M_v.begin(); }
    iterator_type end() noexcept(true) { return __M_v.end(); }
    const_iterator_type end() const noexcept(true) { return __M_v.end(); }
    std::size_t size() const noexcept(true) { return __M_v.size(); }
    bool empty() const noexcept(true) { return __M_v.empty(); }
    void reserve(std::size_t n) { __M_v.reserve(n); }

    iterator_type find(std::string_view key) noexcept(true);
    const_iterator_type find(std::string_view key) const noexcept(true);
    bool contains(std::string_view key) const noexcept(true);
    // throws std::out_of_range
    value& at(std::string_view key);
    const value& at(std::string_view key) const;

    value& insert_or_assign(std::string key, value v);
    value& operator[](std::string_view key);

    bool operator==(const object_type& other) const;
    bool operator!=(const object_type& other) const {
        return !(*this == other);
    }
};

/// Naive or zone-aware point in time with microsecond resolution.
/// local_time is the wall clock reading, utc_offset is set for aware values.
struct timestamp {
    std::chrono::sys_time<std::chrono::microseconds> local_time;
    std::optional<std::chrono::minutes> utc_offset;

    // YYYY-MM-DDTHH:MM:SS[.ffffff][+HH:MM]
    std::string isoformat() const;

    static timestamp utc(std::chrono::system_clock::time_point tp);
    static timestamp naive(std::chrono::system_clock::time_point tp);

    bool operator==(const timestamp& other) const noexcept(true) {
        return local_time == other.local_time && utc_offset == other.utc_offset;
    }
};

/// Arbitrary object with no built-in encoding. Encoders hand it to the
/// registered value adapters.
class opaque {
    std::shared_ptr<const void> __M_ptr;
    std::type_index __M_type;

    opaque(std::shared_ptr<const void> ptr, std::type_index type) noexcept(true)
        : __M_ptr(std::move(ptr)), __M_type(type) {}

  public:
    template <typename T> static opaque make(T t) {
        return opaque(std::make_shared<const T>(std::move(t)),
                      std::type_index(typeid(T)));
    }

    std::type_index type() const noexcept(true) { return __M_type; }

    template <typename T> const T* get() const noexcept(true) {
        if (__M_type == std::type_index(typeid(T))) {
            return static_cast<const T*>(__M_ptr.get());
        } else {
            return nullptr;
        }
    }

    bool operator==(const opaque& other) const noexcept(true) {
        return __M_ptr == other.__M_ptr;
    }
};

enum class kind : unsigned char {
    null,
    boolean,
    int64,
    uint64,
    float64,
    string,
    binary,
    binary_view,
    array,
    object,
    uuid,
    timestamp,
    opaque
};

class value {
  public:
    using variant_type =
        std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double,
                     std::string, binary_type, binary_view, array_type,
                     object_type, uuid_type, timestamp, opaque>;

  private:
    variant_type __M_v;

  public:
    value() noexcept(true) = default;
    value(const value&) = default;
    value(value&&) noexcept(true) = default;
    value& operator=(const value&) = default;
    value& operator=(value&&) noexcept(true) = default;

    value(std::nullptr_t) noexcept(true) {}
    value(bool b) noexcept(true) : __M_v(b) {}
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T> &&
                                          !std::is_same_v<T, bool>>>
    value(T t) noexcept(true) {
        if constexpr (std::is_signed_v<T>) {
            __M_v.template emplace<std::int64_t>(t);
        } else {
            __M_v.template emplace<std::uint64_t>(t);
        }
    }
    value(double d) noexcept(true) : __M_v(d) {}
    value(float f) noexcept(true) : __M_v(static_cast<double>(f)) {}
    value(const char* s) : __M_v(std::string(s)) {}
    value(std::string_view s) : __M_v(std::string(s)) {}
    value(std::string s) noexcept(true) : __M_v(std::move(s)) {}
    value(binary_type b) noexcept(true) : __M_v(std::move(b)) {}
    value(binary_view b) noexcept(true) : __M_v(b) {}
    value(array_type a) noexcept(true) : __M_v(std::move(a)) {}
    value(object_type o) noexcept(true) : __M_v(std::move(o)) {}
    value(const uuid_type& u) noexcept(true) : __M_v(u) {}
    value(timestamp t) noexcept(true) : __M_v(std::move(t)) {}
    value(opaque o) noexcept(true) : __M_v(std::move(o)) {}

    // sets, tuples turned into vectors, and other ranges become arrays
    template <typename Range> static value from_range(const Range& range) {
        array_type __r;
        for (const auto& i : range) {
            __r.emplace_back(i);
        }
        return __r;
    }
    // byte buffers of any element type with the size of a byte
    template <typename Range> static value from_bytes(const Range& range) {
        const auto* p = reinterpret_cast<const unsigned char*>(std::data(range));
        return binary_type(p, p + std::size(range));
    }

    kind get_kind() const noexcept(true) {
        return static_cast<kind>(__M_v.index());
    }
    const variant_type& variant() const noexcept(true) { return __M_v; }
    variant_type& variant() noexcept(true) { return __M_v; }

    bool is_null() const noexcept(true) { return __M_v.index() == 0; }
    bool is_bool() const noexcept(true) { return get_kind() == kind::boolean; }
    bool is_string() const noexcept(true) {
        return get_kind() == kind::string;
    }
    bool is_array() const noexcept(true) { return get_kind() == kind::array; }
    bool is_object() const noexcept(true) {
        return get_kind() == kind::object;
    }

    // throw std::bad_variant_access on kind mismatch
    bool as_bool() const { return std::get<bool>(__M_v); }
    std::int64_t as_int64() const { return std::get<std::int64_t>(__M_v); }
    std::uint64_t as_uint64() const { return std::get<std::uint64_t>(__M_v); }
    double as_double() const { return std::get<double>(__M_v); }
    const std::string& as_string() const { return std::get<std::string>(__M_v); }
    const binary_type& as_binary() const { return std::get<binary_type>(__M_v); }
    const array_type& as_array() const { return std::get<array_type>(__M_v); }
    array_type& as_array() { return std::get<array_type>(__M_v); }
    const object_type& as_object() const { return std::get<object_type>(__M_v); }
    object_type& as_object() { return std::get<object_type>(__M_v); }

    template <typename T> const T* if_() const noexcept(true) {
        return std::get_if<T>(&__M_v);
    }

    bool operator==(const value& other) const;
    bool operator!=(const value& other) const { return !(*this == other); }
};

/// Converts an opaque object into an encodable value, or declines with
/// std::nullopt. Adapters are tried in registration order.
using value_adapter = std::function<std::optional<value>(const opaque&)>;

/// Encoder/decoder settings shared by the built-in codecs.
struct codec_options {
    std::vector<value_adapter> adapters;
    // nesting limit for decoding (and for adapter recursion on encode)
    std::size_t max_depth = 512;
};

// std::nullopt when no adapter accepts the object
std::optional<value> apply_adapters(const codec_options& options,
                                    const opaque& o);

// canonical text for extension scalars
std::string uuid_to_string(const uuid_type& u);
}  // namespace chx::media
