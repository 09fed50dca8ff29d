#include "./log.hpp"
#include "./utility/charset.hpp"

#include <chx/media/exception.hpp>
#include <chx/media/media_type.hpp>
#include <chx/media/registry.hpp>

#include <mutex>
#include <stdexcept>

namespace media = chx::media;
using namespace chx::log::literals;

static void check_encoding(const std::optional<std::string>& encoding) {
    if (encoding && !utility::charset_from_name(*encoding)) {
        __CHXMEDIA_THROW(media::unknown_encoding,
                         "unsupported default encoding \"" + *encoding + "\"");
    }
}

bool media::content_registry::add(std::string_view content_type,
                                  std::shared_ptr<const transcoder> handler) {
    if (!handler) {
        throw std::invalid_argument("chxmedia: null transcoder");
    }
    std::string key = normalize_media_type(content_type);
    std::lock_guard lg(__M_mutex);
    if (__M_handlers.contains(key)) {
        log_warn("content type %s is already registered, ignored\n"_str, key);
        return false;
    }
    __M_available.push_back(key);
    __M_handlers.emplace(std::move(key), std::move(handler));
    return true;
}

bool media::content_registry::add_transcoder(
    std::shared_ptr<const transcoder> handler,
    std::optional<std::string_view> content_type) {
    if (!handler) {
        throw std::invalid_argument("chxmedia: null transcoder");
    }
    std::string_view key =
        content_type ? *content_type : handler->content_type();
    return add(key, std::move(handler));
}

bool media::content_registry::add_text_content_type(
    std::string_view content_type, std::string default_encoding,
    dumps_function dumps, loads_function loads) {
    // registered under the transcoder's content type, charset removed
    return add_transcoder(std::make_shared<text_transcoder>(
        std::string(content_type), std::move(dumps), std::move(loads),
        std::move(default_encoding)));
}

bool media::content_registry::add_binary_content_type(
    std::string_view content_type, pack_function pack,
    unpack_function unpack) {
    std::string ct(content_type);
    return add(content_type,
               std::make_shared<binary_transcoder>(
                   std::move(ct), std::move(pack), std::move(unpack)));
}

auto media::content_registry::get(std::string_view content_type) const
    -> std::shared_ptr<const transcoder> {
    if (auto __r = find(content_type); __r) {
        return __r;
    } else {
        __CHXMEDIA_THROW(not_found, "no transcoder registered for " +
                                        std::string(content_type));
    }
}

auto media::content_registry::find(std::string_view content_type) const
    -> std::shared_ptr<const transcoder> {
    const std::string key = normalize_media_type(content_type);
    std::shared_lock lg(__M_mutex);
    if (auto ite = __M_handlers.find(key); ite != __M_handlers.end()) {
        return ite->second;
    } else {
        return nullptr;
    }
}

std::vector<std::string>
media::content_registry::available_content_types() const {
    std::shared_lock lg(__M_mutex);
    return __M_available;
}

void media::content_registry::set_default_content_type(
    std::string_view content_type, std::optional<std::string> encoding) {
    std::string key = normalize_media_type(content_type);
    check_encoding(encoding);
    std::lock_guard lg(__M_mutex);
    __M_default_content_type.emplace(std::move(key));
    __M_default_encoding = std::move(encoding);
}

void media::content_registry::set_default_encoding(
    std::optional<std::string> encoding) {
    check_encoding(encoding);
    std::lock_guard lg(__M_mutex);
    __M_default_encoding = std::move(encoding);
}

std::optional<std::string>
media::content_registry::default_content_type() const {
    std::shared_lock lg(__M_mutex);
    return __M_default_content_type;
}

std::optional<std::string> media::content_registry::default_encoding() const {
    std::shared_lock lg(__M_mutex);
    return __M_default_encoding;
}
