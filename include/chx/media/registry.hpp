#pragma once

#include "./handlers.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chx::media {
/*
content_registry
1. entries are keyed by the normalized media type, the first registration for
   a key wins and later ones are ignored with a warning
2. available_content_types() keeps registration order, negotiation breaks
   ties with it
3. entries are never removed
4. lookups take a shared lock, registration and default setters an exclusive
   one
*/
class content_registry {
    mutable std::shared_mutex __M_mutex;
    std::unordered_map<std::string, std::shared_ptr<const transcoder>>
        __M_handlers;
    std::vector<std::string> __M_available;
    std::optional<std::string> __M_default_content_type;
    std::optional<std::string> __M_default_encoding;

  public:
    content_registry() = default;
    content_registry(const content_registry&) = delete;
    content_registry& operator=(const content_registry&) = delete;

    // throws malformed_media_type. returns false when the key was taken.
    bool add(std::string_view content_type,
             std::shared_ptr<const transcoder> handler);
    bool add_transcoder(std::shared_ptr<const transcoder> handler,
                        std::optional<std::string_view> content_type =
                            std::nullopt);
    bool add_text_content_type(std::string_view content_type,
                               std::string default_encoding,
                               dumps_function dumps, loads_function loads);
    bool add_binary_content_type(std::string_view content_type,
                                 pack_function pack, unpack_function unpack);

    // throws not_found, malformed_media_type
    std::shared_ptr<const transcoder> get(std::string_view content_type) const;
    // empty pointer on a miss, throws malformed_media_type
    std::shared_ptr<const transcoder>
    find(std::string_view content_type) const;

    std::vector<std::string> available_content_types() const;

    // the content type is normalized and does not have to be registered yet.
    // the default encoding is replaced, std::nullopt clears it. both setters
    // throw unknown_encoding for a charset no text transcoder supports.
    void set_default_content_type(
        std::string_view content_type,
        std::optional<std::string> encoding = std::nullopt);
    void set_default_encoding(std::optional<std::string> encoding);
    std::optional<std::string> default_content_type() const;
    std::optional<std::string> default_encoding() const;
};
}  // namespace chx::media
