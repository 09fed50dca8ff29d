#pragma once

namespace chx::media {
// the statuses a content_context can produce
enum class status_code : unsigned short {
    OK = 200,
    Bad_Request = 400,
    Unsupported_Media_Type = 415,
    Internal_Server_Error = 500
};
}  // namespace chx::media
