#pragma once

#include <chx/media/registry.hpp>

#include <optional>
#include <string>
#include <vector>

struct global_conf {
    std::optional<std::string> default_content_type;
    std::optional<std::string> default_encoding;

    struct transcoder_conf {
        std::string content_type;
        // "json" or "msgpack"
        std::string kind;
        std::optional<std::string> encoding;
    };
    std::vector<transcoder_conf> transcoder_list;

    std::size_t max_depth = 512;
    std::string log_file;

    struct {
        std::string content_type;
        std::optional<std::string> accept;
        std::string input = "-";
        std::string output = "-";
    } request;
} inline global_conf;

// throws on invalid command line or configure file
void application_init(int argc, char** argv);
void registry_init(chx::media::content_registry& registry);
