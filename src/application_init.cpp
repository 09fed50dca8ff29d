#include "./log.hpp"
#include "./global_conf.hpp"

#include <chx/media/json.hpp>
#include <chx/media/msgpack.hpp>

#include <boost/json.hpp>
#include <boost/program_options.hpp>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace media = chx::media;
using namespace chx::log::literals;

constexpr static boost::json::parse_options json_opt{
    .allow_comments = true, .allow_trailing_commas = true};

static std::string as_std_string(const boost::json::value& v) {
    return std::string(v.as_string().subview());
}

static void transcoder_list_append(const boost::json::value& item) {
    const auto& item_obj = item.as_object();
    auto& conf = global_conf.transcoder_list.emplace_back();
    conf.content_type = as_std_string(item_obj.at("content_type"));
    conf.kind = item_obj.contains("kind") ? as_std_string(item_obj.at("kind"))
                                          : "json";
    if (conf.kind != "json" && conf.kind != "msgpack") {
        throw std::runtime_error("Invalid transcoder kind " + conf.kind);
    }
    if (item_obj.contains("encoding")) {
        conf.encoding = as_std_string(item_obj.at("encoding"));
    }
}

static void readin_and_process(const std::string& filename) {
    std::filesystem::path path = std::filesystem::canonical(filename);
    log_info(CHXLOG_STR("Reading configure file at %s\n"), path.c_str());

    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Cannot open configure file " +
                                 path.string());
    }
    auto rootv = boost::json::parse(ifs, {}, json_opt);
    const auto& rootn = rootv.as_object();

    if (rootn.contains("default_content_type")) {
        global_conf.default_content_type =
            as_std_string(rootn.at("default_content_type"));
    }
    if (rootn.contains("default_encoding")) {
        global_conf.default_encoding =
            as_std_string(rootn.at("default_encoding"));
    }
    if (rootn.contains("max_depth")) {
        const auto& md = rootn.at("max_depth");
        if (!md.is_number() || md.to_number<std::int64_t>() <= 0) {
            throw std::runtime_error("Invalid max_depth");
        }
        global_conf.max_depth = md.to_number<std::size_t>();
    }
    if (rootn.contains("log_file")) {
        global_conf.log_file = as_std_string(rootn.at("log_file"));
    }
    if (rootn.contains("transcoders")) {
        const auto& tn = rootn.at("transcoders");
        if (tn.is_array()) {
            for (const auto& v : tn.as_array()) {
                transcoder_list_append(v);
            }
        } else {
            transcoder_list_append(tn);
        }
    }
}

static void open_log_file() {
    if (global_conf.log_file.empty()) {
        return;
    }
    int fd = ::open(global_conf.log_file.c_str(),
                    O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) {
        throw std::runtime_error(chx::log::format(
            CHXLOG_STR("failed to open log file %s: %s"), global_conf.log_file,
            std::string_view{strerror(errno)}));
    }
    set_log_sink(fd);
}

void application_init(int argc, char** argv) {
    namespace po = boost::program_options;
    po::options_description desc("chxmedia");
    desc.add_options()("config,c", po::value<std::string>(),
                       "Set path to config file")(
        "content-type,t", po::value<std::string>()->required(),
        "Content-Type of the request body")(
        "accept,a", po::value<std::string>(), "Accept header of the request")(
        "input,i", po::value<std::string>()->default_value("-"),
        "Read the request body from file, - for stdin")(
        "output,o", po::value<std::string>()->default_value("-"),
        "Write the response body to file, - for stdout")(
        "help,h", "Print help information");
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.contains("help")) {
        std::cout << desc << "\n";
        terminate_log_backend();
        std::exit(0);
    }
    po::notify(vm);

    if (vm.contains("config")) {
        readin_and_process(vm.at("config").as<std::string>());
    }
    global_conf.request.content_type = vm.at("content-type").as<std::string>();
    if (vm.contains("accept")) {
        global_conf.request.accept = vm.at("accept").as<std::string>();
    }
    global_conf.request.input = vm.at("input").as<std::string>();
    global_conf.request.output = vm.at("output").as<std::string>();

    open_log_file();
}

void registry_init(media::content_registry& registry) {
    media::codec_options opt;
    opt.max_depth = global_conf.max_depth;

    if (global_conf.transcoder_list.empty()) {
        registry.add_transcoder(std::make_shared<media::json_transcoder>(
            "application/json", "utf-8", opt));
        registry.add_transcoder(std::make_shared<media::msgpack_transcoder>(
            "application/msgpack", opt));
        registry.set_default_content_type("application/json");
    } else {
        for (const auto& t : global_conf.transcoder_list) {
            if (t.kind == "msgpack") {
                registry.add_transcoder(
                    std::make_shared<media::msgpack_transcoder>(t.content_type,
                                                                opt));
            } else {
                registry.add_transcoder(
                    std::make_shared<media::json_transcoder>(
                        t.content_type, t.encoding.value_or("utf-8"), opt));
            }
        }
    }
    if (global_conf.default_content_type) {
        registry.set_default_content_type(*global_conf.default_content_type);
    }
    if (global_conf.default_encoding) {
        registry.set_default_encoding(*global_conf.default_encoding);
    }

    for (const auto& ct : registry.available_content_types()) {
        log_info(CHXLOG_STR("Registered content type %s\n"), ct);
    }
}
