#include <gtest/gtest.h>

#include <chx/media/exception.hpp>
#include <chx/media/json.hpp>
#include <chx/media/msgpack.hpp>
#include <chx/media/registry.hpp>

#include <thread>

namespace chx::media::test {

class fake_transcoder : public transcoder {
    std::string_view do_content_type() const noexcept(true) override {
        return "application/fake";
    }
    result_type do_to_bytes(const value&,
                            std::optional<std::string_view>) const override {
        return {};
    }
    value do_from_bytes(binary_view,
                        std::optional<std::string_view>) const override {
        return nullptr;
    }
};

TEST(RegistryTest, HandlerListedInAvailableContentTypes) {
    content_registry registry;
    EXPECT_TRUE(registry.add("application/json",
                             std::make_shared<fake_transcoder>()));
    std::vector<std::string> available = registry.available_content_types();
    ASSERT_EQ(available.size(), 1u);
    EXPECT_EQ(available[0], "application/json");
}

TEST(RegistryTest, HandlerIsNotOverwritten) {
    content_registry registry;
    auto handler = std::make_shared<fake_transcoder>();
    EXPECT_TRUE(registry.add("application/json", handler));
    EXPECT_FALSE(registry.add("application/json",
                              std::make_shared<fake_transcoder>()));
    EXPECT_EQ(registry.get("application/json"), handler);
    EXPECT_EQ(registry.available_content_types().size(), 1u);
}

TEST(RegistryTest, KeysAreNormalized) {
    content_registry registry;
    auto handler = std::make_shared<fake_transcoder>();
    registry.add("application/json; VerSion=foo; type=WhatEver", handler);
    EXPECT_EQ(registry.get("Application/JSON;type=WhatEver;version=foo"),
              handler);
    EXPECT_EQ(registry.available_content_types(),
              std::vector<std::string>{
                  "application/json; type=WhatEver; version=foo"});
}

TEST(RegistryTest, CharsetCaseDoesNotCreateASecondEntry) {
    content_registry registry;
    auto handler = std::make_shared<fake_transcoder>();
    registry.add("application/json; charset=UTF-8", handler);
    registry.add("application/json; charset=utf-8",
                 std::make_shared<fake_transcoder>());
    EXPECT_EQ(registry.available_content_types().size(), 1u);
    EXPECT_EQ(registry.get("application/json; charset=utf-8"), handler);
}

TEST(RegistryTest, LookupMiss) {
    content_registry registry;
    EXPECT_THROW(registry.get("application/json"), not_found);
    EXPECT_EQ(registry.find("application/json"), nullptr);
    EXPECT_THROW(registry.find("not a media type"), malformed_media_type);
    EXPECT_THROW(registry.add("json", std::make_shared<fake_transcoder>()),
                 malformed_media_type);
}

TEST(RegistryTest, AddTranscoderUsesItsContentTypeOrAnOverride) {
    content_registry registry;
    registry.add_transcoder(std::make_shared<msgpack_transcoder>());
    registry.add_transcoder(std::make_shared<msgpack_transcoder>(
                                "expected/content"),
                            "application/vendor+msgpack");
    EXPECT_EQ(registry.available_content_types(),
              (std::vector<std::string>{"application/msgpack",
                                        "application/vendor+msgpack"}));
    EXPECT_EQ(registry.get("application/vendor+msgpack")->content_type(),
              "expected/content");
}

TEST(RegistryTest, TextAndBinaryHelpers) {
    content_registry registry;
    registry.add_text_content_type(
        "text/plain; charset=latin1", "latin1",
        [](const value& v) { return v.as_string(); },
        [](std::string_view s) -> value { return s; });
    registry.add_binary_content_type(
        "application/octet-stream",
        [](const value& v) { return v.as_binary(); },
        [](binary_view b) -> value { return binary_type(b.begin(), b.end()); });

    // the charset parameter is stripped from the key
    EXPECT_EQ(registry.available_content_types(),
              (std::vector<std::string>{"text/plain",
                                        "application/octet-stream"}));
    auto text = registry.get("text/plain");
    EXPECT_EQ(text->content_type(), "text/plain");
    EXPECT_EQ(text->to_bytes("x").first, "text/plain; charset=\"latin1\"");
    EXPECT_EQ(registry.get("application/octet-stream")->content_type(),
              "application/octet-stream");
}

TEST(RegistryTest, TextTranscoderKeyHasNoCharset) {
    content_registry registry;
    EXPECT_TRUE(registry.add_transcoder(
        std::make_shared<json_transcoder>("application/json; charset=utf-8")));
    EXPECT_EQ(registry.available_content_types(),
              std::vector<std::string>{"application/json"});
    EXPECT_EQ(registry.get("application/json")->to_bytes(1).first,
              "application/json; charset=\"utf-8\"");
}

TEST(RegistryTest, Defaults) {
    content_registry registry;
    EXPECT_FALSE(registry.default_content_type());
    EXPECT_FALSE(registry.default_encoding());
    registry.set_default_content_type("Application/JSON", "UTF-8");
    EXPECT_EQ(registry.default_content_type(), "application/json");
    EXPECT_EQ(registry.default_encoding(), "UTF-8");
    registry.set_default_content_type("application/msgpack");
    EXPECT_EQ(registry.default_content_type(), "application/msgpack");
    EXPECT_FALSE(registry.default_encoding());
    registry.set_default_encoding("latin1");
    EXPECT_EQ(registry.default_encoding(), "latin1");
    registry.set_default_encoding(std::nullopt);
    EXPECT_FALSE(registry.default_encoding());
}

TEST(RegistryTest, RejectsUnknownDefaultEncoding) {
    content_registry registry;
    registry.set_default_content_type("application/json", "utf-8");
    EXPECT_THROW(registry.set_default_encoding("utf-16"), unknown_encoding);
    EXPECT_THROW(registry.set_default_content_type("text/plain", "klingon"),
                 unknown_encoding);
    EXPECT_EQ(registry.default_content_type(), "application/json");
    EXPECT_EQ(registry.default_encoding(), "utf-8");
}

TEST(RegistryTest, ConcurrentRegistrationAndLookup) {
    content_registry registry;
    registry.add_transcoder(std::make_shared<json_transcoder>());
    std::vector<std::jthread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&registry, i]() {
            for (int j = 0; j < 100; ++j) {
                registry.add("application/x-" + std::to_string(i) + "-" +
                                 std::to_string(j),
                             std::make_shared<fake_transcoder>());
                EXPECT_NE(registry.find("application/json"), nullptr);
            }
        });
    }
    threads.clear();
    EXPECT_EQ(registry.available_content_types().size(), 401u);
}

}  // namespace chx::media::test
