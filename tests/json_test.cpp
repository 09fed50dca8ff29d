#include <gtest/gtest.h>

#include "utility/base64.hpp"

#include <chx/media/exception.hpp>
#include <chx/media/json.hpp>

#include <boost/uuid/string_generator.hpp>
#include <cmath>

namespace chx::media::test {

class JsonTest : public ::testing::Test {
  protected:
    json_transcoder transcoder;

    std::string dumps(const value& v) const {
        return transcoder.dumps()(v);
    }
};

TEST_F(JsonTest, DumpsCompactText) {
    value v = object_type{{"a", array_type{1, -2, true, nullptr}},
                          {"b", "text"}};
    EXPECT_EQ(dumps(v), R"({"a":[1,-2,true,null],"b":"text"})");
}

TEST_F(JsonTest, FloatsSurviveALoadCycle) {
    for (double d : {2.5, -0.125, 1e300, 0.1}) {
        EXPECT_EQ(json::loads(dumps(d)), value(d));
    }
}

TEST_F(JsonTest, UuidsAreDumpedAsStrings) {
    uuid_type u = boost::uuids::string_generator()(
        "9a1f4ad5-1f3e-4a3e-8d33-0b2bd7e0e5a1");
    EXPECT_EQ(dumps(object_type{{"id", u}}),
              R"({"id":"9a1f4ad5-1f3e-4a3e-8d33-0b2bd7e0e5a1"})");
}

TEST_F(JsonTest, TimestampsAreDumpedInIsoformat) {
    using namespace std::chrono;
    const sys_time<microseconds> t = sys_days{2023y / 12 / 31} + 23h + 59min +
                                     58s + 1us;
    EXPECT_EQ(dumps(object_type{{"now", timestamp{t, std::nullopt}}}),
              R"({"now":"2023-12-31T23:59:58.000001"})");
    EXPECT_EQ(dumps(object_type{{"now", timestamp::utc(t)}}),
              R"({"now":"2023-12-31T23:59:58.000001+00:00"})");
}

TEST_F(JsonTest, BytesAreBase64Encoded) {
    binary_type data(127);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<unsigned char>(255 - i);
    }
    const std::string expected =
        "{\"bin\":\"" + utility::base64_encode(data) + "\"}";
    EXPECT_EQ(dumps(object_type{{"bin", data}}), expected);
    EXPECT_EQ(dumps(object_type{{"bin", binary_view(data)}}), expected);
}

TEST_F(JsonTest, UnhandledObjectsRaiseTypeError) {
    struct unknown {};
    EXPECT_THROW(dumps(opaque::make(unknown{})), type_error);
    EXPECT_THROW(dumps(std::nan("")), type_error);
    EXPECT_THROW(dumps(HUGE_VAL), type_error);
}

TEST_F(JsonTest, AdaptersConvertOpaqueObjects) {
    struct money {
        long cents;
    };
    codec_options opt;
    opt.adapters.push_back([](const opaque& o) -> std::optional<value> {
        if (const money* m = o.get<money>(); m) {
            return std::to_string(m->cents / 100) + "." +
                   std::to_string(m->cents % 100);
        }
        return std::nullopt;
    });
    EXPECT_EQ(json::dumps(array_type{opaque::make(money{1250})}, opt),
              R"(["12.50"])");
}

TEST_F(JsonTest, LoadsValues) {
    value v = json::loads(
        R"( {"i": -3, "u": 18446744073709551615, "d": 1e2, "s": "café",
             "a": [], "o": {"n": null}} )");
    ASSERT_TRUE(v.is_object());
    const object_type& o = v.as_object();
    EXPECT_EQ(o.at("i"), value(-3));
    EXPECT_EQ(o.at("u"), value(std::numeric_limits<std::uint64_t>::max()));
    EXPECT_EQ(o.at("d"), value(100.0));
    EXPECT_EQ(o.at("s"), value("caf\xc3\xa9"));
    EXPECT_EQ(o.at("a"), value(array_type{}));
    EXPECT_TRUE(o.at("o").as_object().at("n").is_null());
}

TEST_F(JsonTest, LoadsKeepsMemberOrder) {
    value v = json::loads(R"({"z":1,"a":2,"m":3})");
    std::vector<std::string> keys;
    for (const auto& [k, item] : v.as_object()) {
        keys.push_back(k);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"z", "a", "m"}));
    EXPECT_EQ(dumps(v), R"({"z":1,"a":2,"m":3})");
}

TEST_F(JsonTest, LoadRejectsInvalidText) {
    EXPECT_THROW(json::loads("{"), decode_error);
    EXPECT_THROW(json::loads("[1,]"), decode_error);
    EXPECT_THROW(json::loads("{} {}"), decode_error);
    EXPECT_THROW(json::loads(""), decode_error);

    codec_options opt;
    opt.max_depth = 2;
    EXPECT_NO_THROW(json::loads("[[1]]", opt));
    EXPECT_THROW(json::loads("[[[1]]]", opt), decode_error);
}

TEST_F(JsonTest, TranscoderAnnouncesCharset) {
    EXPECT_EQ(transcoder.content_type(), "application/json");
    EXPECT_EQ(transcoder.default_encoding(), "utf-8");
    auto [ct, body] = transcoder.to_bytes(object_type{{"k", "v"}});
    EXPECT_EQ(ct, "application/json; charset=\"utf-8\"");
    EXPECT_EQ(std::string(body.begin(), body.end()), R"({"k":"v"})");
}

}  // namespace chx::media::test
