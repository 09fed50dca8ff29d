#include <gtest/gtest.h>

#include <chx/media/exception.hpp>
#include <chx/media/msgpack.hpp>

#include <boost/uuid/string_generator.hpp>
#include <array>
#include <limits>
#include <set>

namespace chx::media::test {

static binary_type b(std::initializer_list<unsigned char> l) { return l; }

static binary_type pack_string(std::string_view s) {
    binary_type out;
    if (s.size() < 32) {
        out.push_back(0xa0 | s.size());
    } else if (s.size() < 256) {
        out.push_back(0xd9);
        out.push_back(s.size());
    } else {
        out.push_back(0xda);
        out.push_back(s.size() >> 8);
        out.push_back(s.size() & 0xff);
    }
    out.insert(out.end(), s.begin(), s.end());
    return out;
}

class MsgpackTest : public ::testing::Test {
  protected:
    msgpack_transcoder transcoder;
};

TEST_F(MsgpackTest, Scalars) {
    EXPECT_EQ(transcoder.packb(nullptr), b({0xc0}));
    EXPECT_EQ(transcoder.packb(false), b({0xc2}));
    EXPECT_EQ(transcoder.packb(true), b({0xc3}));
    EXPECT_EQ(transcoder.packb(1.5),
              b({0xcb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

TEST_F(MsgpackTest, PositiveIntegersUseNarrowestFormat) {
    EXPECT_EQ(transcoder.packb(0), b({0x00}));
    EXPECT_EQ(transcoder.packb((1 << 7) - 1), b({0x7f}));
    EXPECT_EQ(transcoder.packb(1 << 7), b({0xcc, 0x80}));
    EXPECT_EQ(transcoder.packb(1 << 8), b({0xcd, 0x01, 0x00}));
    EXPECT_EQ(transcoder.packb(1 << 16), b({0xce, 0x00, 0x01, 0x00, 0x00}));
    EXPECT_EQ(transcoder.packb(std::int64_t(1) << 32),
              b({0xcf, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00}));
    EXPECT_EQ(transcoder.packb(std::numeric_limits<std::uint64_t>::max()),
              b({0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
    // unsigned values share the signed encoding
    EXPECT_EQ(transcoder.packb(200u), b({0xcc, 0xc8}));
}

TEST_F(MsgpackTest, NegativeIntegersUseNarrowestFormat) {
    EXPECT_EQ(transcoder.packb(-1), b({0xff}));
    EXPECT_EQ(transcoder.packb(-32), b({0xe0}));
    EXPECT_EQ(transcoder.packb(-33), b({0xd0, 0xdf}));
    EXPECT_EQ(transcoder.packb(-(1 << 7)), b({0xd0, 0x80}));
    EXPECT_EQ(transcoder.packb(-(1 << 15)), b({0xd1, 0x80, 0x00}));
    EXPECT_EQ(transcoder.packb(std::numeric_limits<std::int32_t>::min()),
              b({0xd2, 0x80, 0x00, 0x00, 0x00}));
    EXPECT_EQ(transcoder.packb(std::numeric_limits<std::int64_t>::min()),
              b({0xd3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

TEST_F(MsgpackTest, StringsUseNarrowestFormat) {
    EXPECT_EQ(transcoder.packb("foo"), pack_string("foo"));
    EXPECT_EQ(transcoder.unpackb(transcoder.packb("foo")), value("foo"));

    std::string s31(31, 'x'), s32(32, 'x'), s256(256, 'x');
    EXPECT_EQ(transcoder.packb(s31)[0], 0xbf);
    EXPECT_EQ(transcoder.packb(s32), pack_string(s32));
    EXPECT_EQ(transcoder.packb(s256), pack_string(s256));
}

TEST_F(MsgpackTest, BytesAreSentAsBinary) {
    binary_type data(127);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<unsigned char>(i * 7);
    }
    binary_type expected = {0xc4, 127};
    expected.insert(expected.end(), data.begin(), data.end());

    EXPECT_EQ(transcoder.packb(data), expected);
    EXPECT_EQ(transcoder.packb(binary_view(data)), expected);
    EXPECT_EQ(transcoder.unpackb(expected), value(data));

    std::string raw = "a ascii value";
    binary_type packed = transcoder.packb(value::from_bytes(raw));
    EXPECT_EQ(packed[0], 0xc4);
    EXPECT_EQ(packed[1], raw.size());

    binary_type big(300, 0xab);
    EXPECT_EQ(transcoder.packb(big)[0], 0xc5);
}

TEST_F(MsgpackTest, EmptyContainers) {
    EXPECT_EQ(transcoder.packb(array_type{}), b({0x90}));
    EXPECT_EQ(transcoder.packb(value::from_range(std::set<int>{})), b({0x90}));
    EXPECT_EQ(transcoder.packb(value::from_range(std::array<int, 0>{})),
              b({0x90}));
    EXPECT_EQ(transcoder.unpackb(b({0x90})), value(array_type{}));
    EXPECT_EQ(transcoder.packb(object_type{}), b({0x80}));
}

TEST_F(MsgpackTest, Maps) {
    EXPECT_EQ(transcoder.packb(object_type{{"one", "two"}}),
              b({0x81, 0xa3, 'o', 'n', 'e', 0xa3, 't', 'w', 'o'}));

    array_type sixteen(16, value(1));
    binary_type packed = transcoder.packb(sixteen);
    EXPECT_EQ(packed[0], 0xdc);
    EXPECT_EQ(packed[1], 0x00);
    EXPECT_EQ(packed[2], 0x10);

    value nested = object_type{{"a", array_type{1, "b", nullptr}},
                               {"c", object_type{{"d", 2.25}}}};
    EXPECT_EQ(transcoder.unpackb(transcoder.packb(nested)), nested);
}

TEST_F(MsgpackTest, UuidsAreSentAsStrings) {
    uuid_type u = boost::uuids::string_generator()(
        "123e4567-e89b-12d3-a456-426614174000");
    binary_type packed = transcoder.packb(u);
    EXPECT_EQ(packed, pack_string("123e4567-e89b-12d3-a456-426614174000"));
    EXPECT_EQ(transcoder.unpackb(packed),
              value("123e4567-e89b-12d3-a456-426614174000"));
}

TEST_F(MsgpackTest, TimestampsAreSentInIsoformat) {
    using namespace std::chrono;
    const sys_time<microseconds> t = sys_days{2024y / 3 / 5} + 13h + 7min +
                                     9s + 250000us;
    EXPECT_EQ(transcoder.packb(timestamp{t, std::nullopt}),
              pack_string("2024-03-05T13:07:09.250000"));
    EXPECT_EQ(transcoder.packb(timestamp{t, minutes(0)}),
              pack_string("2024-03-05T13:07:09.250000+00:00"));
    EXPECT_EQ(transcoder.packb(timestamp{floor<seconds>(t), -330min}),
              pack_string("2024-03-05T13:07:09-05:30"));
}

TEST_F(MsgpackTest, OpaqueObjectsNeedAnAdapter) {
    struct point {
        int x, y;
    };
    value p = opaque::make(point{1, 2});
    EXPECT_THROW(transcoder.packb(p), type_error);

    codec_options opt;
    opt.adapters.push_back([](const opaque& o) -> std::optional<value> {
        if (const point* pt = o.get<point>(); pt) {
            return array_type{pt->x, pt->y};
        }
        return std::nullopt;
    });
    msgpack_transcoder adapted("application/msgpack", opt);
    EXPECT_EQ(adapted.packb(p), b({0x92, 0x01, 0x02}));
    EXPECT_THROW(adapted.packb(opaque::make(std::string("x"))), type_error);
}

TEST_F(MsgpackTest, DecodesAlternativeWidths) {
    EXPECT_EQ(transcoder.unpackb(b({0xd1, 0xff, 0xff})), value(-1));
    EXPECT_EQ(transcoder.unpackb(b({0xcd, 0x00, 0x05})), value(5));
    EXPECT_EQ(transcoder.unpackb(b({0xca, 0x3f, 0xc0, 0x00, 0x00})),
              value(1.5));
    EXPECT_EQ(transcoder.unpackb(b({0xda, 0x00, 0x01, 'z'})), value("z"));
    EXPECT_EQ(transcoder.unpackb(
                  b({0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff})),
              value(std::numeric_limits<std::uint64_t>::max()));
}

TEST_F(MsgpackTest, DecodesTimestampExtension) {
    value v = transcoder.unpackb(b({0xd6, 0xff, 0x00, 0x00, 0x00, 0x3c}));
    const timestamp* ts = v.if_<timestamp>();
    ASSERT_NE(ts, nullptr);
    EXPECT_EQ(ts->isoformat(), "1970-01-01T00:01:00+00:00");
}

TEST_F(MsgpackTest, TimestampExtensionRange) {
    value v = transcoder.unpackb(b({0xc7, 0x0c, 0xff, 0x00, 0x00, 0x00, 0x00,
                                    0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
                                    0xff}));
    const timestamp* ts = v.if_<timestamp>();
    ASSERT_NE(ts, nullptr);
    EXPECT_EQ(ts->isoformat(), "1969-12-31T23:59:59+00:00");

    EXPECT_THROW(transcoder.unpackb(b({0xc7, 0x0c, 0xff, 0x00, 0x00, 0x00,
                                       0x00, 0x7f, 0xff, 0xff, 0xff, 0xff,
                                       0xff, 0xff, 0xff})),
                 decode_error);
    EXPECT_THROW(transcoder.unpackb(b({0xc7, 0x0c, 0xff, 0x00, 0x00, 0x00,
                                       0x00, 0x80, 0x00, 0x00, 0x00, 0x00,
                                       0x00, 0x00, 0x00})),
                 decode_error);
}

TEST_F(MsgpackTest, RejectsMalformedInput) {
    // truncated
    EXPECT_THROW(transcoder.unpackb(b({0xcd, 0x01})), decode_error);
    EXPECT_THROW(transcoder.unpackb(b({0xa3, 'a'})), decode_error);
    EXPECT_THROW(transcoder.unpackb(b({})), decode_error);
    // trailing bytes
    EXPECT_THROW(transcoder.unpackb(b({0xc0, 0xc0})), decode_error);
    // reserved tag
    EXPECT_THROW(transcoder.unpackb(b({0xc1})), decode_error);
    // non-string key
    EXPECT_THROW(transcoder.unpackb(b({0x81, 0x01, 0x02})), decode_error);
    // unknown extension
    EXPECT_THROW(transcoder.unpackb(b({0xd4, 0x05, 0x00})), decode_error);
    // invalid UTF-8 in a string
    EXPECT_THROW(transcoder.unpackb(b({0xa2, 0xc3, 0x28})), decode_error);
    // huge declared length
    EXPECT_THROW(transcoder.unpackb(b({0xdd, 0xff, 0xff, 0xff, 0xff})),
                 decode_error);
}

TEST_F(MsgpackTest, LimitsNesting) {
    codec_options opt;
    opt.max_depth = 3;
    msgpack_transcoder shallow("application/msgpack", opt);
    EXPECT_NO_THROW(shallow.unpackb(b({0x91, 0x91, 0x91, 0xc0})));
    EXPECT_THROW(shallow.unpackb(b({0x91, 0x91, 0x91, 0x91, 0xc0})),
                 decode_error);
}

TEST_F(MsgpackTest, TranscoderInterface) {
    EXPECT_EQ(transcoder.content_type(), "application/msgpack");
    auto [ct, body] = transcoder.to_bytes(object_type{{"hi", "there"}});
    EXPECT_EQ(ct, "application/msgpack");
    EXPECT_EQ(transcoder.from_bytes(body, "utf-8"),
              value(object_type{{"hi", "there"}}));
    EXPECT_THROW(transcoder.from_bytes(b({0xc1})), decode_error);
}

}  // namespace chx::media::test
