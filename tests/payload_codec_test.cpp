#include "kvsession/errors.hpp"
#include "kvsession/payload_codec.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace kvsession;

TEST(PayloadCodecTest, MixedValuesRoundTripWithTypes)
    {
    Session session;
    session.set("name", "alice");
    session.set("user_id", 42);
    session.set("admin", false);
    session.set("ratio", 0.1);
    session.set("cleared", nullptr);

    Session::Data decoded = decode_payload(encode_payload(session.data()));
    EXPECT_EQ(decoded, session.data());
    }

TEST(PayloadCodecTest, StringsThatLookLikeOtherTypesStayStrings)
    {
    Session session;
    session.set("a", "true");
    session.set("b", "42");
    session.set("c", "~");
    session.set("d", "");
    session.set("e", "null");
    session.set("f", "line one\nline two: \"quoted\"");
    session.set("g", "caf\xc3\xa9");

    Session::Data decoded = decode_payload(encode_payload(session.data()));
    EXPECT_EQ(decoded, session.data());
    }

TEST(PayloadCodecTest, AwkwardKeysRoundTrip)
    {
    Session session;
    session.set("", 1);
    session.set("with space", 2);
    session.set("- dash", 3);
    session.set("colon: here", 4);

    EXPECT_EQ(decode_payload(encode_payload(session.data())), session.data());
    }

TEST(PayloadCodecTest, NumericExtremes)
    {
    Session session;
    session.set("min", std::numeric_limits<std::int64_t>::min());
    session.set("max", std::numeric_limits<std::int64_t>::max());
    session.set("tiny", std::numeric_limits<double>::min());
    session.set("big", 1.7976931348623157e308);
    session.set("inf", std::numeric_limits<double>::infinity());
    session.set("ninf", -std::numeric_limits<double>::infinity());

    EXPECT_EQ(decode_payload(encode_payload(session.data())), session.data());
    }

TEST(PayloadCodecTest, NanSurvives)
    {
    Session session;
    session.set("nan", std::numeric_limits<double>::quiet_NaN());

    Session::Data decoded = decode_payload(encode_payload(session.data()));
    ASSERT_TRUE(std::holds_alternative<double>(decoded.at("nan")));
    EXPECT_TRUE(std::isnan(std::get<double>(decoded.at("nan"))));
    }

TEST(PayloadCodecTest, EmptyInputsDecodeToEmptyMapping)
    {
    EXPECT_TRUE(decode_payload("").empty());
    EXPECT_TRUE(decode_payload("{}").empty());
    EXPECT_TRUE(decode_payload(encode_payload({})).empty());
    }

TEST(PayloadCodecTest, MalformedPayloadsThrow)
    {
    EXPECT_THROW(decode_payload("- a\n- b\n"), PayloadError);
    EXPECT_THROW(decode_payload("just a string"), PayloadError);
    EXPECT_THROW(decode_payload("{unclosed: "), PayloadError);
    EXPECT_THROW(decode_payload("k: [1, 2]"), PayloadError);
    EXPECT_THROW(decode_payload("k: plain"), PayloadError);
    EXPECT_THROW(decode_payload("k: !date 2020-01-01"), PayloadError);
    EXPECT_THROW(decode_payload("k: !int forty"), PayloadError);
    EXPECT_THROW(decode_payload("k: !bool yes"), PayloadError);
    EXPECT_THROW(decode_payload("k: !float 1.5x"), PayloadError);
    }

TEST(PayloadCodecTest, HandWrittenPayloadDecodes)
    {
    Session::Data decoded = decode_payload(
        "user: !str bob\n"
        "visits: !int 7\n"
        "ok: !bool true\n"
        "avg: !float 1.5\n"
        "gone: !null ''\n");

    ASSERT_EQ(decoded.size(), 5u);
    EXPECT_EQ(std::get<std::string>(decoded.at("user")), "bob");
    EXPECT_EQ(std::get<std::int64_t>(decoded.at("visits")), 7);
    EXPECT_TRUE(std::get<bool>(decoded.at("ok")));
    EXPECT_EQ(std::get<double>(decoded.at("avg")), 1.5);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(decoded.at("gone")));
    }

TEST(PayloadCodecTest, NonUtf8StringsKeepTheirBytes)
    {
    Session session;
    session.set("bin", std::string("\xff\xfe\x80", 3));
    session.set("overlong", std::string("\xc0\x80", 2));
    session.set("surrogate", std::string("\xed\xa0\x80", 3));
    session.set("nonchar", std::string("\xef\xbf\xbf", 3));
    session.set("truncated", std::string("ok\xe2\x82", 4));
    session.set("nul", std::string("a\0b", 3));
    session.set("utf8", "caf\xc3\xa9");

    std::string payload = encode_payload(session.data());
    EXPECT_NE(payload.find("!bytes"), std::string::npos);

    Session::Data decoded = decode_payload(payload);
    EXPECT_EQ(decoded, session.data());
    EXPECT_EQ(std::get<std::string>(decoded.at("bin")), std::string("\xff\xfe\x80", 3));
    }

TEST(PayloadCodecTest, ValidUtf8StaysReadable)
    {
    Session session;
    session.set("name", "caf\xc3\xa9");

    std::string payload = encode_payload(session.data());
    EXPECT_EQ(payload.find("!bytes"), std::string::npos);
    EXPECT_NE(payload.find("!str"), std::string::npos);
    }

TEST(PayloadCodecTest, HandWrittenBytesDecode)
    {
    Session::Data decoded = decode_payload("raw: !bytes \"/w==\"\nnone: !bytes \"\"\n");
    EXPECT_EQ(std::get<std::string>(decoded.at("raw")), std::string("\xff", 1));
    EXPECT_EQ(std::get<std::string>(decoded.at("none")), "");

    EXPECT_THROW(decode_payload("raw: !bytes \"@@@@\""), PayloadError);
    }

TEST(PayloadCodecTest, NonUtf8KeyIsRejected)
    {
    Session session;
    session.set(std::string("\xff", 1), 1);
    EXPECT_THROW(encode_payload(session.data()), PayloadError);
    }
