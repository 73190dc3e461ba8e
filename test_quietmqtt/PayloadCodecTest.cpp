#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>
#include <quietmqtt/PayloadCodec.hpp>

using quietmqtt::PayloadCodec;
using quietmqtt::SerializationMode;
using quietmqtt::Value;

namespace
{
    std::string text(const std::vector<uint8_t> &bytes)
    {
        return std::string(bytes.begin(), bytes.end());
    }

    std::vector<uint8_t> bytes(const std::string &s)
    {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    Json::Value sampleObject()
    {
        Json::Value object(Json::objectValue);
        object["a"] = 1;
        object["name"] = "led";
        object["on"] = true;
        Json::Value list(Json::arrayValue);
        list.append(1);
        list.append("two");
        list.append(Json::nullValue);
        object["list"] = list;
        return object;
    }
}

// ============================================================================
// AUTO
// ============================================================================

TEST(PayloadCodecTest, AutoEncodesNumbersAsPlainText)
{
    EXPECT_EQ("42", text(PayloadCodec::encode(Value(42), SerializationMode::AUTO)));
    EXPECT_EQ("-7", text(PayloadCodec::encode(Value(static_cast<int64_t>(-7)))));
    EXPECT_EQ("1.5", text(PayloadCodec::encode(Value(1.5))));
}

TEST(PayloadCodecTest, AutoEncodesBooleansAsPlainText)
{
    EXPECT_EQ("true", text(PayloadCodec::encode(Value(true))));
    EXPECT_EQ("false", text(PayloadCodec::encode(Value(false))));
}

TEST(PayloadCodecTest, AutoPassesStringsThroughUnquoted)
{
    EXPECT_EQ("hello", text(PayloadCodec::encode(Value("hello"))));
    EXPECT_EQ("{not json", text(PayloadCodec::encode(Value(std::string("{not json")))));
}

TEST(PayloadCodecTest, AutoSerializesStructuredValues)
{
    Json::Value object(Json::objectValue);
    object["a"] = 1;
    EXPECT_EQ("{\"a\":1}", text(PayloadCodec::encode(Value(object))));

    Json::Value list(Json::arrayValue);
    list.append(1);
    list.append(2);
    EXPECT_EQ("[1,2]", text(PayloadCodec::encode(Value(list))));

    EXPECT_EQ("null", text(PayloadCodec::encode(Value())));
}

TEST(PayloadCodecTest, AutoPassesBinaryThrough)
{
    std::vector<uint8_t> raw = {0x00, 0xff, 0x10, 0x7b};
    EXPECT_EQ(raw, PayloadCodec::encode(Value(raw), SerializationMode::AUTO));
}

TEST(PayloadCodecTest, AutoDecodeParsesJson)
{
    Json::Value decoded = PayloadCodec::decode(bytes("{\"a\":1}"));
    ASSERT_TRUE(decoded.isObject());
    EXPECT_EQ(1, decoded["a"].asInt());

    Json::Value number = PayloadCodec::decode(bytes("42"));
    ASSERT_TRUE(number.isNumeric());
    EXPECT_EQ(42, number.asInt());
}

TEST(PayloadCodecTest, AutoDecodeFallsBackToText)
{
    Json::Value decoded = PayloadCodec::decode(bytes("hello world"));
    ASSERT_TRUE(decoded.isString());
    EXPECT_EQ("hello world", decoded.asString());

    Json::Value trailing = PayloadCodec::decode(bytes("42abc"));
    ASSERT_TRUE(trailing.isString());
    EXPECT_EQ("42abc", trailing.asString());

    Json::Value empty = PayloadCodec::decode(std::vector<uint8_t>());
    ASSERT_TRUE(empty.isString());
    EXPECT_EQ("", empty.asString());
}

TEST(PayloadCodecTest, AutoDecodeRejectsComments)
{
    Json::Value decoded = PayloadCodec::decode(bytes("// note\n{\"a\":1}"));
    EXPECT_TRUE(decoded.isString());
}

TEST(PayloadCodecTest, AutoRoundTripsStructuredValues)
{
    Json::Value object = sampleObject();
    auto wire = PayloadCodec::encode(Value(object), SerializationMode::AUTO);
    EXPECT_EQ(object, PayloadCodec::decode(wire, SerializationMode::AUTO));
}

// ============================================================================
// STRING
// ============================================================================

TEST(PayloadCodecTest, StringModeUsesPlaceholderForObjects)
{
    Json::Value object(Json::objectValue);
    object["a"] = 1;
    std::vector<uint8_t> wire;
    EXPECT_NO_THROW(wire = PayloadCodec::encode(Value(object), SerializationMode::STRING));
    EXPECT_EQ(PayloadCodec::OBJECT_PLACEHOLDER, text(wire));
    EXPECT_NE("{\"a\":1}", text(wire));
}

TEST(PayloadCodecTest, StringModeJoinsArrays)
{
    Json::Value list(Json::arrayValue);
    list.append(1);
    list.append("b");
    list.append(Json::nullValue);
    list.append(Json::Value(Json::objectValue));
    EXPECT_EQ("1,b,,[object Object]", text(PayloadCodec::encode(Value(list), SerializationMode::STRING)));
}

TEST(PayloadCodecTest, StringModeEncodesScalarsAsText)
{
    EXPECT_EQ("42", text(PayloadCodec::encode(Value(42), SerializationMode::STRING)));
    EXPECT_EQ("true", text(PayloadCodec::encode(Value(true), SerializationMode::STRING)));
    EXPECT_EQ("hi", text(PayloadCodec::encode(Value("hi"), SerializationMode::STRING)));
    EXPECT_EQ("null", text(PayloadCodec::encode(Value(), SerializationMode::STRING)));
}

TEST(PayloadCodecTest, StringModeNeverParses)
{
    Json::Value decoded = PayloadCodec::decode(bytes("{\"a\":1}"), SerializationMode::STRING);
    ASSERT_TRUE(decoded.isString());
    EXPECT_EQ("{\"a\":1}", decoded.asString());

    Json::Value number = PayloadCodec::decode(bytes("42"), SerializationMode::STRING);
    ASSERT_TRUE(number.isString());
    EXPECT_EQ("42", number.asString());
}

// ============================================================================
// JSON
// ============================================================================

TEST(PayloadCodecTest, JsonModeSerializesEverything)
{
    EXPECT_EQ("42", text(PayloadCodec::encode(Value(42), SerializationMode::JSON)));
    EXPECT_EQ("true", text(PayloadCodec::encode(Value(true), SerializationMode::JSON)));
    EXPECT_EQ("\"hi\"", text(PayloadCodec::encode(Value("hi"), SerializationMode::JSON)));
    EXPECT_EQ("\"say \\\"hi\\\"\"", text(PayloadCodec::encode(Value("say \"hi\""), SerializationMode::JSON)));
}

TEST(PayloadCodecTest, JsonModeNumberMatchesStructuredSerialization)
{
    auto wire = PayloadCodec::encode(Value(42), SerializationMode::JSON);
    EXPECT_EQ(PayloadCodec::toJson(Json::Value(42)), text(wire));

    Json::Value decoded = PayloadCodec::decode(wire, SerializationMode::JSON);
    ASSERT_TRUE(decoded.isNumeric());
    EXPECT_EQ(42, decoded.asInt());
}

TEST(PayloadCodecTest, JsonModeDoubleEncodesBinary)
{
    std::vector<uint8_t> raw = bytes("{\"a\":1}");
    auto wire = PayloadCodec::encode(Value(raw), SerializationMode::JSON);
    EXPECT_EQ("\"{\\\"a\\\":1}\"", text(wire));

    Json::Value decoded = PayloadCodec::decode(wire, SerializationMode::JSON);
    ASSERT_TRUE(decoded.isString());
    EXPECT_EQ("{\"a\":1}", decoded.asString());
}

TEST(PayloadCodecTest, JsonModeRoundTripsStrings)
{
    const std::string original = "plain text, not JSON";
    auto wire = PayloadCodec::encode(Value(original), SerializationMode::JSON);
    Json::Value decoded = PayloadCodec::decode(wire, SerializationMode::JSON);
    ASSERT_TRUE(decoded.isString());
    EXPECT_EQ(original, decoded.asString());
}

TEST(PayloadCodecTest, JsonModeDecodeFallsBackToText)
{
    Json::Value decoded = PayloadCodec::decode(bytes("not json"), SerializationMode::JSON);
    ASSERT_TRUE(decoded.isString());
    EXPECT_EQ("not json", decoded.asString());
}

TEST(PayloadCodecTest, EncodingIsDeterministic)
{
    Json::Value object = sampleObject();
    for (auto mode : {SerializationMode::AUTO, SerializationMode::STRING, SerializationMode::JSON})
    {
        EXPECT_EQ(PayloadCodec::encode(Value(object), mode), PayloadCodec::encode(Value(object), mode))
            << quietmqtt::toString(mode);
    }
}

// ============================================================================
// Hostile and edge-case input
// ============================================================================

TEST(PayloadCodecTest, DeeplyNestedPayloadFallsBackToText)
{
    const std::string nested(2000, '[');
    Json::Value decoded;
    EXPECT_NO_THROW(decoded = PayloadCodec::decode(bytes(nested)));
    ASSERT_TRUE(decoded.isString());
    EXPECT_EQ(nested, decoded.asString());

    Json::Value parsed;
    EXPECT_FALSE(PayloadCodec::parseJson(nested, parsed));
}

TEST(PayloadCodecTest, FractionsUseShortestForm)
{
    Json::Value list(Json::arrayValue);
    list.append(0.1);
    list.append(2.5);
    EXPECT_EQ("[0.1,2.5]", text(PayloadCodec::encode(Value(list), SerializationMode::AUTO)));
    EXPECT_EQ("0.1", text(PayloadCodec::encode(Value(0.1), SerializationMode::JSON)));
    EXPECT_EQ("0.1", text(PayloadCodec::encode(Value(0.1), SerializationMode::AUTO)));

    Json::Value object(Json::objectValue);
    object["t"] = 21.3;
    EXPECT_EQ("{\"t\":21.3}", PayloadCodec::toJson(object));
}

TEST(PayloadCodecTest, NonFiniteNumbersSerializeAsNull)
{
    Json::Value list(Json::arrayValue);
    list.append(std::numeric_limits<double>::infinity());
    EXPECT_EQ("[null]", PayloadCodec::toJson(list));
}
