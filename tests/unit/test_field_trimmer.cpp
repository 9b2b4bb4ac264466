#include <gtest/gtest.h>
#include <libtextkit/logger.hpp>
#include <libtextkit/serde/decoder.hpp>
#include <libtextkit/serde/trim.hpp>
#include <optional>
#include <string>
#include <type_traits>

using namespace textkit::serde;

namespace {

struct StringData {
    std::string string;

    static auto decode(const Json::Value& json) -> StringData {
        ObjectDecoder object(json);
        return {object.field("string", trim_string)};
    }
};

struct MaybeStringData {
    std::optional<std::string> maybe_string;

    static auto decode(const Json::Value& json) -> MaybeStringData {
        ObjectDecoder object(json);
        return {object.field("maybe_string", trim_optional_string)};
    }
};

auto expect_decode_error(DecodeErrorKind kind, auto&& action) -> std::string {
    try {
        action();
    } catch (const DecodeError& error) {
        EXPECT_EQ(error.kind(), kind);
        return error.what();
    }
    ADD_FAILURE() << "expected DecodeError";
    return {};
}

} // namespace

TEST(TrimStringTest, TrimsBothEnds) {
    EXPECT_EQ(trim_string(Json::Value("   Hello, World!   ")), "Hello, World!");
    EXPECT_EQ(trim_string(Json::Value("\t text\n")), "text");
    EXPECT_EQ(trim_string(Json::Value("   ")), "");
}

TEST(TrimStringTest, DecodesStructField) {
    auto data = StringData::decode(parse_document(R"({ "string": "    Hello, World!" })"));
    EXPECT_EQ(data.string, "Hello, World!");
}

TEST(TrimStringTest, NonStringIsTypeMismatch) {
    auto message = expect_decode_error(DecodeErrorKind::TypeMismatch,
                                       [] { (void)trim_string(Json::Value(42)); });
    EXPECT_NE(message.find("expected string, found number"), std::string::npos);

    expect_decode_error(DecodeErrorKind::TypeMismatch,
                        [] { (void)trim_string(Json::Value(Json::arrayValue)); });
}

TEST(TrimStringTest, MissingFieldPropagatesDecoderError) {
    auto message = expect_decode_error(DecodeErrorKind::TypeMismatch, [] {
        (void)StringData::decode(parse_document(R"({ "other": "x" })"));
    });
    EXPECT_NE(message.find("found null"), std::string::npos);
}

TEST(TrimOptionalStringTest, PresentValueIsTrimmed) {
    EXPECT_EQ(trim_optional_string(Json::Value("  text  ")), std::optional<std::string>("text"));
}

TEST(TrimOptionalStringTest, AllWhitespaceBecomesAbsent) {
    EXPECT_FALSE(trim_optional_string(Json::Value("   ")).has_value());
    EXPECT_FALSE(trim_optional_string(Json::Value("")).has_value());
    EXPECT_FALSE(trim_optional_string(Json::Value("\xE3\x80\x80\t")).has_value());
}

TEST(TrimOptionalStringTest, NullIsAbsent) {
    EXPECT_FALSE(trim_optional_string(Json::Value()).has_value());
}

TEST(TrimOptionalStringTest, DecodesStructField) {
    auto present = MaybeStringData::decode(
        parse_document(R"({ "maybe_string": "    Hello, World!" })"));
    ASSERT_TRUE(present.maybe_string.has_value());
    EXPECT_EQ(*present.maybe_string, "Hello, World!");

    auto blank = MaybeStringData::decode(parse_document(R"({ "maybe_string": "  " })"));
    EXPECT_FALSE(blank.maybe_string.has_value());

    auto null = MaybeStringData::decode(parse_document(R"({ "maybe_string": null })"));
    EXPECT_FALSE(null.maybe_string.has_value());

    auto missing = MaybeStringData::decode(parse_document("{}"));
    EXPECT_FALSE(missing.maybe_string.has_value());
}

TEST(TrimOptionalStringTest, NonStringIsTypeMismatch) {
    auto message = expect_decode_error(DecodeErrorKind::TypeMismatch,
                                       [] { (void)trim_optional_string(Json::Value(true)); });
    EXPECT_NE(message.find("found boolean"), std::string::npos);
}

TEST(DecoderTest, ParseDocument) {
    auto root = parse_document(R"({"a": "b", "n": 1})");
    ASSERT_TRUE(root.isObject());
    EXPECT_EQ(decode_string(root["a"]), "b");
}

TEST(DecoderTest, MalformedDocument) {
    expect_decode_error(DecodeErrorKind::Malformed, [] { (void)parse_document("{"); });
    expect_decode_error(DecodeErrorKind::Malformed, [] { (void)parse_document(""); });
    expect_decode_error(DecodeErrorKind::Malformed,
                        [] { (void)parse_document(R"({"a": "b"} extra)"); });
    expect_decode_error(DecodeErrorKind::Malformed,
                        [] { (void)parse_document("// comment\n{}"); });
}

// The reader throws past its nesting limit; that still surfaces as Malformed
TEST(DecoderTest, DeeplyNestedDocumentIsMalformed) {
    const std::string nested = std::string(2000, '[') + std::string(2000, ']');
    auto message = expect_decode_error(DecodeErrorKind::Malformed,
                                       [&] { (void)parse_document(nested); });
    EXPECT_EQ(message.rfind("malformed JSON: ", 0), 0U);
}

TEST(DecoderTest, DecodeOptionalString) {
    EXPECT_FALSE(decode_optional_string(Json::Value()).has_value());
    EXPECT_EQ(decode_optional_string(Json::Value("  x ")), std::optional<std::string>("  x "));
    expect_decode_error(DecodeErrorKind::TypeMismatch,
                        [] { (void)decode_optional_string(Json::Value(1.5)); });
}

TEST(DecoderTest, ObjectDecoderRequiresObject) {
    auto message = expect_decode_error(DecodeErrorKind::TypeMismatch, [] {
        auto root = parse_document("[1, 2]");
        ObjectDecoder object(root);
    });
    EXPECT_NE(message.find("expected object, found array"), std::string::npos);
}

// Binding a decoder to a temporary document would leave it dangling
TEST(DecoderTest, ObjectDecoderRejectsTemporaries) {
    static_assert(std::is_constructible_v<ObjectDecoder, const Json::Value&>);
    static_assert(std::is_constructible_v<ObjectDecoder, Json::Value&>);
    static_assert(!std::is_constructible_v<ObjectDecoder, Json::Value&&>);
    static_assert(!std::is_constructible_v<ObjectDecoder, Json::Value>);
}

TEST(DecoderTest, ObjectDecoderFieldAccess) {
    auto root = parse_document(R"({"present": " v ", "nothing": null})");
    ObjectDecoder object(root);

    EXPECT_TRUE(object.has_field("present"));
    EXPECT_TRUE(object.has_field("nothing"));
    EXPECT_FALSE(object.has_field("absent"));
    EXPECT_TRUE(object.raw("absent").isNull());

    EXPECT_EQ(object.field("present", decode_string), " v ");
    EXPECT_EQ(object.field("present", [](const Json::Value& value) {
        return decode_string(value).size();
    }), 3U);
}

TEST(DecoderTest, TypeNames) {
    EXPECT_STREQ(type_name(Json::Value()), "null");
    EXPECT_STREQ(type_name(Json::Value(1U)), "number");
    EXPECT_STREQ(type_name(Json::Value("s")), "string");
    EXPECT_STREQ(type_name(Json::Value(Json::objectValue)), "object");
}

#if ENABLE_TRACE_LOGS
TEST(TrimOptionalStringTest, CollapseIsTraced) {
    auto& logger = textkit::Logger::instance();
    const auto previous = logger.get_level();
    logger.set_level(textkit::LogLevel::TRACE);

    testing::internal::CaptureStdout();
    EXPECT_FALSE(trim_optional_string(Json::Value("    ")).has_value());
    std::string output = testing::internal::GetCapturedStdout();
    logger.set_level(previous);

    EXPECT_NE(output.find("trim_optional_string: 4 whitespace bytes dropped"), std::string::npos);
}
#endif
