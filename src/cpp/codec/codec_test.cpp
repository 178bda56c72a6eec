#include "value_codec.hpp"
#include <gtest/gtest.h>

namespace cachex {

namespace {

CodecConfig codec_config(std::vector<std::string> serializers, std::vector<std::string> compressors = {}) {
    CodecConfig cfg;
    cfg.serializers = std::move(serializers);
    cfg.compressors = std::move(compressors);
    return cfg;
}

std::string big_text() {
    std::string s;
    for (int i = 0; i < 200; i++) s += "payload-" + std::to_string(i % 7) + ";";
    return s;
}

} // namespace

TEST(ValueCodecTest, IntegersAreDecimalText) {
    ValueCodec codec(codec_config({"json"}));
    EXPECT_EQ(codec.encode(Value(42)), "42");
    EXPECT_EQ(codec.encode(Value(-7)), "-7");
    EXPECT_EQ(codec.decode("42"), Value(42));
    EXPECT_TRUE(codec.decode("42").is_number_integer());
}

TEST(ValueCodecTest, KindsSurvive) {
    ValueCodec codec(codec_config({"json"}));
    for (const Value& v : {Value(true), Value(1.5), Value("42"), Value::array({1, "a"}),
                           Value::object({{"k", 2}}), Value(nullptr)}) {
        Value back = codec.decode(codec.encode(v));
        EXPECT_EQ(back, v) << v.dump();
        EXPECT_EQ(back.type(), v.type()) << v.dump();
    }
}

TEST(ValueCodecTest, BoolIsNotAnInteger) {
    ValueCodec codec(codec_config({"json"}));
    EXPECT_EQ(codec.encode(Value(true)), "true");
    EXPECT_TRUE(codec.decode("true").is_boolean());
}

TEST(ValueCodecTest, ParseIntIsStrict) {
    EXPECT_EQ(ValueCodec::parse_int("+5"), 5);
    EXPECT_EQ(ValueCodec::parse_int("-12"), -12);
    EXPECT_FALSE(ValueCodec::parse_int(""));
    EXPECT_FALSE(ValueCodec::parse_int("+"));
    EXPECT_FALSE(ValueCodec::parse_int("1.0"));
    EXPECT_FALSE(ValueCodec::parse_int(" 1"));
    EXPECT_FALSE(ValueCodec::parse_int("99999999999999999999"));
}

TEST(ValueCodecTest, SerializerFallbackChain) {
    ValueCodec writer(codec_config({"msgpack"}));
    ValueCodec reader(codec_config({"json", "msgpack"}));
    Value v = Value::object({{"name", "cachex"}, {"n", 3}});
    EXPECT_EQ(reader.decode(writer.encode(v)), v);
}

TEST(ValueCodecTest, UndecodableBytesThrow) {
    ValueCodec codec(codec_config({"json"}));
    EXPECT_THROW((void)codec.decode("{not json"), SerializerError);
}

TEST(ValueCodecTest, UnknownNamesAreConfigErrors) {
    EXPECT_THROW(ValueCodec(codec_config({"pickle"})), ConfigError);
    EXPECT_THROW(ValueCodec(codec_config({"json"}, {"brotli"})), ConfigError);
    EXPECT_THROW(ValueCodec(codec_config({})), ConfigError);
}

TEST(ValueCodecTest, CompressedPayloadsDecode) {
    Value v(big_text());
    for (const char* name : {"zlib", "gzip", "lzma"}) {
        ValueCodec codec(codec_config({"json"}, {name}));
        std::string bytes = codec.encode(v);
        EXPECT_LT(bytes.size(), v.get<std::string>().size()) << name;
        EXPECT_EQ(codec.decode(bytes), v) << name;
    }
}

TEST(ValueCodecTest, ShortPayloadsStayUncompressed) {
    ValueCodec codec(codec_config({"json"}, {"zlib"}));
    EXPECT_EQ(codec.encode(Value("short")), "\"short\"");
    EXPECT_EQ(codec.decode("\"short\""), Value("short"));
}

TEST(ValueCodecTest, DecompressionTriesEachCompressor) {
    ValueCodec gzip_writer(codec_config({"json"}, {"gzip"}));
    ValueCodec reader(codec_config({"json"}, {"zlib", "lzma", "gzip"}));
    Value v(big_text());
    EXPECT_EQ(reader.decode(gzip_writer.encode(v)), v);
}

TEST(CompressorTest, MinLengthBoundary) {
    CodecConfig cfg;
    cfg.min_length = 8;
    auto z = make_compressor("zlib", cfg);
    EXPECT_EQ(z->compress("12345678"), "12345678");
    EXPECT_NE(z->compress("123456789"), "123456789");
    EXPECT_EQ(z->decompress(z->compress("123456789")), "123456789");
}

TEST(CompressorTest, ForeignInputThrows) {
    CodecConfig cfg;
    EXPECT_THROW((void)make_compressor("zlib", cfg)->decompress("plain text"), CompressorError);
    EXPECT_THROW((void)make_compressor("gzip", cfg)->decompress("plain text"), CompressorError);
    EXPECT_THROW((void)make_compressor("lzma", cfg)->decompress("plain text"), CompressorError);
    EXPECT_EQ(make_compressor("identity", cfg)->decompress("plain text"), "plain text");
}

} // namespace cachex
