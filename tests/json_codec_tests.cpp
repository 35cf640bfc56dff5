#include <gtest/gtest.h>

#include "sandbox/json_codec.hpp"

using scriptbox::sandbox::JsonCodec;
using scriptbox::sandbox::JsonCodecOptions;
using scriptbox::sandbox::NormalizeSingleQuotes;

TEST(JsonCodec, ParsesSingleQuotedLiterals) {
    JsonCodec codec;
    const auto value = codec.Parse("{'returnResult': 'hi', 'traceback': ['a', \"b\"]}");
    EXPECT_EQ("hi", value["returnResult"].get<std::string>());
    EXPECT_EQ(2u, value["traceback"].size());
    EXPECT_EQ("b", value["traceback"][1].get<std::string>());
}

TEST(JsonCodec, NormalizationLeavesDoubleQuotedApostrophesAlone) {
    EXPECT_EQ(R"({"msg": "it's"})", NormalizeSingleQuotes(R"({"msg": "it's"})"));
}

TEST(JsonCodec, NormalizationEscapesEmbeddedDoubleQuotes) {
    JsonCodec codec;
    const auto value = codec.Parse(R"({'frame': 'File "/tmp/x.py", line 3', 'q': 'don\'t'})");
    EXPECT_EQ("File \"/tmp/x.py\", line 3", value["frame"].get<std::string>());
    EXPECT_EQ("don't", value["q"].get<std::string>());
}

TEST(JsonCodec, StrictModeRejectsSingleQuotes) {
    JsonCodecOptions options;
    options.allow_single_quotes = false;
    JsonCodec codec(options);
    EXPECT_THROW(codec.Parse("{'a': 1}"), nlohmann::json::parse_error);
}

TEST(JsonCodec, SerializesOnOneLine) {
    JsonCodec codec;
    const auto text = codec.Serialize({{"script", "line1\nline2"}, {"n", 1}});
    EXPECT_EQ(std::string::npos, text.find('\n'));
    EXPECT_EQ("line1\nline2", codec.Parse(text)["script"].get<std::string>());
}

TEST(JsonCodec, SharedCodecIsASingleInstance) {
    EXPECT_EQ(scriptbox::sandbox::SharedJsonCodec().get(), scriptbox::sandbox::SharedJsonCodec().get());
}
